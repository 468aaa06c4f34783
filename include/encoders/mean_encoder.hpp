#ifndef _SEQ_TAGGER_MEAN_ENCODER
#define _SEQ_TAGGER_MEAN_ENCODER

#include "encoders/encoder.hpp"


namespace seqtag{
    namespace encoders{

// outputs are the inputs, the state is the length masked mean over time
class meanEncoder : public encoder{
public:
    meanEncoder();
    ~meanEncoder();

    void initialize(int64_t input_depth) override;
    encoderOutput encode(const torch::Tensor& inputs,
                         const torch::Tensor& sequence_length,
                         modeKey mode) override;
    int64_t output_depth() const override {return depth_;}

private:
    int64_t depth_ = 0;
};

    } // namespace encoders
} // namespace seqtag


#endif // _SEQ_TAGGER_MEAN_ENCODER
