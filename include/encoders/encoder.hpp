#ifndef _SEQ_TAGGER_ENCODER
#define _SEQ_TAGGER_ENCODER

#include <torch/torch.h>
#include "utils/tensor_types.hpp"


namespace seqtag{
    namespace encoders{

struct encoderOutput{
    torch::Tensor outputs;          // [B, T, output_depth()]
    torch::Tensor state;            // encoder specific summary, may be undefined
    torch::Tensor sequence_length;  // [B]
};


// maps [B, T, D] inputs to per timestep representations
class encoder : public torch::nn::Module{
public:
    virtual ~encoder() = default;

    // creates the parameters once the input depth is known
    virtual void initialize(int64_t input_depth) = 0;

    virtual encoderOutput encode(const torch::Tensor& inputs,
                                 const torch::Tensor& sequence_length,
                                 modeKey mode) = 0;

    virtual int64_t output_depth() const = 0;
};

    } // namespace encoders
} // namespace seqtag


#endif // _SEQ_TAGGER_ENCODER
