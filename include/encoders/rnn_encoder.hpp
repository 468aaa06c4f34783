#ifndef _SEQ_TAGGER_RNN_ENCODER
#define _SEQ_TAGGER_RNN_ENCODER

#include <torch/torch.h>
#include "encoders/encoder.hpp"


namespace seqtag{
    namespace encoders{

struct rnnEncoderOptions{
    int64_t num_layers = 1;
    int64_t num_units = 128;
    bool bidirectional = true;  // forward and backward outputs are concatenated, num_units / 2 each
    double dropout = 0.0;       // between layers, training mode only

    void set_num_layers(int64_t new_num_layers){num_layers = new_num_layers;}
    void set_num_units(int64_t new_num_units){num_units = new_num_units;}
    void set_bidirectional(bool new_bidirectional){bidirectional = new_bidirectional;}
    void set_dropout(double new_dropout){dropout = new_dropout;}
};


// multi layer LSTM run over packed sequences, so padding never leaks into the states
class rnnEncoder : public encoder{
public:
    explicit rnnEncoder(rnnEncoderOptions options);
    ~rnnEncoder();

    void initialize(int64_t input_depth) override;
    encoderOutput encode(const torch::Tensor& inputs,
                         const torch::Tensor& sequence_length,
                         modeKey mode) override;
    int64_t output_depth() const override {return options_.num_units;}

    const rnnEncoderOptions& get_options() const {return options_;}

private:
    int64_t units_per_direction() const;

private:
    rnnEncoderOptions options_;
    torch::nn::LSTM lstm_{nullptr};
};

    } // namespace encoders
} // namespace seqtag


#endif // _SEQ_TAGGER_RNN_ENCODER
