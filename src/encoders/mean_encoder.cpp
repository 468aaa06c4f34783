#include "encoders/mean_encoder.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <stdexcept>


namespace seqtag{
    namespace encoders{

meanEncoder::meanEncoder(){
    DLOG(INFO) << "[meanEncoder/constructor]: instance created";
}


meanEncoder::~meanEncoder(){}


void meanEncoder::initialize(int64_t input_depth){
    if (input_depth <= 0){
        throw std::invalid_argument("input depth must be positive");
    }
    depth_ = input_depth;
}


encoderOutput meanEncoder::encode(const torch::Tensor& inputs,
                                  const torch::Tensor& sequence_length,
                                  modeKey mode){
    if (inputs.dim() != 3){
        throw std::invalid_argument("meanEncoder expects [batch, time, depth] inputs");
    }
    auto mask = myutils::sequence_mask(sequence_length, inputs.size(1), inputs.scalar_type());
    auto summed = (inputs * mask.unsqueeze(2)).sum(1);
    auto denominator = mask.sum(1, /*keepdim=*/true).clamp_min(1.0);

    encoderOutput output;
    output.outputs = inputs;
    output.state = summed / denominator;
    output.sequence_length = sequence_length;
    VLOG(3) << "[meanEncoder/encode]: " << mode_name(mode) << " " << inputs.sizes();
    return output;
}

    } // namespace encoders
} // namespace seqtag
