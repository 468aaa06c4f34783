#include "encoders/rnn_encoder.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <stdexcept>


namespace seqtag{
    namespace encoders{

rnnEncoder::rnnEncoder(rnnEncoderOptions options) : options_(options){
    if (options_.num_layers < 1 || options_.num_units < 1){
        throw std::invalid_argument("rnnEncoder needs at least one layer and one unit");
    }
    if (options_.bidirectional && options_.num_units % 2 != 0){
        throw std::invalid_argument("bidirectional rnnEncoder needs an even number of units");
    }
    DLOG(INFO) << "[rnnEncoder/constructor]: instance created";
}


rnnEncoder::~rnnEncoder(){}


int64_t rnnEncoder::units_per_direction() const {
    return options_.bidirectional ? options_.num_units / 2 : options_.num_units;
}


void rnnEncoder::initialize(int64_t input_depth){
    if (!lstm_.is_empty()){
        throw std::logic_error("rnnEncoder is already initialized");
    }
    auto lstm_options = torch::nn::LSTMOptions(input_depth, units_per_direction())
                            .num_layers(options_.num_layers)
                            .batch_first(true)
                            .bidirectional(options_.bidirectional)
                            .dropout(options_.num_layers > 1 ? options_.dropout : 0.0);
    lstm_ = register_module("lstm", torch::nn::LSTM(lstm_options));
    LOG(INFO) << "[rnnEncoder/initialize]: " << options_.num_layers << " layer(s), "
              << units_per_direction() << " units per direction, bidirectional: "
              << std::boolalpha << options_.bidirectional;
}


encoderOutput rnnEncoder::encode(const torch::Tensor& inputs,
                                 const torch::Tensor& sequence_length,
                                 modeKey mode){
    if (lstm_.is_empty()){
        throw std::logic_error("rnnEncoder is not initialized");
    }
    if (inputs.dim() != 3){
        throw std::invalid_argument("rnnEncoder expects [batch, time, depth] inputs");
    }

    encoderOutput output;
    output.sequence_length = sequence_length;
    int64_t max_time = inputs.size(1);
    if (max_time == 0){
        output.outputs = torch::zeros({inputs.size(0), 0, output_depth()}, inputs.options());
        return output;
    }

    // packing rejects empty sequences, their outputs are masked below
    auto packing_lengths = sequence_length.to(torch::kCPU).to(torch::kInt64).clamp_min(1);
    auto packed = torch::nn::utils::rnn::pack_padded_sequence(inputs,
                                                              packing_lengths,
                                                              /*batch_first=*/true,
                                                              /*enforce_sorted=*/false);
    auto [packed_outputs, state] = lstm_->forward_with_packed_input(packed);
    auto [outputs, unused_lengths] = torch::nn::utils::rnn::pad_packed_sequence(packed_outputs,
                                                                                /*batch_first=*/true,
                                                                                /*padding_value=*/0.0,
                                                                                max_time);

    auto mask = myutils::sequence_mask(sequence_length, max_time, outputs.scalar_type());
    output.outputs = outputs * mask.unsqueeze(2);
    output.state = std::get<0>(state);
    VLOG(3) << "[rnnEncoder/encode]: " << mode_name(mode) << " " << inputs.sizes()
            << " -> " << output.outputs.sizes();
    return output;
}

    } // namespace encoders
} // namespace seqtag
