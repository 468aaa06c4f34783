#include "decoders/greedy_decoder.hpp"
#include <glog/logging.h>
#include <stdexcept>


namespace seqtag{
    namespace decoders{

greedyDecoder::greedyDecoder(int64_t num_labels) : _num_labels(num_labels){
    if (num_labels < 1){
        throw std::invalid_argument("greedyDecoder needs at least one label");
    }
    DLOG(INFO) << "[greedyDecoder/constructor]: instance created";
};


greedyDecoder::~greedyDecoder(){};


std::optional<torch::Tensor> greedyDecoder::get_probabilities(const torch::Tensor& logits) const {
    // ensure size compatibility
    if (logits.dim() != 3 || logits.size(2) != _num_labels){
        DLOG(WARNING) << "[greedyDecoder/get_probabilities]: input tensor has incompatible shape: "
                      << logits.sizes() << " while the num of labels is: " << _num_labels;
        return std::nullopt;
    }
    return torch::softmax(logits, /*dim=*/-1);
}


torch::Tensor greedyDecoder::decode(const torch::Tensor& logits) const {
    auto probabilities = get_probabilities(logits);
    if (!probabilities.has_value()){
        LOG(WARNING) << "[greedyDecoder/decode]: no probabilities for logits of shape "
                     << logits.sizes() << ". Throwing exception.";
        throw std::invalid_argument("logits do not match the number of labels");
    }

    // index of the highest probability across the labels dim
    auto max_index = torch::argmax(probabilities.value(), /*dim=*/-1);
    return max_index.to(torch::kInt64);
}

    } // namespace decoders
} // namespace seqtag
