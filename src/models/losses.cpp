#include "models/losses.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <stdexcept>


namespace seqtag{
    namespace losses{

torch::Tensor masked_sequence_loss(const torch::Tensor& logits,
                                   const torch::Tensor& labels,
                                   const torch::Tensor& sequence_length){
    if (logits.dim() != 3 || labels.dim() != 2 ||
        logits.size(0) != labels.size(0) || logits.size(1) != labels.size(1)){
        LOG(WARNING) << "[losses/masked_sequence_loss]: logits " << logits.sizes()
                     << " and labels " << labels.sizes() << " are not aligned";
        throw std::invalid_argument("logits must be [batch, time, labels] and labels [batch, time]");
    }

    int64_t max_time = logits.size(1);
    auto targets = labels.to(logits.device()).to(torch::kInt64);
    auto log_probs = torch::log_softmax(logits, /*dim=*/-1);
    auto cross_entropy = -log_probs.gather(2, targets.unsqueeze(2)).squeeze(2);

    auto weights = myutils::sequence_mask(sequence_length.to(logits.device()), max_time, logits.scalar_type());
    auto total_weight = weights.sum().clamp_min(1.0);
    return (cross_entropy * weights).sum() / total_weight;
}


std::pair<int64_t, int64_t> token_accuracy_counts(const torch::Tensor& predicted_ids,
                                                  const torch::Tensor& labels,
                                                  const torch::Tensor& sequence_length){
    if (predicted_ids.sizes() != labels.sizes()){
        throw std::invalid_argument("predictions and labels must have the same shape");
    }
    torch::NoGradGuard no_grad;
    auto mask = myutils::sequence_mask(sequence_length.to(labels.device()), labels.size(1), torch::kBool);
    auto correct = (predicted_ids.to(labels.device()).to(torch::kInt64) == labels.to(torch::kInt64)) & mask;
    return std::make_pair(correct.sum().item<int64_t>(), mask.sum().item<int64_t>());
}


torch::Tensor token_accuracy(const torch::Tensor& predicted_ids,
                             const torch::Tensor& labels,
                             const torch::Tensor& sequence_length){
    auto [correct, total] = token_accuracy_counts(predicted_ids, labels, sequence_length);
    if (total == 0){
        return torch::scalar_tensor(0.0, torch::kFloat32);
    }
    return torch::scalar_tensor(static_cast<double>(correct) / static_cast<double>(total), torch::kFloat32);
}

    } // namespace losses
} // namespace seqtag
