#include "decoders/crf.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>


namespace seqtag{
    namespace crf{

namespace {

void check_shapes(const torch::Tensor& inputs,
                  const torch::Tensor& sequence_lengths,
                  const torch::Tensor& transition_params){
    if (inputs.dim() != 3){
        LOG(WARNING) << "[crf/check_shapes]: expected [batch, time, labels] inputs, got " << inputs.sizes();
        throw std::invalid_argument("crf inputs must be a 3-D tensor");
    }
    int64_t num_tags = inputs.size(2);
    if (transition_params.dim() != 2 ||
        transition_params.size(0) != num_tags ||
        transition_params.size(1) != num_tags){
        LOG(WARNING) << "[crf/check_shapes]: transitions " << transition_params.sizes()
                     << " do not match " << num_tags << " labels";
        throw std::invalid_argument("crf transition_params must be [num_tags, num_tags]");
    }
    if (sequence_lengths.dim() != 1 || sequence_lengths.size(0) != inputs.size(0)){
        LOG(WARNING) << "[crf/check_shapes]: sequence lengths " << sequence_lengths.sizes()
                     << " do not match a batch of " << inputs.size(0);
        throw std::invalid_argument("crf sequence_lengths must be [batch]");
    }
}

} // namespace


torch::Tensor crf_sequence_score(const torch::Tensor& inputs,
                                 const torch::Tensor& tag_indices,
                                 const torch::Tensor& sequence_lengths,
                                 const torch::Tensor& transition_params){
    check_shapes(inputs, sequence_lengths, transition_params);
    int64_t batch_size = inputs.size(0);
    int64_t max_time = inputs.size(1);
    int64_t num_tags = inputs.size(2);
    if (tag_indices.dim() != 2 || tag_indices.size(0) != batch_size || tag_indices.size(1) != max_time){
        LOG(WARNING) << "[crf/crf_sequence_score]: tag indices " << tag_indices.sizes()
                     << " do not match inputs " << inputs.sizes();
        throw std::invalid_argument("crf tag_indices must be [batch, time]");
    }
    if (max_time == 0){
        // zeros that stay attached to the graph of the inputs
        return inputs.sum({1, 2}) * 0;
    }

    auto lengths = sequence_lengths.to(inputs.device()).to(torch::kInt64);
    auto tags = tag_indices.to(inputs.device()).to(torch::kInt64);
    auto mask = myutils::sequence_mask(lengths, max_time, inputs.scalar_type());

    // unary: score of the chosen label at each valid position
    auto unary = inputs.gather(2, tags.unsqueeze(2)).squeeze(2);
    auto unary_scores = (unary * mask).sum(1);
    if (max_time == 1){
        return unary_scores;
    }

    // binary: transition into every valid position but the first
    auto start_tags = tags.slice(1, 0, max_time - 1);
    auto end_tags = tags.slice(1, 1, max_time);
    auto flat_indices = (start_tags * num_tags + end_tags).reshape({-1});
    auto binary = transition_params.reshape({-1})
                                   .index_select(0, flat_indices)
                                   .view({batch_size, max_time - 1});
    auto binary_scores = (binary * mask.slice(1, 1, max_time)).sum(1);
    return unary_scores + binary_scores;
}


torch::Tensor crf_log_norm(const torch::Tensor& inputs,
                           const torch::Tensor& sequence_lengths,
                           const torch::Tensor& transition_params){
    check_shapes(inputs, sequence_lengths, transition_params);
    int64_t max_time = inputs.size(1);
    if (max_time == 0){
        return inputs.sum({1, 2}) * 0;
    }

    auto lengths = sequence_lengths.to(inputs.device()).to(torch::kInt64);
    auto transitions = transition_params.unsqueeze(0);

    // alphas[b][j]: log sum of the scores of all prefixes ending with label j
    auto alphas = inputs.select(1, 0);
    for (int64_t t = 1; t < max_time; ++t){
        auto next_alphas = torch::logsumexp(alphas.unsqueeze(2) + transitions, /*dim=*/1)
                         + inputs.select(1, t);
        auto step_mask = (lengths > t).unsqueeze(1);
        alphas = torch::where(step_mask, next_alphas, alphas);
    }
    auto log_norm = torch::logsumexp(alphas, /*dim=*/1);
    return torch::where(lengths > 0, log_norm, torch::zeros_like(log_norm));
}


std::pair<torch::Tensor, torch::Tensor> crf_log_likelihood(const torch::Tensor& inputs,
                                                           const torch::Tensor& tag_indices,
                                                           const torch::Tensor& sequence_lengths,
                                                           const torch::Tensor& transition_params){
    auto sequence_scores = crf_sequence_score(inputs, tag_indices, sequence_lengths, transition_params);
    auto log_norm = crf_log_norm(inputs, sequence_lengths, transition_params);
    return std::make_pair(sequence_scores - log_norm, transition_params);
}


crfDecodeResult crf_decode(const torch::Tensor& potentials,
                           const torch::Tensor& transition_params,
                           const torch::Tensor& sequence_length){
    check_shapes(potentials, sequence_length, transition_params);
    torch::NoGradGuard no_grad;

    int64_t batch_size = potentials.size(0);
    int64_t max_time = potentials.size(1);
    auto lengths = sequence_length.to(potentials.device()).to(torch::kInt64);

    crfDecodeResult result;
    auto decode_tags = torch::zeros({batch_size, max_time}, torch::kInt64);
    if (max_time == 0){
        result.decode_tags = decode_tags.to(potentials.device());
        result.best_score = torch::zeros({batch_size}, potentials.options());
        return result;
    }

    auto transitions = transition_params.unsqueeze(0);
    auto scores = potentials.select(1, 0);
    std::vector<torch::Tensor> backpointers;
    for (int64_t t = 1; t < max_time; ++t){
        // [B, previous label, current label]
        auto candidates = scores.unsqueeze(2) + transitions;
        auto best_previous = candidates.argmax(/*dim=*/1);
        auto best = candidates.gather(1, best_previous.unsqueeze(1)).squeeze(1);
        auto step_mask = (lengths > t).unsqueeze(1);
        scores = torch::where(step_mask, best + potentials.select(1, t), scores);
        backpointers.push_back(best_previous);
    }
    auto last_tags = scores.argmax(/*dim=*/1);
    auto final_scores = scores.gather(1, last_tags.unsqueeze(1)).squeeze(1);
    result.best_score = torch::where(lengths > 0, final_scores, torch::zeros_like(final_scores));

    // follow the backpointers from the last valid position of every example
    auto lengths_cpu = lengths.to(torch::kCPU).contiguous();
    auto last_tags_cpu = last_tags.to(torch::kCPU).to(torch::kInt64).contiguous();
    auto lengths_a = lengths_cpu.accessor<int64_t, 1>();
    auto last_tags_a = last_tags_cpu.accessor<int64_t, 1>();
    auto tags_a = decode_tags.accessor<int64_t, 2>();

    auto stacked = backpointers.empty()
        ? torch::zeros({batch_size, 0, potentials.size(2)}, torch::kInt64)
        : torch::stack(backpointers, /*dim=*/1).to(torch::kCPU).to(torch::kInt64).contiguous();
    auto backpointers_a = stacked.accessor<int64_t, 3>();
    for (int64_t b = 0; b < batch_size; ++b){
        int64_t length = std::min<int64_t>(lengths_a[b], max_time);
        if (length <= 0){
            continue;
        }
        int64_t tag = last_tags_a[b];
        tags_a[b][length - 1] = tag;
        for (int64_t t = length - 1; t >= 1; --t){
            tag = backpointers_a[b][t - 1][tag];
            tags_a[b][t - 1] = tag;
        }
    }
    result.decode_tags = decode_tags.to(potentials.device());
    VLOG(3) << "[crf/crf_decode]: decoded " << batch_size << " sequences of max length " << max_time;
    return result;
}


std::pair<std::vector<int64_t>, double> viterbi_decode(const torch::Tensor& score,
                                                       const torch::Tensor& transition_params){
    if (score.dim() != 2){
        throw std::invalid_argument("viterbi_decode expects a [time, labels] score matrix");
    }
    auto lengths = torch::full({1}, score.size(0), torch::kInt64);
    auto decoded = crf_decode(score.unsqueeze(0), transition_params, lengths);

    auto tags = decoded.decode_tags[0].to(torch::kCPU).contiguous();
    std::vector<int64_t> viterbi(tags.data_ptr<int64_t>(), tags.data_ptr<int64_t>() + tags.numel());
    return std::make_pair(viterbi, decoded.best_score[0].item<double>());
}

    } // namespace crf
} // namespace seqtag
