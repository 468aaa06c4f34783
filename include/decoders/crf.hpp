#ifndef _SEQ_TAGGER_CRF
#define _SEQ_TAGGER_CRF

#include <vector>
#include <utility>
#include <torch/torch.h>


namespace seqtag{
    namespace crf{

/*
Linear chain CRF over per position label scores (the "unary potentials") and a
[N, N] matrix of label transition scores, transitions[i][j] scoring label i
followed by label j. There are no start or end transitions.

Shapes used below:
    inputs / potentials : [B, T, N] float
    tag_indices         : [B, T] int64 (values past the sequence length are ignored)
    sequence_lengths    : [B] int64
    transition_params   : [N, N] float

Empty sequences score 0 and have a log normalizer of 0.
*/


// score of the given tag sequences, differentiable w.r.t. inputs and transitions
torch::Tensor crf_sequence_score(const torch::Tensor& inputs,
                                 const torch::Tensor& tag_indices,
                                 const torch::Tensor& sequence_lengths,
                                 const torch::Tensor& transition_params);

// log of the partition function computed with the forward algorithm, [B]
torch::Tensor crf_log_norm(const torch::Tensor& inputs,
                           const torch::Tensor& sequence_lengths,
                           const torch::Tensor& transition_params);

// {[B] log likelihood of the tag sequences, transition_params}
std::pair<torch::Tensor, torch::Tensor> crf_log_likelihood(const torch::Tensor& inputs,
                                                           const torch::Tensor& tag_indices,
                                                           const torch::Tensor& sequence_lengths,
                                                           const torch::Tensor& transition_params);


struct crfDecodeResult{
    torch::Tensor decode_tags;  // [B, T] int64, 0 past the sequence length
    torch::Tensor best_score;   // [B] float
};

// highest scoring tag sequence of every example (Viterbi), no gradient
crfDecodeResult crf_decode(const torch::Tensor& potentials,
                           const torch::Tensor& transition_params,
                           const torch::Tensor& sequence_length);

// single sequence Viterbi on a [T, N] score matrix, {best tags, best score}
std::pair<std::vector<int64_t>, double> viterbi_decode(const torch::Tensor& score,
                                                       const torch::Tensor& transition_params);

    } // namespace crf
} // namespace seqtag


#endif // _SEQ_TAGGER_CRF
