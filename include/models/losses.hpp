#ifndef _SEQ_TAGGER_LOSSES
#define _SEQ_TAGGER_LOSSES

#include <torch/torch.h>


namespace seqtag{
    namespace losses{

/*
Token level softmax cross entropy between [B, T, N] logits and [B, T] labels,
averaged over the positions inside each sequence length. Padded positions do
not contribute. Returns 0 for a batch without any valid position.
*/
torch::Tensor masked_sequence_loss(const torch::Tensor& logits,
                                   const torch::Tensor& labels,
                                   const torch::Tensor& sequence_length);

// correct valid positions / valid positions, as a float scalar
torch::Tensor token_accuracy(const torch::Tensor& predicted_ids,
                             const torch::Tensor& labels,
                             const torch::Tensor& sequence_length);

// {correct, total} counts behind token_accuracy, for accumulation over batches
std::pair<int64_t, int64_t> token_accuracy_counts(const torch::Tensor& predicted_ids,
                                                  const torch::Tensor& labels,
                                                  const torch::Tensor& sequence_length);

    } // namespace losses
} // namespace seqtag


#endif // _SEQ_TAGGER_LOSSES
