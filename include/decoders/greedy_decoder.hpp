#ifndef _SEQ_TAGGER_GREEDY_DECODER
#define _SEQ_TAGGER_GREEDY_DECODER

#include <vector>
#include <stddef.h>
#include <torch/torch.h>
#include <optional>


namespace seqtag{
    namespace decoders{

// picks, at every position, the label with the highest softmax probability
class greedyDecoder{

private:
    int64_t _num_labels;

public:
    explicit greedyDecoder(int64_t num_labels);

    ~greedyDecoder();

    // [B, T, N] logits -> [B, T, N] probabilities, std::nullopt on incompatible shapes
    std::optional<torch::Tensor> get_probabilities(const torch::Tensor& logits) const;

    // [B, T, N] logits -> [B, T] int64 label ids
    torch::Tensor decode(const torch::Tensor& logits) const;

    int64_t get_num_labels() const {return _num_labels;}

};

    } // namespace decoders
} // namespace seqtag


#endif // _SEQ_TAGGER_GREEDY_DECODER
