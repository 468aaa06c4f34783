#ifndef _SEQ_TAGGER_INPUTTER
#define _SEQ_TAGGER_INPUTTER

#include <string>
#include <filesystem>
#include <torch/torch.h>
#include "utils/tensor_types.hpp"
#include "data/dataset.hpp"


namespace fs = std::filesystem;

namespace seqtag{
    namespace inputters{

/*
Turns raw records into tensors for the encoder. A concrete inputter owns its
trainable parameters (e.g. an embedding table) as registered submodules, so
the model that holds it sees them in parameters().

Life cycle: initialize() once with the data configuration, then any number of
process()/transform_data() calls.
*/
class inputter : public torch::nn::Module{
public:
    virtual ~inputter() = default;

    virtual void initialize(const Metadata& metadata) = 0;

    // [B] int64 lengths of a batch of features
    virtual torch::Tensor get_length(const Features& features) const = 0;

    virtual data::textLineDataset make_dataset(const fs::path& data_file) const {
        return data::textLineDataset(data_file);
    }

    // one raw record -> features of one example (no batch dimension)
    virtual Features process(const std::string& record) const = 0;

    virtual PaddedShapes padded_shapes() const = 0;

    // batched features -> [B, T, output_depth()] encoder inputs
    virtual torch::Tensor transform_data(const Features& features,
                                         modeKey mode,
                                         const fs::path& log_dir) = 0;

    virtual servingInputReceiver get_serving_input_receiver() const = 0;

    virtual int64_t output_depth() const = 0;
};

    } // namespace inputters
} // namespace seqtag


#endif // _SEQ_TAGGER_INPUTTER
