#ifndef _SEQ_TAGGER_TENSOR_TYPES
#define _SEQ_TAGGER_TENSOR_TYPES

#include <torch/torch.h>
#include <map>
#include <string>
#include <vector>
#include <functional>
#include <filesystem>


namespace fs = std::filesystem;

namespace seqtag{

// TRAIN builds the loss path only, PREDICT also decodes
enum class modeKey {
    TRAIN,
    PREDICT
};

inline const char* mode_name(modeKey mode){
    return mode == modeKey::TRAIN ? "train" : "predict";
}

// data configuration key -> value (mostly file paths)
typedef std::map<std::string, std::string> Metadata;

// named tensors of one example or one batch
typedef std::map<std::string, torch::Tensor> Features;

// per feature shape used when padding a batch, -1 means "pad to the longest"
typedef std::map<std::string, std::vector<int64_t>> PaddedShapes;


struct runConfig{
    fs::path model_dir;
};


// turns raw, already tokenized inputs into a batch of features (deployment path)
struct servingInputReceiver{
    std::function<Features(const std::vector<std::vector<std::string>>&)> features_fn;
};

} // namespace seqtag


#endif // _SEQ_TAGGER_TENSOR_TYPES
