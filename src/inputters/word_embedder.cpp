#include "inputters/word_embedder.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <fstream>
#include <memory>
#include <stdexcept>


namespace seqtag{
    namespace inputters{

wordEmbedder::wordEmbedder(wordEmbedderOptions options) : options_(std::move(options)){
    if (options_.embedding_size <= 0){
        throw std::invalid_argument("embedding_size must be positive");
    }
    if (options_.dropout < 0.0 || options_.dropout >= 1.0){
        throw std::invalid_argument("dropout must be in [0, 1)");
    }
    DLOG(INFO) << "[wordEmbedder/constructor]: instance created";
}


wordEmbedder::~wordEmbedder(){
    DLOG(INFO) << "[wordEmbedder/destructor]: instance destroyed";
}


void wordEmbedder::initialize(const Metadata& metadata){
    if (is_initialized()){
        throw std::logic_error("wordEmbedder is already initialized");
    }
    auto it = metadata.find(options_.vocabulary_file_key);
    if (it == metadata.end()){
        LOG(WARNING) << "[wordEmbedder/initialize]: data configuration has no '"
                     << options_.vocabulary_file_key << "' entry";
        throw std::invalid_argument("missing data configuration key: " + options_.vocabulary_file_key);
    }

    // one bucket for the out of vocabulary words
    vocabulary_.load(it->second, 1);
    embedding_ = register_module("embedding",
        torch::nn::Embedding(vocabulary_.size_with_oov(), options_.embedding_size));
    embedding_->weight.set_requires_grad(options_.trainable);
    LOG(INFO) << "[wordEmbedder/initialize]: " << vocabulary_.size_with_oov()
              << " x " << options_.embedding_size << " embeddings";
}


torch::Tensor wordEmbedder::get_length(const Features& features) const {
    auto it = features.find("length");
    if (it == features.end()){
        throw std::invalid_argument("features have no 'length' entry");
    }
    return it->second;
}


Features wordEmbedder::make_features(const std::vector<std::string>& tokens) const {
    if (!vocabulary_.is_loaded()){
        throw std::logic_error("wordEmbedder is not initialized");
    }
    Features features;
    features["ids"] = vocabulary_.lookup_ids(tokens);
    features["length"] = torch::scalar_tensor(static_cast<int64_t>(tokens.size()), torch::kInt64);
    return features;
}


Features wordEmbedder::process(const std::string& record) const {
    return make_features(stringmanip::break_to_words(record));
}


PaddedShapes wordEmbedder::padded_shapes() const {
    return PaddedShapes{{"ids", {-1}}, {"length", {}}};
}


torch::Tensor wordEmbedder::transform_data(const Features& features,
                                           modeKey mode,
                                           const fs::path& log_dir){
    if (!is_initialized()){
        throw std::logic_error("wordEmbedder is not initialized");
    }
    if (mode == modeKey::TRAIN && !log_dir.empty() && !metadata_written_){
        write_embedding_metadata(log_dir);
    }

    auto ids = features.at("ids");
    auto outputs = embedding_->forward(ids);
    if (mode == modeKey::TRAIN && options_.dropout > 0){
        outputs = torch::dropout(outputs, options_.dropout, true);
    }
    VLOG(3) << "[wordEmbedder/transform_data]: embedded " << ids.sizes() << " -> " << outputs.sizes();
    return outputs;
}


servingInputReceiver wordEmbedder::get_serving_input_receiver() const {
    // the receiver shares the ownership of the embedder
    std::shared_ptr<const wordEmbedder> self;
    try{
        self = std::static_pointer_cast<const wordEmbedder>(shared_from_this());
    }
    catch (const std::bad_weak_ptr&){
        LOG(WARNING) << "[wordEmbedder/get_serving_input_receiver]: the embedder is not owned by a shared_ptr";
        throw std::logic_error("a serving input receiver needs a shared_ptr owned wordEmbedder");
    }

    servingInputReceiver receiver;
    receiver.features_fn = [self](const std::vector<std::vector<std::string>>& batch_tokens){
        std::vector<Features> examples;
        examples.reserve(batch_tokens.size());
        for (const auto& tokens : batch_tokens){
            examples.push_back(self->make_features(tokens));
        }
        return data::padded_batch(examples, self->padded_shapes());
    };
    return receiver;
}


fs::path wordEmbedder::get_metadata_file(const fs::path& log_dir) const {
    return log_dir / (options_.vocabulary_file_key + ".metadata.tsv");
}


void wordEmbedder::write_embedding_metadata(const fs::path& log_dir){
    // row i of the embedding table is labelled by line i of this file
    std::error_code error;
    fs::create_directories(log_dir, error);
    if (error){
        LOG(WARNING) << "[wordEmbedder/write_embedding_metadata]: could not create " << log_dir
                     << ": " << error.message();
        return;
    }

    fs::path metadata_file = get_metadata_file(log_dir);
    std::ofstream metadata(metadata_file);
    if (!metadata.is_open()){
        LOG(WARNING) << "[wordEmbedder/write_embedding_metadata]: could not open " << metadata_file;
        return;
    }
    for (const auto& token : vocabulary_.get_tokens()){
        metadata << token << "\n";
    }
    for (int64_t i = 0; i < vocabulary_.num_oov_buckets(); ++i){
        metadata << "<unk>" << "\n";
    }
    metadata_written_ = true;
    LOG(INFO) << "[wordEmbedder/write_embedding_metadata]: wrote " << metadata_file;
}

    } // namespace inputters
} // namespace seqtag
