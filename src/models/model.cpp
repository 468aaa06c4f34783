#include "models/model.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <random>
#include <stdexcept>


namespace seqtag{
    namespace models{

std::vector<Prediction> Predictions::unbatch() const {
    std::vector<Prediction> result;
    auto lengths = length.to(torch::kCPU).to(torch::kInt64).contiguous();
    if (lengths.size(0) != static_cast<int64_t>(labels.size())){
        throw std::invalid_argument("predictions length and labels have different batch sizes");
    }
    auto lengths_a = lengths.accessor<int64_t, 1>();
    for (size_t b = 0; b < labels.size(); ++b){
        Prediction prediction;
        prediction.length = lengths_a[b];
        prediction.labels = labels[b];
        result.push_back(std::move(prediction));
    }
    return result;
}


modelBase::modelBase(std::string name) : name_(std::move(name)){
    DLOG(INFO) << "[modelBase/constructor]: model '" << name_ << "' created";
}


void modelBase::initialize(const Metadata& metadata){
    if (initialized_){
        throw std::logic_error("model '" + name_ + "' is already initialized");
    }
    do_initialize(metadata);
    initialized_ = true;
    LOG(INFO) << "[modelBase/initialize]: model '" << name_ << "' initialized";
}


void modelBase::check_initialized(const char* caller) const {
    if (!initialized_){
        LOG(WARNING) << "[modelBase/" << caller << "]: model '" << name_ << "' is not initialized";
        throw std::logic_error(std::string(caller) + " called before initialize");
    }
}


buildOutput modelBase::build(const Features& features,
                             const std::optional<torch::Tensor>& labels,
                             const Params& params,
                             modeKey mode,
                             const runConfig& config){
    check_initialized("build");
    return do_build(features, labels, params, mode, config);
}


std::vector<data::Batch> modelBase::input_fn(modeKey mode,
                                             size_t batch_size,
                                             const fs::path& features_file,
                                             const fs::path& labels_file,
                                             bool shuffle,
                                             uint64_t seed) const {
    check_initialized("input_fn");

    data::datasetBuilder features_builder = get_features_builder(features_file);
    std::optional<data::datasetBuilder> labels_builder;
    if (!labels_file.empty()){
        labels_builder = get_labels_builder(labels_file);
        if (labels_builder->dataset.size() != features_builder.dataset.size()){
            LOG(WARNING) << "[modelBase/input_fn]: " << features_file << " has "
                         << features_builder.dataset.size() << " records but " << labels_file
                         << " has " << labels_builder->dataset.size();
            throw std::invalid_argument("features and labels files have different sizes");
        }
    }

    std::vector<data::Example> examples;
    size_t num_skipped = 0;
    for (size_t i = 0; i < features_builder.dataset.size(); ++i){
        data::Example example;
        example.features = features_builder.process_fn(features_builder.dataset[i]);
        if (labels_builder){
            example.labels = labels_builder->process_fn(labels_builder->dataset[i]);
        }
        if (!accept_example(example)){
            VLOG(1) << "[modelBase/input_fn]: skipping record " << i + 1;
            ++num_skipped;
            continue;
        }
        examples.push_back(std::move(example));
    }
    if (num_skipped > 0){
        LOG(WARNING) << "[modelBase/input_fn]: skipped " << num_skipped << " invalid examples out of "
                     << features_builder.dataset.size();
    }

    if (mode == modeKey::TRAIN && shuffle){
        std::mt19937_64 generator(seed);
        std::shuffle(examples.begin(), examples.end(), generator);
    }

    PaddedShapes labels_shapes;
    if (labels_builder){
        labels_shapes = labels_builder->padded_shapes_fn();
    }
    return data::make_batches(examples, batch_size, features_builder.padded_shapes_fn(), labels_shapes);
}

    } // namespace models
} // namespace seqtag
