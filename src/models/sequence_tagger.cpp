#include "models/sequence_tagger.hpp"
#include "models/losses.hpp"
#include "decoders/crf.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>


namespace seqtag{
    namespace models{

sequenceTagger::sequenceTagger(std::shared_ptr<inputters::inputter> inputter,
                               std::shared_ptr<encoders::encoder> encoder,
                               std::string labels_vocabulary_file_key,
                               bool crf_decoding,
                               std::string name) :
    modelBase(std::move(name)),
    inputter_(std::move(inputter)),
    encoder_(std::move(encoder)),
    labels_vocabulary_file_key_(std::move(labels_vocabulary_file_key)),
    crf_decoding_(crf_decoding){
    if (!inputter_ || !encoder_){
        throw std::invalid_argument("sequenceTagger needs an inputter and an encoder");
    }
    register_module("inputter", inputter_);
    register_module("encoder", encoder_);
    DLOG(INFO) << "[sequenceTagger/constructor]: instance created, crf decoding: " << std::boolalpha << crf_decoding_;
}


sequenceTagger::~sequenceTagger(){
    DLOG(INFO) << "[sequenceTagger/destructor]: instance destroyed";
}


void sequenceTagger::do_initialize(const Metadata& metadata){
    inputter_->initialize(metadata);

    auto it = metadata.find(labels_vocabulary_file_key_);
    if (it == metadata.end()){
        LOG(WARNING) << "[sequenceTagger/initialize]: data configuration has no '"
                     << labels_vocabulary_file_key_ << "' entry";
        throw std::invalid_argument("missing data configuration key: " + labels_vocabulary_file_key_);
    }
    labels_vocabulary_file_ = it->second;
    num_labels_ = myutils::count_lines(labels_vocabulary_file_);
    if (num_labels_ == 0){
        throw std::invalid_argument("labels vocabulary " + labels_vocabulary_file_.string() + " is empty");
    }

    // forward and reverse tables, no oov bucket for labels
    labels_vocabulary_.load(labels_vocabulary_file_);
    if (labels_vocabulary_.size() != num_labels_){
        throw std::runtime_error("labels vocabulary size does not match its line count");
    }
    greedy_decoder_.emplace(num_labels_);

    encoder_->initialize(inputter_->output_depth());
    generator_ = register_module("generator", torch::nn::Linear(encoder_->output_depth(), num_labels_));
    if (crf_decoding_){
        // glorot uniform
        double limit = std::sqrt(6.0 / static_cast<double>(2 * num_labels_));
        transitions_ = register_parameter("transitions",
            torch::empty({num_labels_, num_labels_}).uniform_(-limit, limit));
    }
    LOG(INFO) << "[sequenceTagger/initialize]: " << num_labels_ << " labels from "
              << labels_vocabulary_file_ << (crf_decoding_ ? ", crf decoding" : ", greedy decoding");
}


torch::Tensor sequenceTagger::get_features_length(const Features& features) const {
    return inputter_->get_length(features);
}


buildOutput sequenceTagger::do_build(const Features& features,
                                     const std::optional<torch::Tensor>& labels,
                                     const Params& params,
                                     modeKey mode,
                                     const runConfig& config){
    // dropout of the submodules follows the mode
    train(mode == modeKey::TRAIN);

    auto length = get_features_length(features);
    auto inputs = inputter_->transform_data(features, mode, config.model_dir);
    auto encoded = encoder_->encode(inputs, length, mode);
    auto logits = generator_->forward(encoded.outputs);

    buildOutput output;
    output.logits = logits;
    if (mode == modeKey::TRAIN){
        return output;
    }

    torch::Tensor tags_id;
    if (crf_decoding_){
        tags_id = crf::crf_decode(logits, transitions_, encoded.sequence_length).decode_tags;
    }
    else{
        tags_id = greedy_decoder_->decode(logits);
    }

    Predictions predictions;
    predictions.length = encoded.sequence_length;
    predictions.ids = tags_id.to(torch::kInt64);
    predictions.labels = labels_vocabulary_.lookup_batch_strings(predictions.ids);
    output.predictions = std::move(predictions);
    VLOG(2) << "[sequenceTagger/build]: decoded a batch of " << tags_id.size(0);
    return output;
}


torch::Tensor sequenceTagger::compute_loss(const Features& features,
                                           const torch::Tensor& labels,
                                           const torch::Tensor& outputs){
    check_initialized("compute_loss");
    auto length = get_features_length(features);
    if (crf_decoding_){
        auto [log_likelihood, unused_transitions] = crf::crf_log_likelihood(outputs,
                                                                            labels.to(torch::kInt64),
                                                                            length,
                                                                            transitions_);
        return (-log_likelihood).mean();
    }
    return losses::masked_sequence_loss(outputs, labels, length);
}


void sequenceTagger::print_prediction(const Prediction& prediction,
                                      const Params* params,
                                      std::ostream* stream) const {
    std::ostream& out = stream ? *stream : std::cout;
    size_t num_labels = std::min(static_cast<size_t>(std::max<int64_t>(prediction.length, 0)),
                                 prediction.labels.size());
    std::vector<std::string> labels(prediction.labels.begin(), prediction.labels.begin() + num_labels);
    out << stringmanip::join(labels, " ") << "\n";
}


servingInputReceiver sequenceTagger::get_serving_input_receiver() const {
    return inputter_->get_serving_input_receiver();
}


data::datasetBuilder sequenceTagger::get_features_builder(const fs::path& features_file) const {
    data::datasetBuilder builder;
    builder.dataset = inputter_->make_dataset(features_file);
    auto inputter = inputter_;
    builder.process_fn = [inputter](const std::string& record){return inputter->process(record);};
    builder.padded_shapes_fn = [inputter](){return inputter->padded_shapes();};
    return builder;
}


data::datasetBuilder sequenceTagger::get_labels_builder(const fs::path& labels_file) const {
    data::datasetBuilder builder;
    builder.dataset = data::textLineDataset(labels_file);
    builder.process_fn = [this](const std::string& record){
        Features labels;
        labels["labels"] = labels_vocabulary_.lookup_ids(stringmanip::break_to_words(record));
        return labels;
    };
    builder.padded_shapes_fn = [](){return PaddedShapes{{"labels", {-1}}};};
    return builder;
}


bool sequenceTagger::accept_example(const data::Example& example) const {
    if (example.labels.empty()){
        return true;
    }
    const auto& labels = example.labels.at("labels");
    int64_t num_tokens = inputter_->get_length(example.features).item<int64_t>();
    if (labels.size(0) != num_tokens){
        LOG(WARNING) << "[sequenceTagger/accept_example]: " << labels.size(0)
                     << " labels for " << num_tokens << " tokens";
        return false;
    }
    if (labels.numel() > 0 && labels.min().item<int64_t>() < 0){
        LOG(WARNING) << "[sequenceTagger/accept_example]: label not found in "
                     << labels_vocabulary_file_;
        return false;
    }
    return true;
}

    } // namespace models
} // namespace seqtag
