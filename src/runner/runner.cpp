#include "runner/runner.hpp"
#include "models/losses.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <fstream>
#include <random>
#include <stdexcept>


namespace seqtag{
    namespace runner{

bool is_run_type(const std::string& run_type){
    return std::find(RUN_TYPES.begin(), RUN_TYPES.end(), run_type) != RUN_TYPES.end();
}


taggerRunner::taggerRunner(std::shared_ptr<models::sequenceTagger> model, config::taggerConfig config) :
    model_(std::move(model)), config_(std::move(config)){
    if (!model_){
        throw std::invalid_argument("taggerRunner needs a model");
    }
    if (!model_->is_initialized()){
        model_->initialize(config_.data);
    }
    DLOG(INFO) << "[taggerRunner/constructor]: instance created for " << config_.model_dir;
}


taggerRunner::~taggerRunner(){
    DLOG(INFO) << "[taggerRunner/destructor]: instance destroyed";
}


fs::path taggerRunner::require_data(const std::string& key) const {
    std::string value = config_.get_data(key);
    if (value.empty()){
        LOG(WARNING) << "[taggerRunner/require_data]: data configuration has no '" << key << "' entry";
        throw std::invalid_argument("missing data configuration key: " + key);
    }
    return fs::path(value);
}


std::unique_ptr<torch::optim::Optimizer> taggerRunner::make_optimizer() const {
    const auto& params = config_.params;
    if (params.optimizer == "adam"){
        return std::make_unique<torch::optim::Adam>(model_->parameters(),
                                                    torch::optim::AdamOptions(params.learning_rate));
    }
    if (params.optimizer == "sgd"){
        return std::make_unique<torch::optim::SGD>(model_->parameters(),
                                                   torch::optim::SGDOptions(params.learning_rate));
    }
    LOG(WARNING) << "[taggerRunner/make_optimizer]: unknown optimizer '" << params.optimizer << "'";
    throw std::invalid_argument("unknown optimizer: " + params.optimizer);
}


int64_t taggerRunner::train(){
    if (config_.model_dir.empty()){
        throw std::invalid_argument("training needs a model_dir");
    }
    const auto& options = config_.train;
    auto batches = model_->input_fn(modeKey::TRAIN,
                                    options.batch_size,
                                    require_data("train_features_file"),
                                    require_data("train_labels_file"),
                                    options.shuffle,
                                    options.seed);
    if (batches.empty()){
        throw std::runtime_error("no training examples");
    }

    restore_checkpoint();
    auto optimizer = make_optimizer();
    auto run_config = get_run_config();
    std::mt19937_64 generator(options.seed + static_cast<uint64_t>(global_step_));
    LOG(INFO) << "[taggerRunner/train]: training from step " << global_step_ << " to "
              << options.train_steps << " on " << batches.size() << " batches";

    size_t batch_index = 0;
    int64_t last_saved_step = global_step_;
    double running_loss = 0.0;
    int64_t running_steps = 0;
    while (global_step_ < options.train_steps){
        if (batch_index == batches.size()){
            batch_index = 0;
            if (options.shuffle){
                std::shuffle(batches.begin(), batches.end(), generator);
            }
        }
        const auto& batch = batches[batch_index++];

        optimizer->zero_grad();
        auto output = model_->build(batch.features, batch.labels, config_.params, modeKey::TRAIN, run_config);
        auto loss = model_->compute_loss(batch.features, batch.labels, output.logits);
        loss.backward();
        if (config_.params.clip_gradients > 0){
            torch::nn::utils::clip_grad_norm_(model_->parameters(), config_.params.clip_gradients);
        }
        optimizer->step();
        ++global_step_;

        running_loss += loss.item<double>();
        ++running_steps;
        if (options.log_every > 0 && global_step_ % options.log_every == 0){
            LOG(INFO) << "[taggerRunner/train]: step " << global_step_ << ", loss = "
                      << running_loss / running_steps;
            running_loss = 0.0;
            running_steps = 0;
        }
        if (options.save_checkpoints_steps > 0 && global_step_ % options.save_checkpoints_steps == 0){
            save_checkpoint(global_step_);
            last_saved_step = global_step_;
        }
    }
    if (last_saved_step != global_step_){
        save_checkpoint(global_step_);
    }
    return global_step_;
}


evaluationResult taggerRunner::evaluate(const fs::path& features_file, const fs::path& labels_file){
    torch::NoGradGuard no_grad;
    fs::path features_path = features_file.empty() ? require_data("eval_features_file") : features_file;
    fs::path labels_path = labels_file.empty() ? require_data("eval_labels_file") : labels_file;
    auto batches = model_->input_fn(modeKey::PREDICT, config_.infer.batch_size, features_path, labels_path, false);
    auto run_config = get_run_config();

    evaluationResult result;
    double total_loss = 0.0;
    int64_t num_correct = 0;
    for (const auto& batch : batches){
        auto output = model_->build(batch.features, batch.labels, config_.params, modeKey::PREDICT, run_config);
        auto loss = model_->compute_loss(batch.features, batch.labels, output.logits);
        // weighted by the batch size so a short last batch counts for what it holds
        int64_t batch_size = batch.size();
        total_loss += loss.item<double>() * static_cast<double>(batch_size);
        result.num_examples += batch_size;
        auto [correct, total] = losses::token_accuracy_counts(output.predictions->ids,
                                                              batch.labels,
                                                              output.predictions->length);
        num_correct += correct;
        result.num_tokens += total;
        ++result.num_batches;
    }
    if (result.num_examples > 0){
        result.loss = total_loss / static_cast<double>(result.num_examples);
    }
    if (result.num_tokens > 0){
        result.accuracy = static_cast<double>(num_correct) / static_cast<double>(result.num_tokens);
    }
    LOG(INFO) << "[taggerRunner/evaluate]: step " << global_step_ << ", loss = " << result.loss
              << ", accuracy = " << result.accuracy << " (" << result.num_tokens << " tokens)";
    return result;
}


void taggerRunner::infer(const fs::path& features_file, std::ostream& output){
    torch::NoGradGuard no_grad;
    auto batches = model_->input_fn(modeKey::PREDICT, config_.infer.batch_size, features_file);
    auto run_config = get_run_config();

    size_t num_examples = 0;
    for (const auto& batch : batches){
        auto built = model_->build(batch.features, std::nullopt, config_.params, modeKey::PREDICT, run_config);
        for (const auto& prediction : built.predictions->unbatch()){
            model_->print_prediction(prediction, &config_.params, &output);
            ++num_examples;
        }
    }
    LOG(INFO) << "[taggerRunner/infer]: tagged " << num_examples << " examples from " << features_file;
}


void taggerRunner::serve(std::istream& input, std::ostream& output){
    torch::NoGradGuard no_grad;
    auto receiver = model_->get_serving_input_receiver();
    auto run_config = get_run_config();

    std::string line;
    while (std::getline(input, line)){
        stringmanip::strip_carriage_return(line);
        std::vector<std::vector<std::string>> batch_tokens;
        batch_tokens.push_back(stringmanip::break_to_words(line));
        auto features = receiver.features_fn(batch_tokens);
        auto built = model_->build(features, std::nullopt, config_.params, modeKey::PREDICT, run_config);
        for (const auto& prediction : built.predictions->unbatch()){
            model_->print_prediction(prediction, &config_.params, &output);
        }
        output.flush();
    }
}


fs::path taggerRunner::save_checkpoint(int64_t step) const {
    fs::create_directories(config_.model_dir);
    fs::path checkpoint_path = config_.model_dir / ("model." + std::to_string(step) + ".pt");

    torch::serialize::OutputArchive archive;
    model_->save(archive);
    archive.write("global_step", torch::scalar_tensor(step, torch::kInt64));
    archive.save_to(checkpoint_path.string());

    std::ofstream index(config_.model_dir / CHECKPOINT_INDEX_FILE);
    if (!index.is_open()){
        LOG(WARNING) << "[taggerRunner/save_checkpoint]: could not update the checkpoint index in "
                     << config_.model_dir;
        throw std::runtime_error("could not write the checkpoint index");
    }
    index << checkpoint_path.filename().string() << "\n";
    LOG(INFO) << "[taggerRunner/save_checkpoint]: saved " << checkpoint_path;
    return checkpoint_path;
}


std::optional<fs::path> taggerRunner::latest_checkpoint() const {
    fs::path index_path = config_.model_dir / CHECKPOINT_INDEX_FILE;
    std::ifstream index(index_path);
    if (!index.is_open()){
        return std::nullopt;
    }
    std::string checkpoint_name;
    if (!std::getline(index, checkpoint_name) || checkpoint_name.empty()){
        LOG(WARNING) << "[taggerRunner/latest_checkpoint]: " << index_path << " is empty";
        return std::nullopt;
    }
    fs::path checkpoint_path = config_.model_dir / checkpoint_name;
    if (!fs::exists(checkpoint_path)){
        LOG(WARNING) << "[taggerRunner/latest_checkpoint]: " << checkpoint_path << " does not exist";
        return std::nullopt;
    }
    return checkpoint_path;
}


std::optional<int64_t> taggerRunner::restore_checkpoint(const fs::path& checkpoint_path){
    std::optional<fs::path> path;
    if (!checkpoint_path.empty()){
        path = checkpoint_path;
    }
    else{
        path = latest_checkpoint();
    }
    if (!path){
        LOG(INFO) << "[taggerRunner/restore_checkpoint]: no checkpoint in " << config_.model_dir;
        return std::nullopt;
    }
    if (!fs::exists(*path)){
        LOG(WARNING) << "[taggerRunner/restore_checkpoint]: " << *path << " does not exist";
        throw std::runtime_error("checkpoint not found: " + path->string());
    }

    torch::serialize::InputArchive archive;
    archive.load_from(path->string());
    model_->load(archive);
    torch::Tensor step;
    if (archive.try_read("global_step", step)){
        global_step_ = step.item<int64_t>();
    }
    LOG(INFO) << "[taggerRunner/restore_checkpoint]: restored " << *path << " at step " << global_step_;
    return global_step_;
}

    } // namespace runner
} // namespace seqtag
