#ifndef _SEQ_TAGGER_RUNNER
#define _SEQ_TAGGER_RUNNER

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <filesystem>
#include <torch/torch.h>
#include "models/sequence_tagger.hpp"
#include "utils/config.hpp"


namespace fs = std::filesystem;

namespace seqtag{
    namespace runner{

// name of the index file naming the latest checkpoint of a model directory
const std::string CHECKPOINT_INDEX_FILE = "checkpoint";

// what the command line can ask a runner to do
const std::vector<std::string> RUN_TYPES = {"train", "eval", "infer", "serve"};
bool is_run_type(const std::string& run_type);


struct evaluationResult{
    double loss = 0.0;          // mean over the examples
    double accuracy = 0.0;
    int64_t num_batches = 0;
    int64_t num_examples = 0;
    int64_t num_tokens = 0;
};


/*
Drives a sequence tagger: training with periodic checkpoints, evaluation,
batch inference and line by line serving. The model is initialized with the
data configuration when the runner is created.
*/
class taggerRunner{
public:
    taggerRunner(std::shared_ptr<models::sequenceTagger> model, config::taggerConfig config);
    ~taggerRunner();

    // returns the global step reached
    int64_t train();
    // defaults to the eval_features_file / eval_labels_file data entries
    evaluationResult evaluate(const fs::path& features_file = fs::path(),
                              const fs::path& labels_file = fs::path());
    void infer(const fs::path& features_file, std::ostream& output);
    // one tokenized example per input line, one line of labels per example
    void serve(std::istream& input, std::ostream& output);

    // checkpoints
    fs::path save_checkpoint(int64_t step) const;
    std::optional<int64_t> restore_checkpoint(const fs::path& checkpoint_path = fs::path());
    std::optional<fs::path> latest_checkpoint() const;

    // getters
    int64_t get_global_step() const {return global_step_;}
    const config::taggerConfig& get_config() const {return config_;}
    std::shared_ptr<models::sequenceTagger> get_model() const {return model_;}

private:
    std::unique_ptr<torch::optim::Optimizer> make_optimizer() const;
    runConfig get_run_config() const {return runConfig{config_.model_dir};}
    fs::path require_data(const std::string& key) const;

private:
    std::shared_ptr<models::sequenceTagger> model_;
    config::taggerConfig config_;
    int64_t global_step_ = 0;
};

    } // namespace runner
} // namespace seqtag


#endif // _SEQ_TAGGER_RUNNER
