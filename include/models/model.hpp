#ifndef _SEQ_TAGGER_MODEL
#define _SEQ_TAGGER_MODEL

#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <filesystem>
#include <torch/torch.h>
#include "utils/tensor_types.hpp"
#include "data/dataset.hpp"


namespace fs = std::filesystem;

namespace seqtag{
    namespace models{

// optimization hyper parameters
struct Params{
    std::string optimizer = "adam";
    double learning_rate = 0.001;
    double clip_gradients = 0.0;   // max global gradient norm, 0 disables clipping

    void set_optimizer(std::string new_optimizer){optimizer = new_optimizer;}
    void set_learning_rate(double new_learning_rate){learning_rate = new_learning_rate;}
};


// one decoded example
struct Prediction{
    int64_t length = 0;
    std::vector<std::string> labels;
};


// decoded batch
struct Predictions{
    torch::Tensor length;                             // [B]
    torch::Tensor ids;                                // [B, T]
    std::vector<std::vector<std::string>> labels;     // B x T

    std::vector<Prediction> unbatch() const;
};


struct buildOutput{
    torch::Tensor logits;
    std::optional<Predictions> predictions;  // std::nullopt in training mode
};


/*
Base of the models: owns the initialization protocol and the input pipeline.
Subclasses provide the graph (do_build), the loss and the prediction printing.

initialize() must run exactly once before build(), compute_loss() or input_fn().
*/
class modelBase : public torch::nn::Module{
public:
    explicit modelBase(std::string name);
    virtual ~modelBase() = default;

    void initialize(const Metadata& metadata);
    bool is_initialized() const {return initialized_;}
    const std::string& get_name() const {return name_;}

    buildOutput build(const Features& features,
                      const std::optional<torch::Tensor>& labels,
                      const Params& params,
                      modeKey mode,
                      const runConfig& config);

    virtual torch::Tensor compute_loss(const Features& features,
                                       const torch::Tensor& labels,
                                       const torch::Tensor& outputs) = 0;

    virtual void print_prediction(const Prediction& prediction,
                                  const Params* params = nullptr,
                                  std::ostream* stream = nullptr) const = 0;

    virtual servingInputReceiver get_serving_input_receiver() const = 0;

    // reads, filters, shuffles (training only) and batches the data files
    std::vector<data::Batch> input_fn(modeKey mode,
                                      size_t batch_size,
                                      const fs::path& features_file,
                                      const fs::path& labels_file = fs::path(),
                                      bool shuffle = true,
                                      uint64_t seed = 1234) const;

protected:
    virtual void do_initialize(const Metadata& metadata) = 0;
    virtual buildOutput do_build(const Features& features,
                                 const std::optional<torch::Tensor>& labels,
                                 const Params& params,
                                 modeKey mode,
                                 const runConfig& config) = 0;

    virtual torch::Tensor get_features_length(const Features& features) const = 0;
    virtual data::datasetBuilder get_features_builder(const fs::path& features_file) const = 0;
    virtual data::datasetBuilder get_labels_builder(const fs::path& labels_file) const = 0;

    // examples rejected here are skipped by input_fn
    virtual bool accept_example(const data::Example& example) const {return true;}

    void check_initialized(const char* caller) const;

private:
    std::string name_;
    bool initialized_ = false;
};

    } // namespace models
} // namespace seqtag


#endif // _SEQ_TAGGER_MODEL
