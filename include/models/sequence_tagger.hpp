#ifndef _SEQ_TAGGER_SEQUENCE_TAGGER
#define _SEQ_TAGGER_SEQUENCE_TAGGER

#include <memory>
#include <string>
#include <optional>
#include <torch/torch.h>
#include "models/model.hpp"
#include "inputters/inputter.hpp"
#include "encoders/encoder.hpp"
#include "decoders/greedy_decoder.hpp"
#include "vocab/vocabulary.hpp"


namespace seqtag{
    namespace models{

/*
Assigns one label per input token.

    inputter -> encoder -> generator (dense, one output per label) -> logits

Outside of training the logits are decoded either with a linear chain CRF
(Viterbi over learned label transitions) or position by position (arg-max of
the softmax). The labels vocabulary file is found in the data configuration
under labels_vocabulary_file_key, one label per line.
*/
class sequenceTagger : public modelBase{
public:
    sequenceTagger(std::shared_ptr<inputters::inputter> inputter,
                   std::shared_ptr<encoders::encoder> encoder,
                   std::string labels_vocabulary_file_key,
                   bool crf_decoding = false,
                   std::string name = "seqtagger");
    ~sequenceTagger();

    torch::Tensor compute_loss(const Features& features,
                               const torch::Tensor& labels,
                               const torch::Tensor& outputs) override;

    // writes labels[:length] joined by spaces as one line (std::cout by default)
    void print_prediction(const Prediction& prediction,
                          const Params* params = nullptr,
                          std::ostream* stream = nullptr) const override;

    servingInputReceiver get_serving_input_receiver() const override;

    // getters
    int64_t get_num_labels() const {return num_labels_;}
    bool get_crf_decoding() const {return crf_decoding_;}
    fs::path get_labels_vocabulary_file() const {return labels_vocabulary_file_;}
    const vocab::vocabulary& get_labels_vocabulary() const {return labels_vocabulary_;}
    const torch::Tensor& get_transitions() const {return transitions_;}
    torch::nn::Linear& get_generator() {return generator_;}
    std::shared_ptr<inputters::inputter> get_inputter() const {return inputter_;}
    std::shared_ptr<encoders::encoder> get_encoder() const {return encoder_;}

protected:
    void do_initialize(const Metadata& metadata) override;
    buildOutput do_build(const Features& features,
                         const std::optional<torch::Tensor>& labels,
                         const Params& params,
                         modeKey mode,
                         const runConfig& config) override;

    torch::Tensor get_features_length(const Features& features) const override;
    data::datasetBuilder get_features_builder(const fs::path& features_file) const override;
    data::datasetBuilder get_labels_builder(const fs::path& labels_file) const override;
    bool accept_example(const data::Example& example) const override;

private:
    std::shared_ptr<inputters::inputter> inputter_;
    std::shared_ptr<encoders::encoder> encoder_;
    std::string labels_vocabulary_file_key_;
    bool crf_decoding_;

    // set by do_initialize
    fs::path labels_vocabulary_file_;
    int64_t num_labels_ = 0;
    vocab::vocabulary labels_vocabulary_;
    std::optional<decoders::greedyDecoder> greedy_decoder_;
    torch::nn::Linear generator_{nullptr};
    torch::Tensor transitions_;  // [num_labels, num_labels], only with crf decoding
};

    } // namespace models
} // namespace seqtag


#endif // _SEQ_TAGGER_SEQUENCE_TAGGER
