#ifndef _SEQ_TAGGER_WORD_EMBEDDER
#define _SEQ_TAGGER_WORD_EMBEDDER

#include <string>
#include <torch/torch.h>
#include "inputters/inputter.hpp"
#include "vocab/vocabulary.hpp"


namespace seqtag{
    namespace inputters{

struct wordEmbedderOptions{
    std::string vocabulary_file_key = "words_vocabulary";
    int64_t embedding_size = 64;
    double dropout = 0.0;   // applied to the embeddings in training mode only
    bool trainable = true;

    void set_embedding_size(int64_t new_embedding_size){embedding_size = new_embedding_size;}
    void set_dropout(double new_dropout){dropout = new_dropout;}
};


/*
Space separated tokens -> word ids -> embeddings.
Unknown words share one OOV id equal to the vocabulary size.
*/
class wordEmbedder : public inputter{
public:
    explicit wordEmbedder(wordEmbedderOptions options);
    ~wordEmbedder();

    void initialize(const Metadata& metadata) override;
    torch::Tensor get_length(const Features& features) const override;
    Features process(const std::string& record) const override;
    PaddedShapes padded_shapes() const override;
    torch::Tensor transform_data(const Features& features,
                                 modeKey mode,
                                 const fs::path& log_dir) override;
    // the receiver holds a reference to this embedder, which must be owned by a std::shared_ptr
    servingInputReceiver get_serving_input_receiver() const override;
    int64_t output_depth() const override {return options_.embedding_size;}

    // getters
    const vocab::vocabulary& get_vocabulary() const {return vocabulary_;}
    const wordEmbedderOptions& get_options() const {return options_;}
    bool is_initialized() const {return !embedding_.is_empty();}
    fs::path get_metadata_file(const fs::path& log_dir) const;

private:
    Features make_features(const std::vector<std::string>& tokens) const;
    void write_embedding_metadata(const fs::path& log_dir);

private:
    wordEmbedderOptions options_;
    vocab::vocabulary vocabulary_;
    torch::nn::Embedding embedding_{nullptr};
    bool metadata_written_ = false;
};

    } // namespace inputters
} // namespace seqtag


#endif // _SEQ_TAGGER_WORD_EMBEDDER
