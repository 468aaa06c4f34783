#include "models/catalog.hpp"
#include "inputters/word_embedder.hpp"
#include "encoders/rnn_encoder.hpp"
#include "encoders/mean_encoder.hpp"
#include <glog/logging.h>
#include <stdexcept>


namespace seqtag{
    namespace models{

std::shared_ptr<inputters::inputter> make_inputter(const config::modelOptions& options){
    if (options.inputter == "word_embedder"){
        inputters::wordEmbedderOptions embedder_options;
        embedder_options.vocabulary_file_key = options.words_vocabulary_key;
        embedder_options.set_embedding_size(options.embedding_size);
        embedder_options.set_dropout(options.dropout);
        return std::make_shared<inputters::wordEmbedder>(embedder_options);
    }
    LOG(WARNING) << "[catalog/make_inputter]: unknown inputter '" << options.inputter << "'";
    throw std::invalid_argument("unknown inputter: " + options.inputter);
}


std::shared_ptr<encoders::encoder> make_encoder(const config::modelOptions& options){
    if (options.encoder == "rnn"){
        encoders::rnnEncoderOptions encoder_options;
        encoder_options.set_num_layers(options.num_layers);
        encoder_options.set_num_units(options.num_units);
        encoder_options.set_bidirectional(options.bidirectional);
        encoder_options.set_dropout(options.dropout);
        return std::make_shared<encoders::rnnEncoder>(encoder_options);
    }
    if (options.encoder == "mean"){
        return std::make_shared<encoders::meanEncoder>();
    }
    LOG(WARNING) << "[catalog/make_encoder]: unknown encoder '" << options.encoder << "'";
    throw std::invalid_argument("unknown encoder: " + options.encoder);
}


std::shared_ptr<sequenceTagger> make_sequence_tagger(const config::modelOptions& options){
    return std::make_shared<sequenceTagger>(make_inputter(options),
                                            make_encoder(options),
                                            options.tags_vocabulary_key,
                                            options.crf_decoding);
}

    } // namespace models
} // namespace seqtag
