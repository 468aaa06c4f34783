#ifndef _SEQ_TAGGER_CONFIG
#define _SEQ_TAGGER_CONFIG

#include <string>
#include <vector>
#include <istream>
#include <filesystem>
#include <boost/program_options.hpp>
#include "utils/tensor_types.hpp"
#include "models/model.hpp"


namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace seqtag{
    namespace config{

struct modelOptions{
    std::string inputter = "word_embedder";
    std::string encoder = "rnn";          // rnn | mean
    bool crf_decoding = false;
    std::string words_vocabulary_key = "words_vocabulary";
    std::string tags_vocabulary_key = "tags_vocabulary";
    int64_t embedding_size = 64;
    int64_t num_layers = 1;
    int64_t num_units = 128;
    bool bidirectional = true;
    double dropout = 0.0;
};


struct trainOptions{
    size_t batch_size = 32;
    int64_t train_steps = 1000;
    int64_t save_checkpoints_steps = 100;
    int64_t log_every = 50;
    bool shuffle = true;
    uint64_t seed = 1234;
};


struct inferOptions{
    size_t batch_size = 16;
};


struct taggerConfig{
    fs::path model_dir;
    Metadata data;          // every data.* entry of the configuration
    modelOptions model;
    models::Params params;
    trainOptions train;
    inferOptions infer;

    // getters
    std::string get_data(const std::string& key, const std::string& default_value = "") const;
};


// options understood in a configuration file, with their defaults
po::options_description config_file_options();

// parses an INI style configuration, throws std::runtime_error if the file can not be read
taggerConfig load_config(const fs::path& config_file);
taggerConfig load_config(std::istream& config_stream);

    } // namespace config
} // namespace seqtag


#endif // _SEQ_TAGGER_CONFIG
