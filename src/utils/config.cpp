#include "utils/config.hpp"
#include <glog/logging.h>
#include <fstream>
#include <stdexcept>


namespace seqtag{
    namespace config{

namespace {
const std::string DATA_SECTION_PREFIX = "data.";
}


std::string taggerConfig::get_data(const std::string& key, const std::string& default_value) const {
    auto it = data.find(key);
    return it == data.end() ? default_value : it->second;
}


po::options_description config_file_options(){
    po::options_description desc("Sequence tagger configuration");
    desc.add_options()
        ("model_dir", po::value<std::string>(), "directory of the checkpoints and auxiliary files")
        ("model.inputter", po::value<std::string>()->default_value("word_embedder"), "input layer [word_embedder]")
        ("model.encoder", po::value<std::string>()->default_value("rnn"), "encoder [rnn, mean]")
        ("model.crf_decoding", po::value<bool>()->default_value(false), "decode with a linear chain CRF")
        ("model.words_vocabulary_key", po::value<std::string>()->default_value("words_vocabulary"), "data key of the words vocabulary")
        ("model.tags_vocabulary_key", po::value<std::string>()->default_value("tags_vocabulary"), "data key of the labels vocabulary")
        ("model.embedding_size", po::value<int64_t>()->default_value(64), "word embedding size")
        ("model.num_layers", po::value<int64_t>()->default_value(1), "number of encoder layers")
        ("model.num_units", po::value<int64_t>()->default_value(128), "encoder output depth")
        ("model.bidirectional", po::value<bool>()->default_value(true), "bidirectional encoder")
        ("model.dropout", po::value<double>()->default_value(0.0), "dropout rate")
        ("params.optimizer", po::value<std::string>()->default_value("adam"), "optimizer [adam, sgd]")
        ("params.learning_rate", po::value<double>()->default_value(0.001), "learning rate")
        ("params.clip_gradients", po::value<double>()->default_value(0.0), "max gradient norm, 0 to disable")
        ("train.batch_size", po::value<size_t>()->default_value(32), "training batch size")
        ("train.train_steps", po::value<int64_t>()->default_value(1000), "number of training steps")
        ("train.save_checkpoints_steps", po::value<int64_t>()->default_value(100), "save a checkpoint every N steps")
        ("train.log_every", po::value<int64_t>()->default_value(50), "log the loss every N steps")
        ("train.shuffle", po::value<bool>()->default_value(true), "shuffle the training examples")
        ("train.seed", po::value<uint64_t>()->default_value(1234), "random seed")
        ("infer.batch_size", po::value<size_t>()->default_value(16), "inference batch size");
    return desc;
}


taggerConfig load_config(std::istream& config_stream){
    // data.* keys are free form, they are collected from the unregistered options
    auto parsed = po::parse_config_file(config_stream, config_file_options(), /*allow_unregistered=*/true);
    po::variables_map variables;
    po::store(parsed, variables);
    po::notify(variables);

    taggerConfig config;
    if (variables.count("model_dir")){
        config.model_dir = variables["model_dir"].as<std::string>();
    }
    for (const auto& option : parsed.options){
        if (option.string_key.rfind(DATA_SECTION_PREFIX, 0) != 0 || option.value.empty()){
            continue;
        }
        config.data[option.string_key.substr(DATA_SECTION_PREFIX.size())] = option.value.front();
    }

    config.model.inputter = variables["model.inputter"].as<std::string>();
    config.model.encoder = variables["model.encoder"].as<std::string>();
    config.model.crf_decoding = variables["model.crf_decoding"].as<bool>();
    config.model.words_vocabulary_key = variables["model.words_vocabulary_key"].as<std::string>();
    config.model.tags_vocabulary_key = variables["model.tags_vocabulary_key"].as<std::string>();
    config.model.embedding_size = variables["model.embedding_size"].as<int64_t>();
    config.model.num_layers = variables["model.num_layers"].as<int64_t>();
    config.model.num_units = variables["model.num_units"].as<int64_t>();
    config.model.bidirectional = variables["model.bidirectional"].as<bool>();
    config.model.dropout = variables["model.dropout"].as<double>();

    config.params.set_optimizer(variables["params.optimizer"].as<std::string>());
    config.params.set_learning_rate(variables["params.learning_rate"].as<double>());
    config.params.clip_gradients = variables["params.clip_gradients"].as<double>();

    config.train.batch_size = variables["train.batch_size"].as<size_t>();
    config.train.train_steps = variables["train.train_steps"].as<int64_t>();
    config.train.save_checkpoints_steps = variables["train.save_checkpoints_steps"].as<int64_t>();
    config.train.log_every = variables["train.log_every"].as<int64_t>();
    config.train.shuffle = variables["train.shuffle"].as<bool>();
    config.train.seed = variables["train.seed"].as<uint64_t>();

    config.infer.batch_size = variables["infer.batch_size"].as<size_t>();

    LOG(INFO) << "[config/load_config]: " << config.data.size() << " data entries, encoder: "
              << config.model.encoder << ", crf decoding: " << std::boolalpha << config.model.crf_decoding;
    return config;
}


taggerConfig load_config(const fs::path& config_file){
    std::ifstream config_stream(config_file);
    if (!config_stream.is_open()){
        LOG(WARNING) << "[config/load_config]: failed to open " << config_file;
        throw std::runtime_error("could not open configuration file: " + config_file.string());
    }
    taggerConfig config = load_config(config_stream);
    VLOG(1) << "[config/load_config]: read " << config_file;
    return config;
}

    } // namespace config
} // namespace seqtag
