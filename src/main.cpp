#include <iostream>
#include <cstdlib>
#include <fstream>
#include <string>
#include <memory>
#include <glog/logging.h>
#include <boost/program_options.hpp>
#include "models/catalog.hpp"
#include "runner/runner.hpp"
#include "utils/config.hpp"

namespace po = boost::program_options;
using namespace seqtag;


void init_command_line(int argc, char** argv, po::variables_map* conf){
    po::options_description desc("Sequence tagger");
    desc.add_options()
        ("run_type", po::value<std::string>()->default_value("train"), "what to do [train, eval, infer, serve]")
        ("config,c", po::value<std::string>(), "path to the configuration file")
        ("model_dir,m", po::value<std::string>(), "overrides the model_dir of the configuration")
        ("features_file,f", po::value<std::string>(), "features to tag (infer) or evaluate (eval)")
        ("labels_file,l", po::value<std::string>(), "reference labels (eval)")
        ("predictions_file,o", po::value<std::string>(), "where to write the predictions, stdout by default")
        ("checkpoint_path", po::value<std::string>(), "checkpoint to load instead of the latest one")
        ("log_dir", po::value<std::string>(), "write the logs in this directory instead of stderr")
        ("verbosity,v", po::value<int>()->default_value(0), "verbose logging level")
        ("help,h", "show a list of help information");

    po::positional_options_description positional;
    positional.add("run_type", 1);
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), *conf);
    po::notify(*conf);

    if (conf->count("help")){
        std::cerr << desc << std::endl;
        exit(0);
    }
    if (!conf->count("config")){
        std::cerr << "Please specify --config (-c)" << std::endl << desc << std::endl;
        exit(1);
    }
}


void init_logging(const char* program, const po::variables_map& conf){
    google::InitGoogleLogging(program);
    if (conf.count("log_dir")){
        FLAGS_log_dir = conf["log_dir"].as<std::string>();
        FLAGS_logtostderr = false;
        FLAGS_alsologtostderr = false;
    }
    else{
        FLAGS_logtostderr = true;
    }
    FLAGS_logbufsecs = 0;
    FLAGS_v = conf["verbosity"].as<int>();
}


int run(const po::variables_map& conf){
    const std::string run_type = conf["run_type"].as<std::string>();
    if (!runner::is_run_type(run_type)){
        LOG(ERROR) << "[main]: unknown run type '" << run_type << "'";
        return 1;
    }

    config::taggerConfig tagger_config = config::load_config(conf["config"].as<std::string>());
    if (conf.count("model_dir")){
        tagger_config.model_dir = conf["model_dir"].as<std::string>();
    }

    auto model = models::make_sequence_tagger(tagger_config.model);
    runner::taggerRunner tagger_runner(model, tagger_config);

    if (run_type == "train"){
        tagger_runner.train();
        return 0;
    }

    // every other run type needs trained weights
    fs::path checkpoint_path;
    if (conf.count("checkpoint_path")){
        checkpoint_path = conf["checkpoint_path"].as<std::string>();
    }
    if (!tagger_runner.restore_checkpoint(checkpoint_path)){
        LOG(ERROR) << "[main]: no checkpoint to load in " << tagger_config.model_dir;
        return 1;
    }

    if (run_type == "eval"){
        fs::path features_file = conf.count("features_file") ? conf["features_file"].as<std::string>() : "";
        fs::path labels_file = conf.count("labels_file") ? conf["labels_file"].as<std::string>() : "";
        auto result = tagger_runner.evaluate(features_file, labels_file);
        std::cout << "loss: " << result.loss << "\n" << "accuracy: " << result.accuracy << std::endl;
        return 0;
    }

    std::ofstream predictions_file;
    std::ostream* output = &std::cout;
    if (conf.count("predictions_file")){
        predictions_file.open(conf["predictions_file"].as<std::string>());
        if (!predictions_file.is_open()){
            LOG(ERROR) << "[main]: could not open " << conf["predictions_file"].as<std::string>();
            return 1;
        }
        output = &predictions_file;
    }

    if (run_type == "infer"){
        if (!conf.count("features_file")){
            LOG(ERROR) << "[main]: infer needs --features_file";
            return 1;
        }
        tagger_runner.infer(conf["features_file"].as<std::string>(), *output);
        return 0;
    }
    tagger_runner.serve(std::cin, *output);
    return 0;
}


int main(int argc, char** argv){
    po::variables_map conf;
    try{
        init_command_line(argc, argv, &conf);
    }
    catch (const po::error& e){
        std::cerr << "[main]: " << e.what() << std::endl;
        return 1;
    }
    init_logging(argv[0], conf);

    try{
        return run(conf);
    }
    catch (const std::exception& e){
        LOG(ERROR) << "[main]: " << e.what();
        return 1;
    }
}
