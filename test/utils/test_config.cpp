#include "utils/config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;
using namespace seqtag;


class configTest : public testing::Test{
protected:
    configTest(){};
};


TEST_F(configTest, collects_every_data_entry){
    std::istringstream config_stream(
        "model_dir = run/test\n"
        "[data]\n"
        "words_vocabulary = data/vocab/words.txt\n"
        "tags_vocabulary = data/vocab/tags.txt\n"
        "custom_labels = data/vocab/custom.txt\n");
    auto config = config::load_config(config_stream);

    EXPECT_EQ(config.model_dir, fs::path("run/test"));
    ASSERT_EQ(config.data.size(), 3);
    EXPECT_EQ(config.get_data("words_vocabulary"), "data/vocab/words.txt");
    EXPECT_EQ(config.get_data("custom_labels"), "data/vocab/custom.txt");
    EXPECT_EQ(config.get_data("missing", "none"), "none");
}


TEST_F(configTest, uses_defaults_for_missing_sections){
    std::istringstream config_stream("[data]\ntags_vocabulary = tags.txt\n");
    auto config = config::load_config(config_stream);

    EXPECT_TRUE(config.model_dir.empty());
    EXPECT_EQ(config.model.encoder, "rnn");
    EXPECT_FALSE(config.model.crf_decoding);
    EXPECT_EQ(config.model.tags_vocabulary_key, "tags_vocabulary");
    EXPECT_EQ(config.params.optimizer, "adam");
    EXPECT_DOUBLE_EQ(config.params.learning_rate, 0.001);
    EXPECT_EQ(config.train.batch_size, 32u);
    EXPECT_EQ(config.infer.batch_size, 16u);
}


TEST_F(configTest, reads_model_and_training_sections){
    std::istringstream config_stream(
        "[model]\n"
        "encoder = mean\n"
        "crf_decoding = true\n"
        "embedding_size = 16\n"
        "bidirectional = false\n"
        "[params]\n"
        "optimizer = sgd\n"
        "learning_rate = 0.5\n"
        "[train]\n"
        "train_steps = 7\n"
        "shuffle = false\n");
    auto config = config::load_config(config_stream);

    EXPECT_EQ(config.model.encoder, "mean");
    EXPECT_TRUE(config.model.crf_decoding);
    EXPECT_EQ(config.model.embedding_size, 16);
    EXPECT_FALSE(config.model.bidirectional);
    EXPECT_EQ(config.params.optimizer, "sgd");
    EXPECT_DOUBLE_EQ(config.params.learning_rate, 0.5);
    EXPECT_EQ(config.train.train_steps, 7);
    EXPECT_FALSE(config.train.shuffle);
}


TEST_F(configTest, reads_the_shipped_configuration){
    char* project_root_ptr = std::getenv("PROJECT_ROOT");
    ASSERT_TRUE(project_root_ptr) << "PROJECT_ROOT environement varibale not set.";
    fs::path config_path = fs::path(project_root_ptr) / "data" / "config" / "tagger.ini";

    auto config = config::load_config(config_path);
    EXPECT_TRUE(config.model.crf_decoding);
    EXPECT_EQ(config.get_data("tags_vocabulary"), "data/vocab/tags.txt");
    EXPECT_EQ(config.train.batch_size, 2u);
}


TEST_F(configTest, handles_missing_config_file){
    EXPECT_THROW(config::load_config(fs::path("does/not/exist.ini")), std::runtime_error);
}


TEST_F(configTest, rejects_malformed_values){
    std::istringstream config_stream("[train]\ntrain_steps = many\n");
    EXPECT_THROW(config::load_config(config_stream), po::error);
}
