#include <gtest/gtest.h>
#include "models/sequence_tagger.hpp"
#include "models/losses.hpp"
#include "inputters/word_embedder.hpp"
#include "encoders/mean_encoder.hpp"
#include "encoders/rnn_encoder.hpp"
#include "decoders/crf.hpp"
#include "utils/my_utils.hpp"
#include <filesystem>
#include <sstream>
#include <cmath>

namespace fs = std::filesystem;
using namespace seqtag;


class sequenceTaggerTest : public testing::Test{
protected:
    sequenceTaggerTest(){
        torch::manual_seed(1234);
        char* project_root_ptr = std::getenv("PROJECT_ROOT");
        project_root = fs::path(project_root_ptr ? project_root_ptr : ".");
        metadata["words_vocabulary"] = (project_root / "data" / "vocab" / "words.txt").string();
        metadata["tags_vocabulary"] = (project_root / "data" / "vocab" / "tags.txt").string();
        corpus_dir = project_root / "data" / "corpus";
    };

    std::shared_ptr<models::sequenceTagger> make_tagger(bool crf_decoding){
        inputters::wordEmbedderOptions embedder_options;
        embedder_options.set_embedding_size(8);
        encoders::rnnEncoderOptions encoder_options;
        encoder_options.set_num_units(6);
        return std::make_shared<models::sequenceTagger>(
            std::make_shared<inputters::wordEmbedder>(embedder_options),
            std::make_shared<encoders::rnnEncoder>(encoder_options),
            "tags_vocabulary",
            crf_decoding);
    }

    data::Batch train_batch(const models::sequenceTagger& tagger){
        auto batches = tagger.input_fn(modeKey::PREDICT, 8,
                                       corpus_dir / "train.features.txt",
                                       corpus_dir / "train.labels.txt",
                                       false);
        EXPECT_EQ(batches.size(), 1);
        return batches.front();
    }

    fs::path project_root;
    fs::path corpus_dir;
    Metadata metadata;
    models::Params params;
    runConfig run_config;
};


TEST_F(sequenceTaggerTest, num_labels_is_the_vocabulary_line_count){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);

    EXPECT_EQ(tagger->get_num_labels(), myutils::count_lines(metadata["tags_vocabulary"]));
    EXPECT_EQ(tagger->get_num_labels(), 4);
    EXPECT_EQ(tagger->get_labels_vocabulary_file(), fs::path(metadata["tags_vocabulary"]));
    EXPECT_EQ(tagger->get_generator()->weight.size(0), 4);
    EXPECT_FALSE(tagger->get_transitions().defined());
}


TEST_F(sequenceTaggerTest, crf_decoding_adds_transitions){
    auto tagger = make_tagger(true);
    tagger->initialize(metadata);

    const auto& transitions = tagger->get_transitions();
    ASSERT_TRUE(transitions.defined());
    EXPECT_EQ(transitions.sizes().vec(), std::vector<int64_t>({4, 4}));
    EXPECT_TRUE(transitions.requires_grad());
    EXPECT_LE(transitions.abs().max().item<double>(), std::sqrt(6.0 / 8.0));
    EXPECT_TRUE(tagger->named_parameters().contains("transitions"));
}


TEST_F(sequenceTaggerTest, training_build_has_no_predictions){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);
    auto batch = train_batch(*tagger);

    auto output = tagger->build(batch.features, batch.labels, params, modeKey::TRAIN, run_config);
    EXPECT_FALSE(output.predictions.has_value());
    EXPECT_EQ(output.logits.sizes().vec(), std::vector<int64_t>({4, 4, 4}));
    EXPECT_TRUE(tagger->is_training());
}


TEST_F(sequenceTaggerTest, greedy_predictions_are_the_softmax_argmax){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);
    auto batch = train_batch(*tagger);

    auto output = tagger->build(batch.features, std::nullopt, params, modeKey::PREDICT, run_config);
    ASSERT_TRUE(output.predictions.has_value());
    const auto& predictions = output.predictions.value();
    EXPECT_TRUE(torch::equal(predictions.ids, torch::softmax(output.logits, -1).argmax(-1)));
    EXPECT_TRUE(torch::equal(predictions.length, batch.features.at("length")));
    ASSERT_EQ(predictions.labels.size(), 4);
    EXPECT_EQ(predictions.labels[0][0],
              tagger->get_labels_vocabulary().lookup_string(predictions.ids[0][0].item<int64_t>()));
    EXPECT_FALSE(tagger->is_training());
}


TEST_F(sequenceTaggerTest, crf_predictions_are_the_viterbi_path){
    auto tagger = make_tagger(true);
    tagger->initialize(metadata);
    auto batches = tagger->input_fn(modeKey::PREDICT, 8, corpus_dir / "test.features.txt");
    ASSERT_EQ(batches.size(), 1);
    const auto& batch = batches.front();
    EXPECT_FALSE(batch.has_labels());

    auto output = tagger->build(batch.features, std::nullopt, params, modeKey::PREDICT, run_config);
    ASSERT_TRUE(output.predictions.has_value());
    auto expected = crf::crf_decode(output.logits, tagger->get_transitions(), batch.features.at("length"));
    EXPECT_TRUE(torch::equal(output.predictions->ids, expected.decode_tags));

    auto unbatched = output.predictions->unbatch();
    ASSERT_EQ(unbatched.size(), 3);
    EXPECT_EQ(unbatched[0].length, 4);
    EXPECT_EQ(unbatched[1].length, 5);
    EXPECT_EQ(unbatched[2].length, 1);
}


TEST_F(sequenceTaggerTest, crf_loss_is_the_negative_mean_log_likelihood){
    auto tagger = make_tagger(true);
    tagger->initialize(metadata);
    auto batch = train_batch(*tagger);

    auto output = tagger->build(batch.features, batch.labels, params, modeKey::TRAIN, run_config);
    auto loss = tagger->compute_loss(batch.features, batch.labels, output.logits);
    auto [log_likelihood, transitions] = crf::crf_log_likelihood(output.logits,
                                                                 batch.labels,
                                                                 batch.features.at("length"),
                                                                 tagger->get_transitions());
    EXPECT_NEAR(loss.item<double>(), (-log_likelihood).mean().item<double>(), 1e-5);
    EXPECT_GT(loss.item<double>(), 0.0);

    loss.backward();
    ASSERT_TRUE(tagger->get_transitions().grad().defined());
}


TEST_F(sequenceTaggerTest, greedy_loss_uses_the_given_outputs){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);
    auto batch = train_batch(*tagger);

    auto outputs = torch::randn({4, 4, 4});
    auto loss = tagger->compute_loss(batch.features, batch.labels, outputs);
    auto expected = losses::masked_sequence_loss(outputs, batch.labels, batch.features.at("length"));
    EXPECT_NEAR(loss.item<double>(), expected.item<double>(), 1e-6);
}


TEST_F(sequenceTaggerTest, prints_labels_up_to_the_length){
    auto tagger = make_tagger(false);
    std::ostringstream stream;

    tagger->print_prediction(models::Prediction{2, {"B-PER", "O", "O"}}, &params, &stream);
    tagger->print_prediction(models::Prediction{5, {"B-PER", "O"}}, nullptr, &stream);
    tagger->print_prediction(models::Prediction{0, {"O"}}, nullptr, &stream);
    EXPECT_EQ(stream.str(), "B-PER O\nB-PER O\n\n");
}


TEST_F(sequenceTaggerTest, handles_use_before_initialize){
    auto tagger = make_tagger(false);
    Features features;
    features["ids"] = torch::zeros({1, 1}, torch::kInt64);
    features["length"] = torch::ones({1}, torch::kInt64);

    EXPECT_THROW(tagger->build(features, std::nullopt, params, modeKey::PREDICT, run_config), std::logic_error);
    EXPECT_THROW(tagger->input_fn(modeKey::PREDICT, 8, corpus_dir / "test.features.txt"), std::logic_error);

    tagger->initialize(metadata);
    EXPECT_THROW(tagger->initialize(metadata), std::logic_error);
}


TEST_F(sequenceTaggerTest, handles_missing_labels_vocabulary_key){
    auto tagger = make_tagger(false);
    metadata.erase("tags_vocabulary");
    EXPECT_THROW(tagger->initialize(metadata), std::invalid_argument);
    EXPECT_FALSE(tagger->is_initialized());
}


TEST_F(sequenceTaggerTest, skips_examples_with_invalid_labels){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);

    // line 2 has too few labels and line 3 an unknown label
    auto batches = tagger->input_fn(modeKey::PREDICT, 8,
                                    corpus_dir / "train.features.txt",
                                    corpus_dir / "mismatch.labels.txt",
                                    false);
    ASSERT_EQ(batches.size(), 1);
    EXPECT_EQ(batches[0].size(), 2);
    EXPECT_TRUE(torch::equal(batches[0].labels,
                             torch::tensor({1, 0, 0, 2,
                                            1, 0, 0, 3}, torch::kInt64).view({2, 4})));
}


TEST_F(sequenceTaggerTest, handles_misaligned_data_files){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);
    EXPECT_THROW(tagger->input_fn(modeKey::TRAIN, 8,
                                  corpus_dir / "test.features.txt",
                                  corpus_dir / "train.labels.txt"),
                 std::invalid_argument);
}


TEST_F(sequenceTaggerTest, training_input_is_shuffled_with_the_seed){
    auto tagger = make_tagger(false);
    tagger->initialize(metadata);
    auto first = tagger->input_fn(modeKey::TRAIN, 1,
                                  corpus_dir / "train.features.txt",
                                  corpus_dir / "train.labels.txt",
                                  true, 42);
    auto second = tagger->input_fn(modeKey::TRAIN, 1,
                                   corpus_dir / "train.features.txt",
                                   corpus_dir / "train.labels.txt",
                                   true, 42);
    ASSERT_EQ(first.size(), 4);
    ASSERT_EQ(second.size(), 4);
    for (size_t i = 0; i < first.size(); ++i){
        EXPECT_TRUE(torch::equal(first[i].features.at("ids"), second[i].features.at("ids")));
    }
}
