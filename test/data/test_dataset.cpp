#include "data/dataset.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace fs = std::filesystem;
using namespace seqtag;


class datasetTest : public testing::Test{
protected:
    datasetTest(){};

    Features make_example(std::vector<int64_t> ids){
        Features features;
        features["length"] = torch::scalar_tensor(static_cast<int64_t>(ids.size()), torch::kInt64);
        features["ids"] = torch::tensor(ids, torch::kInt64);
        return features;
    }

    PaddedShapes shapes{{"ids", {-1}}, {"length", {}}};
};


TEST_F(datasetTest, reads_one_record_per_line){
    char* project_root_ptr = std::getenv("PROJECT_ROOT");
    ASSERT_TRUE(project_root_ptr) << "PROJECT_ROOT environement varibale not set.";
    fs::path features_path = fs::path(project_root_ptr) / "data" / "corpus" / "train.features.txt";

    data::textLineDataset dataset(features_path);
    ASSERT_EQ(dataset.size(), 4);
    EXPECT_EQ(dataset[0], "john lives in paris");
    EXPECT_EQ(dataset.get_path(), features_path);
}


TEST_F(datasetTest, pads_to_the_longest_example){
    auto batch = data::padded_batch({make_example({4, 5, 6}), make_example({7}), make_example({})}, shapes);

    auto expected_ids = torch::tensor({4, 5, 6,
                                       7, 0, 0,
                                       0, 0, 0}, torch::kInt64).view({3, 3});
    EXPECT_TRUE(torch::equal(batch.at("ids"), expected_ids));
    EXPECT_TRUE(torch::equal(batch.at("length"), torch::tensor({3, 1, 0}, torch::kInt64)));
}


TEST_F(datasetTest, pads_to_a_fixed_size){
    PaddedShapes fixed{{"ids", {5}}};
    auto batch = data::padded_batch({make_example({1, 2})}, fixed);
    EXPECT_EQ(batch.at("ids").sizes().vec(), std::vector<int64_t>({1, 5}));
    EXPECT_EQ(batch.count("length"), 0);
}


TEST_F(datasetTest, rejects_rank_mismatch){
    PaddedShapes wrong{{"ids", {-1, -1}}};
    EXPECT_THROW(data::padded_batch({make_example({1, 2})}, wrong), std::invalid_argument);
}


TEST_F(datasetTest, batches_keep_the_example_order){
    std::vector<data::Example> examples;
    for (int64_t i = 1; i <= 5; ++i){
        data::Example example;
        example.features = make_example(std::vector<int64_t>(i, i));
        example.labels["labels"] = torch::full({i}, i, torch::kInt64);
        examples.push_back(example);
    }

    auto batches = data::make_batches(examples, 2, shapes, PaddedShapes{{"labels", {-1}}});
    ASSERT_EQ(batches.size(), 3);
    EXPECT_EQ(batches[0].size(), 2);
    EXPECT_EQ(batches[2].size(), 1);
    ASSERT_TRUE(batches[1].has_labels());
    EXPECT_TRUE(torch::equal(batches[1].features.at("length"), torch::tensor({3, 4}, torch::kInt64)));
    EXPECT_EQ(batches[1].labels.sizes().vec(), std::vector<int64_t>({2, 4}));
    EXPECT_EQ(batches[1].labels[0][3].item<int64_t>(), 0);
}


TEST_F(datasetTest, batches_without_labels){
    std::vector<data::Example> examples(3);
    for (auto& example : examples){
        example.features = make_example({1});
    }
    auto batches = data::make_batches(examples, 8, shapes, PaddedShapes());
    ASSERT_EQ(batches.size(), 1);
    EXPECT_FALSE(batches[0].has_labels());
    EXPECT_THROW(data::make_batches(examples, 0, shapes, PaddedShapes()), std::invalid_argument);
}
