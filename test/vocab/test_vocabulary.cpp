#include "vocab/vocabulary.hpp"
#include "utils/my_utils.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace seqtag;


class vocabularyTest : public testing::Test{
protected:
    vocabularyTest(){};

    fs::path vocab_dir(){
        char* project_root_ptr = std::getenv("PROJECT_ROOT");
        EXPECT_TRUE(project_root_ptr) << "PROJECT_ROOT environement varibale not set.";
        return fs::path(project_root_ptr ? project_root_ptr : ".") / "data" / "vocab";
    }
};


TEST_F(vocabularyTest, size_is_the_line_count){
    fs::path tags_path = vocab_dir() / "tags.txt";
    vocab::vocabulary tags(tags_path);
    EXPECT_EQ(tags.size(), myutils::count_lines(tags_path));
    EXPECT_EQ(tags.size(), 4);
    EXPECT_EQ(tags.size_with_oov(), 4);
}


TEST_F(vocabularyTest, maps_labels_both_ways){
    vocab::vocabulary tags(vocab_dir() / "tags.txt");
    EXPECT_EQ(tags.lookup_id("O"), 0);
    EXPECT_EQ(tags.lookup_id("B-ORG"), 3);
    EXPECT_EQ(tags.lookup_string(2), "B-LOC");

    auto ids = tags.lookup_ids({"B-PER", "O", "B-LOC"});
    EXPECT_TRUE(torch::equal(ids, torch::tensor({1, 0, 2}, torch::kInt64)));
    std::vector<std::string> expected{"B-PER", "O", "B-LOC"};
    EXPECT_EQ(tags.lookup_strings(ids), expected);
}


TEST_F(vocabularyTest, handles_unknown_entries){
    vocab::vocabulary tags(vocab_dir() / "tags.txt");
    EXPECT_FALSE(tags.lookup("B-MISC").has_value());
    EXPECT_EQ(tags.lookup_id("B-MISC"), vocab::DEFAULT_UNKNOWN_ID);
    EXPECT_EQ(tags.lookup_string(4), vocab::DEFAULT_UNKNOWN_STRING);
    EXPECT_EQ(tags.lookup_string(-1), vocab::DEFAULT_UNKNOWN_STRING);
}


TEST_F(vocabularyTest, oov_bucket_follows_the_vocabulary){
    vocab::vocabulary words(vocab_dir() / "words.txt", 1);
    EXPECT_EQ(words.size(), 9);
    EXPECT_EQ(words.size_with_oov(), 10);
    EXPECT_EQ(words.lookup_id("john"), 0);
    EXPECT_EQ(words.lookup_id("bob"), 9);
}


TEST_F(vocabularyTest, decodes_batches){
    vocab::vocabulary tags(vocab_dir() / "tags.txt");
    auto ids = torch::tensor({1, 0, 0, 3}, torch::kInt64).view({2, 2});
    auto labels = tags.lookup_batch_strings(ids);
    ASSERT_EQ(labels.size(), 2);
    EXPECT_EQ(labels[0][0], "B-PER");
    EXPECT_EQ(labels[1][1], "B-ORG");
    EXPECT_THROW(tags.lookup_batch_strings(ids.view({4})), std::invalid_argument);
}


TEST_F(vocabularyTest, rejects_duplicates_and_missing_files){
    fs::path duplicated = fs::temp_directory_path() / "seqtag_duplicated_tags.txt";
    {
        std::ofstream file(duplicated);
        file << "O\nB-PER\nO\n";
    }
    vocab::vocabulary tags;
    EXPECT_THROW(tags.load(duplicated), std::runtime_error);
    EXPECT_FALSE(tags.is_loaded());
    EXPECT_THROW(tags.load(vocab_dir() / "missing.txt"), std::runtime_error);
    fs::remove(duplicated);
}
