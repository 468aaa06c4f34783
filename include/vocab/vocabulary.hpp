#ifndef _SEQ_TAGGER_VOCABULARY
#define _SEQ_TAGGER_VOCABULARY

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <filesystem>
#include <torch/torch.h>


namespace fs = std::filesystem;

namespace seqtag{
    namespace vocab{

// id used for unknown strings when the table has no OOV bucket
constexpr int64_t DEFAULT_UNKNOWN_ID = -1;
// string returned for ids outside the table
const std::string DEFAULT_UNKNOWN_STRING = "UNK";


/*
Two way lookup between strings and ids, loaded from a file with one entry per line.
The id of an entry is its line number. With num_oov_buckets = 1 every unknown
string maps to the id `size()` (used for input words). Without buckets unknown
strings map to DEFAULT_UNKNOWN_ID (used for labels).
*/
class vocabulary{
public:
    vocabulary();
    vocabulary(const fs::path& vocabulary_file, int64_t num_oov_buckets = 0);
    ~vocabulary();

    void load(const fs::path& vocabulary_file, int64_t num_oov_buckets = 0);
    bool is_loaded() const {return !id_to_string_.empty();}

    // getters
    int64_t size() const {return static_cast<int64_t>(id_to_string_.size());}
    int64_t size_with_oov() const {return size() + num_oov_buckets_;}
    int64_t num_oov_buckets() const {return num_oov_buckets_;}
    const std::vector<std::string>& get_tokens() const {return id_to_string_;}
    fs::path get_path() const {return vocabulary_file_;}

    // string -> id
    std::optional<int64_t> lookup(const std::string& token) const;
    int64_t lookup_id(const std::string& token) const;
    torch::Tensor lookup_ids(const std::vector<std::string>& tokens) const;

    // id -> string
    const std::string& lookup_string(int64_t id) const;
    std::vector<std::string> lookup_strings(const torch::Tensor& ids) const;
    std::vector<std::vector<std::string>> lookup_batch_strings(const torch::Tensor& ids) const;

private:
    fs::path vocabulary_file_;
    int64_t num_oov_buckets_ = 0;
    std::vector<std::string> id_to_string_;
    std::unordered_map<std::string, int64_t> string_to_id_;
};

    } // namespace vocab
} // namespace seqtag


#endif // _SEQ_TAGGER_VOCABULARY
