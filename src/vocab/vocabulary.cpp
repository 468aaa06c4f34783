#include "vocab/vocabulary.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <stdexcept>


namespace seqtag{
    namespace vocab{

vocabulary::vocabulary(){
    DLOG(INFO) << "[vocabulary/constructor]: empty instance created";
}


vocabulary::vocabulary(const fs::path& vocabulary_file, int64_t num_oov_buckets){
    load(vocabulary_file, num_oov_buckets);
}


vocabulary::~vocabulary(){}


void vocabulary::load(const fs::path& vocabulary_file, int64_t num_oov_buckets){
    if (num_oov_buckets < 0 || num_oov_buckets > 1){
        throw std::invalid_argument("only 0 or 1 oov bucket is supported");
    }

    // the table size is the line count, read_lines follows the same contract
    int64_t num_lines = myutils::count_lines(vocabulary_file);
    std::vector<std::string> lines = myutils::read_lines(vocabulary_file);
    if (static_cast<int64_t>(lines.size()) != num_lines){
        LOG(WARNING) << "[vocabulary/load]: read " << lines.size() << " entries but "
                     << vocabulary_file << " has " << num_lines << " lines";
        throw std::runtime_error("vocabulary size does not match the line count");
    }

    std::unordered_map<std::string, int64_t> string_to_id;
    for (int64_t i = 0; i < num_lines; ++i){
        auto inserted = string_to_id.emplace(lines[i], i);
        if (!inserted.second){
            LOG(WARNING) << "[vocabulary/load]: duplicate entry '" << lines[i]
                         << "' at line " << i + 1 << " of " << vocabulary_file;
            throw std::runtime_error("duplicate entry in vocabulary file " + vocabulary_file.string());
        }
    }

    vocabulary_file_ = vocabulary_file;
    num_oov_buckets_ = num_oov_buckets;
    id_to_string_ = std::move(lines);
    string_to_id_ = std::move(string_to_id);
    LOG(INFO) << "[vocabulary/load]: loaded " << size() << " entries from " << vocabulary_file_;
}


std::optional<int64_t> vocabulary::lookup(const std::string& token) const {
    auto it = string_to_id_.find(token);
    if (it != string_to_id_.end()){
        return it->second;
    }
    if (num_oov_buckets_ > 0){
        return size();
    }
    return std::nullopt;
}


int64_t vocabulary::lookup_id(const std::string& token) const {
    return lookup(token).value_or(DEFAULT_UNKNOWN_ID);
}


torch::Tensor vocabulary::lookup_ids(const std::vector<std::string>& tokens) const {
    std::vector<int64_t> ids;
    ids.reserve(tokens.size());
    for (const auto& token : tokens){
        ids.push_back(lookup_id(token));
    }
    return torch::tensor(ids, torch::kInt64);
}


const std::string& vocabulary::lookup_string(int64_t id) const {
    if (id < 0 || id >= size()){
        return DEFAULT_UNKNOWN_STRING;
    }
    return id_to_string_[id];
}


std::vector<std::string> vocabulary::lookup_strings(const torch::Tensor& ids) const {
    if (ids.dim() != 1){
        throw std::invalid_argument("lookup_strings expects a 1-D tensor of ids");
    }
    auto ids_cpu = ids.to(torch::kCPU).to(torch::kInt64).contiguous();
    auto accessor = ids_cpu.accessor<int64_t, 1>();
    std::vector<std::string> result;
    result.reserve(ids_cpu.size(0));
    for (int64_t i = 0; i < ids_cpu.size(0); ++i){
        result.push_back(lookup_string(accessor[i]));
    }
    return result;
}


std::vector<std::vector<std::string>> vocabulary::lookup_batch_strings(const torch::Tensor& ids) const {
    if (ids.dim() != 2){
        throw std::invalid_argument("lookup_batch_strings expects a [batch, time] tensor of ids");
    }
    std::vector<std::vector<std::string>> result;
    result.reserve(ids.size(0));
    for (int64_t b = 0; b < ids.size(0); ++b){
        result.push_back(lookup_strings(ids[b]));
    }
    return result;
}

    } // namespace vocab
} // namespace seqtag
