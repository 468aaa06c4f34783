#ifndef _SEQ_TAGGER_DATASET
#define _SEQ_TAGGER_DATASET

#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include <torch/torch.h>
#include "utils/tensor_types.hpp"


namespace fs = std::filesystem;

namespace seqtag{
    namespace data{

// one record per line of a text file
class textLineDataset{
public:
    textLineDataset(){};
    textLineDataset(const fs::path& data_file);
    textLineDataset(std::vector<std::string> lines) : lines_(std::move(lines)){}

    size_t size() const {return lines_.size();}
    bool empty() const {return lines_.empty();}
    const std::string& operator[](size_t index) const {return lines_.at(index);}
    const std::vector<std::string>& get_lines() const {return lines_;}
    fs::path get_path() const {return data_file_;}

private:
    fs::path data_file_;
    std::vector<std::string> lines_;
};


// how to read, process and pad one side (features or labels) of the data
struct datasetBuilder{
    textLineDataset dataset;
    std::function<Features(const std::string&)> process_fn;
    std::function<PaddedShapes()> padded_shapes_fn;
};


struct Example{
    Features features;
    Features labels; // empty at inference
};


struct Batch{
    Features features;
    torch::Tensor labels; // undefined at inference
    bool has_labels() const {return labels.defined();}
    int64_t size() const;
};


// stacks examples along a new batch dimension, padding dynamic dimensions with zeros
Features padded_batch(const std::vector<Features>& examples, const PaddedShapes& padded_shapes);

// groups examples into padded batches of at most batch_size examples, keeping their order
std::vector<Batch> make_batches(const std::vector<Example>& examples,
                                size_t batch_size,
                                const PaddedShapes& features_shapes,
                                const PaddedShapes& labels_shapes,
                                const std::string& labels_key = "labels");

    } // namespace data
} // namespace seqtag


#endif // _SEQ_TAGGER_DATASET
