#include "data/dataset.hpp"
#include "utils/my_utils.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>


namespace seqtag{
    namespace data{

textLineDataset::textLineDataset(const fs::path& data_file) :
    data_file_(data_file), lines_(myutils::read_lines(data_file)){
    LOG(INFO) << "[textLineDataset/constructor]: read " << lines_.size()
              << " records from " << data_file_;
}


int64_t Batch::size() const {
    auto it = features.find("length");
    if (it != features.end()){
        return it->second.size(0);
    }
    if (features.empty()){
        return 0;
    }
    return features.begin()->second.size(0);
}


Features padded_batch(const std::vector<Features>& examples, const PaddedShapes& padded_shapes){
    Features batch;
    if (examples.empty()){
        return batch;
    }

    for (const auto& [key, shape] : padded_shapes){
        for (const auto& example : examples){
            if (example.at(key).dim() != static_cast<int64_t>(shape.size())){
                LOG(WARNING) << "[data/padded_batch]: feature '" << key << "' has rank " << example.at(key).dim()
                             << " but its padded shape has rank " << shape.size();
                throw std::invalid_argument("feature rank does not match its padded shape");
            }
        }

        // resolve the dynamic dimensions against the longest example
        std::vector<int64_t> target_shape(shape.size());
        for (size_t d = 0; d < shape.size(); ++d){
            if (shape[d] >= 0){
                target_shape[d] = shape[d];
                continue;
            }
            int64_t longest = 0;
            for (const auto& example : examples){
                longest = std::max<int64_t>(longest, example.at(key).size(d));
            }
            target_shape[d] = longest;
        }

        std::vector<int64_t> batch_shape{static_cast<int64_t>(examples.size())};
        batch_shape.insert(batch_shape.end(), target_shape.begin(), target_shape.end());
        auto batched = torch::zeros(batch_shape, examples.front().at(key).options());

        for (size_t i = 0; i < examples.size(); ++i){
            const auto& value = examples[i].at(key);
            auto destination = batched[i];
            auto source = value;
            for (size_t d = 0; d < target_shape.size(); ++d){
                int64_t num_kept = std::min<int64_t>(value.size(d), target_shape[d]);
                destination = destination.narrow(d, 0, num_kept);
                source = source.narrow(d, 0, num_kept);
            }
            destination.copy_(source);
        }
        batch[key] = batched;
    }
    return batch;
}


std::vector<Batch> make_batches(const std::vector<Example>& examples,
                                size_t batch_size,
                                const PaddedShapes& features_shapes,
                                const PaddedShapes& labels_shapes,
                                const std::string& labels_key){
    if (batch_size == 0){
        throw std::invalid_argument("batch_size must be positive");
    }

    std::vector<Batch> batches;
    for (size_t begin = 0; begin < examples.size(); begin += batch_size){
        size_t end = std::min(examples.size(), begin + batch_size);
        std::vector<Features> features;
        std::vector<Features> labels;
        for (size_t i = begin; i < end; ++i){
            features.push_back(examples[i].features);
            if (!examples[i].labels.empty()){
                labels.push_back(examples[i].labels);
            }
        }

        Batch batch;
        batch.features = padded_batch(features, features_shapes);
        if (!labels.empty()){
            if (labels.size() != features.size()){
                throw std::invalid_argument("either all or none of the examples must have labels");
            }
            batch.labels = padded_batch(labels, labels_shapes).at(labels_key);
        }
        batches.push_back(std::move(batch));
    }
    VLOG(1) << "[data/make_batches]: built " << batches.size() << " batches from "
            << examples.size() << " examples";
    return batches;
}

    } // namespace data
} // namespace seqtag
