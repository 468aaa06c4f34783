#include <fstream>
#include <iostream>
#include <stdint.h>
#include <vector>
#include <utils/my_utils.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <string>
#include <stdexcept>



namespace seqtag {
    namespace myutils{

        int64_t count_lines(const fs::path& file_path){
            std::ifstream file(file_path);
            if (!file.is_open()){
                LOG(WARNING) << "[myutils/count_lines]: failed to open " << file_path;
                throw std::runtime_error("could not open file: " + file_path.string());
            }

            int64_t num_lines = 0;
            std::string line;
            while (std::getline(file, line)){
                ++num_lines;
            }
            VLOG(2) << "[myutils/count_lines]: " << file_path << " has " << num_lines << " lines";
            return num_lines;
        }


        std::vector<std::string> read_lines(const fs::path& file_path){
            std::ifstream file(file_path);
            if (!file.is_open()){
                LOG(WARNING) << "[myutils/read_lines]: failed to open " << file_path;
                throw std::runtime_error("could not open file: " + file_path.string());
            }

            std::vector<std::string> lines;
            std::string line;
            while (std::getline(file, line)){
                stringmanip::strip_carriage_return(line);
                lines.push_back(std::move(line));
            }
            return lines;
        }


        torch::Tensor sequence_mask(const torch::Tensor& lengths,
                                    int64_t max_len,
                                    torch::ScalarType dtype){
            auto steps = torch::arange(max_len, torch::TensorOptions()
                                                    .dtype(torch::kInt64)
                                                    .device(lengths.device()));
            // [1, T] < [B, 1] -> [B, T]
            auto mask = steps.unsqueeze(0) < lengths.to(torch::kInt64).unsqueeze(1);
            return mask.to(dtype);
        }

    } // namespace myutils

    namespace stringmanip{
        std::vector<std::string> break_to_words(const std::string& sentence, const char word_delimiter){
            std::vector<std::string> result;
            std::string word;
            for (const auto& letter : sentence){
                if (letter != word_delimiter){
                    word += letter;
                    continue;
                }
                // consecutive delimiters do not produce empty words
                if (!word.empty()){
                    result.push_back(word);
                    word.clear();
                }
            } // end for(
            if (!word.empty()){
                result.push_back(word);
            }
            return result;
        }

        std::vector<std::string> break_to_words(const std::string& sentence){
            return break_to_words(sentence, ' ');  // use empty space if no delimiter is set
        }

        std::string join(const std::vector<std::string>& words, const std::string& separator){
            std::string result;
            for (size_t i = 0; i < words.size(); ++i){
                if (i > 0){
                    result += separator;
                }
                result += words[i];
            }
            return result;
        }

        void strip_carriage_return(std::string& line){
            if (!line.empty() && line.back() == '\r'){
                line.pop_back();
            }
        }
    } // stringmanip

} //namespace seqtag
