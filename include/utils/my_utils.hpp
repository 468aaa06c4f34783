#ifndef MY_UTILS_HPP
#define MY_UTILS_HPP


#include <iostream>
#include <vector>
#include <string>
#include <fstream>
#include <stdint.h>
#include <filesystem>
#include <torch/torch.h>


namespace fs = std::filesystem;



namespace seqtag{
    namespace myutils{
        /*
        Number of lines in a text file. Follows the usual line iteration contract:
        a trailing newline does not start a new line, an unterminated last line
        is still counted, and an empty line before EOF is counted as a line.
        Throws std::runtime_error if the file can not be opened.
        */
        int64_t count_lines(const fs::path& file_path);

        // all lines of a file, without the line terminator (and without a trailing '\r')
        std::vector<std::string> read_lines(const fs::path& file_path);

        // [B] lengths -> [B, max_len] mask with 1 on valid positions
        torch::Tensor sequence_mask(const torch::Tensor& lengths,
                                    int64_t max_len,
                                    torch::ScalarType dtype = torch::kFloat32);
    } //namespace myutils

    namespace stringmanip{
        std::vector<std::string> break_to_words(const std::string& sentence, char word_delimiter);
        std::vector<std::string> break_to_words(const std::string& sentence);
        std::string join(const std::vector<std::string>& words, const std::string& separator = " ");
        void strip_carriage_return(std::string& line);
    } //namespace stringmanip
} //namespace seqtag



#endif // MY_UTILS_HPP
