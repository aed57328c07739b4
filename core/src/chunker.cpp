#include "chunker.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<std::string> chunk_words(const std::string& text, int chunk_size, int overlap) {
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (overlap < 0 || overlap >= chunk_size) {
        throw std::invalid_argument("overlap must be in [0, chunk_size), got " + std::to_string(overlap) +
                                    " for chunk_size " + std::to_string(chunk_size));
    }
    std::vector<std::string> chunks;
    auto words = split_words(text);
    if (words.empty()) return chunks;
    if ((int)words.size() <= chunk_size) {
        chunks.push_back(join(words, " "));
        return chunks;
    }
    const int step = chunk_size - overlap;
    for (int i = 0; i < (int)words.size(); i += step) {
        int end = std::min<int>(words.size(), i + chunk_size);
        std::vector<std::string> window(words.begin() + i, words.begin() + end);
        chunks.push_back(join(window, " "));
        if (end == (int)words.size()) break;
    }
    return chunks;
}
