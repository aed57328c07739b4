#pragma once
#include <string>
#include <vector>

// Overlapping windows of chunk_size words advancing by chunk_size - overlap.
// Throws std::invalid_argument unless 0 <= overlap < chunk_size.
std::vector<std::string> chunk_words(const std::string& text, int chunk_size, int overlap);
