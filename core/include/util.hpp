#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);
std::string sha256_hex(const std::string& data);
std::string gen_id();
std::string now_rfc3339();
std::string read_text_file(const std::filesystem::path& p);
std::string to_lower(std::string s);

// Whitespace-delimited words in document order.
std::vector<std::string> split_words(const std::string& text);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Embedding blob codec: little-endian IEEE-754 float32, 4 bytes per value.
std::vector<std::uint8_t> encode_embedding(const std::vector<float>& v);
std::vector<float> decode_embedding(const void* data, std::size_t bytes);

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
void l2_normalize(std::vector<float>& v);
