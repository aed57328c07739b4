#include "util.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string gen_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

std::string now_rfc3339() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    snprintf(out, sizeof(out), "%s.%06lldZ", date, (long long)micros);
    return std::string(out);
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) {
        throw std::runtime_error("cannot open file: " + p.string());
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string w;
    while (ss >> w) words.push_back(std::move(w));
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::uint8_t> encode_embedding(const std::vector<float>& v) {
    std::vector<std::uint8_t> out;
    out.reserve(v.size() * 4);
    for (float f : v) {
        std::uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        out.push_back(static_cast<std::uint8_t>(bits & 0xFF));
        out.push_back(static_cast<std::uint8_t>((bits >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((bits >> 16) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((bits >> 24) & 0xFF));
    }
    return out;
}

std::vector<float> decode_embedding(const void* data, std::size_t bytes) {
    // A trailing partial window is dropped.
    const auto* p = static_cast<const std::uint8_t*>(data);
    std::vector<float> out(bytes / 4);
    for (size_t i = 0; i < out.size(); ++i) {
        const std::uint8_t* b = p + i * 4;
        std::uint32_t bits = (std::uint32_t)b[0] | ((std::uint32_t)b[1] << 8) |
                             ((std::uint32_t)b[2] << 16) | ((std::uint32_t)b[3] << 24);
        std::memcpy(&out[i], &bits, sizeof(bits));
    }
    return out;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}

void l2_normalize(std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += (double)x * (double)x;
    double mag = std::sqrt(sum);
    if (mag > 0.0) {
        for (float& x : v) x = (float)(x / mag);
    }
}
