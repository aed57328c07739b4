#pragma once
#include "config.hpp"
#include "http.hpp"
#include <optional>
#include <string>
#include <vector>

constexpr int kDeterministicEmbeddingDims = 384;

// Digest-derived vector, identical for identical text.
std::vector<float> hash_embedding(const std::string& text);
// Text-statistics vector (length, word count, byte histogram, position).
std::vector<float> local_embedding(const std::string& text);

class Embedder {
public:
    explicit Embedder(HttpPostFn post = http_post_json);

    // Throws EmbeddingError for any failure of the remote backend.
    std::vector<float> embed(const std::string& text, const EmbeddingModel& model) const;

    // Declared dimensionality; unknown until the remote backend answers.
    static std::optional<int> dimensions(const EmbeddingModel& model);

private:
    std::vector<float> embed_remote(const std::string& text, const ExternalApiModel& m) const;

    HttpPostFn post_;
};
