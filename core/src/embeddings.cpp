#include "embeddings.hpp"
#include "error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <openssl/sha.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cmath>

using json = nlohmann::json;

std::vector<float> hash_embedding(const std::string& text) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), md);
    // Only the first 24 digest bytes are used, cycled across all dimensions.
    constexpr int kUsedBytes = 24;
    std::vector<float> v(kDeterministicEmbeddingDims);
    for (int i = 0; i < kDeterministicEmbeddingDims; ++i) {
        float value = (md[i % kUsedBytes] / 255.0f) * 2.0f - 1.0f;
        v[i] = value * std::sin((float)i * 0.01f);
    }
    l2_normalize(v);
    return v;
}

std::vector<float> local_embedding(const std::string& text) {
    std::array<int, 256> counts{};
    for (unsigned char c : text) counts[c]++;
    const float len_term = std::sin((float)text.size() / 1000.0f);
    const float words_term = std::cos((float)split_words(text).size() / 100.0f);
    const float pi = 3.14159265358979323846f;

    std::vector<float> v(kDeterministicEmbeddingDims);
    for (int i = 0; i < kDeterministicEmbeddingDims; ++i) {
        float value = len_term + words_term;
        if (i < 256) value += std::sin((float)counts[i] / 10.0f);
        value += std::sin((float)i / (float)kDeterministicEmbeddingDims * pi) * 0.1f;
        v[i] = value;
    }
    l2_normalize(v);
    return v;
}

Embedder::Embedder(HttpPostFn post) : post_(std::move(post)) {}

std::vector<float> Embedder::embed(const std::string& text, const EmbeddingModel& model) const {
    if (auto* h = std::get_if<HostedHashModel>(&model)) {
        spdlog::trace("hash embedding with model {}", h->model_name);
        return hash_embedding(text);
    }
    if (auto* a = std::get_if<ExternalApiModel>(&model)) {
        return embed_remote(text, *a);
    }
    spdlog::trace("local embedding from {}", std::get<LocalModel>(model).model_path);
    return local_embedding(text);
}

std::optional<int> Embedder::dimensions(const EmbeddingModel& model) {
    if (std::holds_alternative<ExternalApiModel>(model)) return std::nullopt;
    return kDeterministicEmbeddingDims;
}

std::vector<float> Embedder::embed_remote(const std::string& text, const ExternalApiModel& m) const {
    json body = {
        {"input", text},
        {"model", m.model}
    };
    HttpRequest req;
    req.url = m.endpoint;
    // Invalid UTF-8 in extracted text is replaced rather than rejected.
    req.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    req.headers.push_back("Authorization: Bearer " + m.api_key);
    req.timeout_ms = m.timeout_ms;

    HttpResponse r;
    try {
        r = post_(req);
    } catch (const std::exception& e) {
        spdlog::error("embedding request to {} failed: {}", m.endpoint, e.what());
        throw EmbeddingError(std::string("embedding request failed: ") + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        spdlog::error("embedding endpoint {} returned status {}", m.endpoint, r.status);
        throw EmbeddingError("embedding failed: status " + std::to_string(r.status));
    }

    json data = json::parse(r.body, nullptr, false);
    if (data.is_discarded()) {
        throw EmbeddingError("embedding response is not valid JSON");
    }
    if (!data.contains("data") || !data["data"].is_array() || data["data"].empty() ||
        !data["data"][0].is_object() || !data["data"][0].contains("embedding") ||
        !data["data"][0]["embedding"].is_array()) {
        throw EmbeddingError("embedding response missing data[0].embedding");
    }
    std::vector<float> vec;
    for (auto& v : data["data"][0]["embedding"]) {
        if (!v.is_number()) throw EmbeddingError("embedding response holds a non-numeric value");
        float f = static_cast<float>(v.get<double>());
        if (!std::isfinite(f)) throw EmbeddingError("embedding response holds a non-finite value");
        vec.push_back(f);
    }
    if (vec.empty()) throw EmbeddingError("embedding response holds an empty vector");
    return vec;
}
