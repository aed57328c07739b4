#include "config.hpp"
#include "error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

const char* rag_mode_name(RagMode mode) {
    switch (mode) {
        case RagMode::FineTunedOnly: return "fine_tuned_only";
        case RagMode::FineTunedWithRAG: return "fine_tuned_rag";
        case RagMode::BaseWithRAG: return "base_rag";
    }
    return "base_rag";
}

RagMode parse_rag_mode(const std::string& name) {
    if (name == "fine_tuned_only") return RagMode::FineTunedOnly;
    if (name == "fine_tuned_rag") return RagMode::FineTunedWithRAG;
    if (name == "base_rag") return RagMode::BaseWithRAG;
    throw std::invalid_argument("unknown rag mode: " + name);
}

const char* embedding_backend_name(const EmbeddingModel& model) {
    switch (model.index()) {
        case 0: return "huggingface";
        case 1: return "openai";
        default: return "local";
    }
}

void validate_config(const RagConfig& cfg) {
    if (cfg.chunk_size <= 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (cfg.chunk_overlap < 0 || cfg.chunk_overlap >= cfg.chunk_size) {
        throw std::invalid_argument("chunk_overlap must be in [0, chunk_size), got " +
                                    std::to_string(cfg.chunk_overlap) + " for chunk_size " +
                                    std::to_string(cfg.chunk_size));
    }
    if (cfg.top_k < 0) {
        throw std::invalid_argument("top_k must not be negative");
    }
    if (cfg.ingest_batch_size <= 0) {
        throw std::invalid_argument("ingest_batch_size must be positive");
    }
    if (auto* api = std::get_if<ExternalApiModel>(&cfg.embedding_model)) {
        if (api->endpoint.empty()) throw std::invalid_argument("openai endpoint must not be empty");
        if (api->model.empty()) throw std::invalid_argument("openai model must not be empty");
    }
}

static json embedding_model_to_json(const EmbeddingModel& model) {
    if (auto* h = std::get_if<HostedHashModel>(&model)) {
        return json{{"huggingface", {{"model_name", h->model_name}}}};
    }
    if (auto* a = std::get_if<ExternalApiModel>(&model)) {
        return json{{"openai", {
            {"api_key", a->api_key},
            {"model", a->model},
            {"endpoint", a->endpoint},
            {"timeout_ms", a->timeout_ms}
        }}};
    }
    const auto& l = std::get<LocalModel>(model);
    return json{{"local", {{"model_path", l.model_path}}}};
}

static EmbeddingModel embedding_model_from_json(const json& j) {
    if (!j.is_object() || j.size() != 1) {
        throw ConfigError("embedding_model must be an object with exactly one backend key");
    }
    const auto& tag = j.begin().key();
    const auto& body = j.begin().value();
    if (tag == "huggingface") {
        HostedHashModel m;
        m.model_name = body.value("model_name", m.model_name);
        return m;
    }
    if (tag == "openai") {
        ExternalApiModel m;
        m.api_key = body.value("api_key", m.api_key);
        m.model = body.value("model", m.model);
        m.endpoint = body.value("endpoint", m.endpoint);
        m.timeout_ms = body.value("timeout_ms", m.timeout_ms);
        return m;
    }
    if (tag == "local") {
        LocalModel m;
        m.model_path = body.value("model_path", m.model_path);
        return m;
    }
    throw ConfigError("unknown embedding backend: " + tag);
}

void to_json(json& j, const RagConfig& cfg) {
    j = json{
        {"embedding_model", embedding_model_to_json(cfg.embedding_model)},
        {"mode", rag_mode_name(cfg.mode)},
        {"chunk_size", cfg.chunk_size},
        {"chunk_overlap", cfg.chunk_overlap},
        {"top_k", cfg.top_k},
        {"similarity_threshold", cfg.similarity_threshold},
        {"ingest_batch_size", cfg.ingest_batch_size},
        {"duplicate_policy", cfg.duplicate_policy == DuplicatePolicy::Skip ? "skip" : "allow"}
    };
}

void from_json(const json& j, RagConfig& cfg) {
    RagConfig out;
    if (j.contains("embedding_model")) out.embedding_model = embedding_model_from_json(j.at("embedding_model"));
    if (j.contains("mode")) {
        try {
            out.mode = parse_rag_mode(j.at("mode").get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }
    out.chunk_size = j.value("chunk_size", out.chunk_size);
    out.chunk_overlap = j.value("chunk_overlap", out.chunk_overlap);
    out.top_k = j.value("top_k", out.top_k);
    out.similarity_threshold = j.value("similarity_threshold", out.similarity_threshold);
    out.ingest_batch_size = j.value("ingest_batch_size", out.ingest_batch_size);
    std::string policy = j.value("duplicate_policy", std::string("allow"));
    if (policy == "skip") out.duplicate_policy = DuplicatePolicy::Skip;
    else if (policy == "allow") out.duplicate_policy = DuplicatePolicy::Allow;
    else throw ConfigError("unknown duplicate_policy: " + policy);
    cfg = std::move(out);
}

RagConfig load_config_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) throw ConfigError("cannot open config file: " + p.string());
    RagConfig cfg;
    try {
        json j = json::parse(f);
        cfg = j.get<RagConfig>();
    } catch (const json::exception& e) {
        throw ConfigError("malformed config " + p.string() + ": " + e.what());
    }
    try {
        validate_config(cfg);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("invalid config " + p.string() + ": " + e.what());
    }
    return cfg;
}

void save_config_file(const std::filesystem::path& p, const RagConfig& cfg) {
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::trunc);
    if (!f) throw ConfigError("cannot write config file: " + p.string());
    f << json(cfg).dump(2) << "\n";
}

RagConfig config_from_env() {
    RagConfig cfg;
    std::string path = getenv_or("RAGDESK_CONFIG", "");
    if (!path.empty()) {
        cfg = load_config_file(path);
        spdlog::debug("loaded config from {}", path);
    }
    if (auto* api = std::get_if<ExternalApiModel>(&cfg.embedding_model)) {
        if (api->api_key.empty()) api->api_key = getenv_or("OPENAI_API_KEY", "");
    }
    return cfg;
}

ConfigStore::ConfigStore(RagConfig initial)
    : current_(std::make_shared<const RagConfig>(std::move(initial))) {}

std::shared_ptr<const RagConfig> ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

std::uint64_t ConfigStore::version() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return version_;
}

std::uint64_t ConfigStore::update(RagConfig cfg) {
    validate_config(cfg);
    auto next = std::make_shared<const RagConfig>(std::move(cfg));
    std::lock_guard<std::mutex> lock(mtx_);
    current_ = std::move(next);
    return ++version_;
}
