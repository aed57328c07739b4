#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>

// Stand-in for a hosted model: deterministic digest-based vectors.
struct HostedHashModel {
    std::string model_name{"sentence-transformers/all-MiniLM-L6-v2"};
};

// Remote embeddings endpoint speaking the OpenAI request/response shape.
struct ExternalApiModel {
    std::string api_key;
    std::string model{"text-embedding-3-small"};
    std::string endpoint{"https://api.openai.com/v1/embeddings"};
    long timeout_ms{30000};
};

// Stand-in for an on-disk model: deterministic text-statistics vectors.
struct LocalModel {
    std::string model_path;
};

using EmbeddingModel = std::variant<HostedHashModel, ExternalApiModel, LocalModel>;

enum class RagMode {
    FineTunedOnly,
    FineTunedWithRAG,
    BaseWithRAG,
};

enum class DuplicatePolicy {
    Allow, // every ingestion creates a new document
    Skip,  // same content hash: touch updated_at of the existing row, no new chunks
};

struct RagConfig {
    EmbeddingModel embedding_model{HostedHashModel{}};
    RagMode mode{RagMode::BaseWithRAG};
    int chunk_size{200};
    int chunk_overlap{50};
    int top_k{5};
    float similarity_threshold{0.3f};
    int ingest_batch_size{32};
    DuplicatePolicy duplicate_policy{DuplicatePolicy::Allow};
};

const char* rag_mode_name(RagMode mode);
RagMode parse_rag_mode(const std::string& name);
const char* embedding_backend_name(const EmbeddingModel& model);

// Throws std::invalid_argument describing the first violated rule.
void validate_config(const RagConfig& cfg);

void to_json(nlohmann::json& j, const RagConfig& cfg);
void from_json(const nlohmann::json& j, RagConfig& cfg);

RagConfig load_config_file(const std::filesystem::path& p);
void save_config_file(const std::filesystem::path& p, const RagConfig& cfg);

// Reads RAGDESK_CONFIG when set, otherwise defaults; then fills an empty
// external API key from OPENAI_API_KEY.
RagConfig config_from_env();

// Process-wide configuration with last-writer-wins replacement. Readers get
// an immutable snapshot, so one operation sees one configuration throughout.
class ConfigStore {
public:
    explicit ConfigStore(RagConfig initial = {});

    std::shared_ptr<const RagConfig> snapshot() const;
    std::uint64_t version() const;
    std::uint64_t update(RagConfig cfg);

private:
    mutable std::mutex mtx_;
    std::shared_ptr<const RagConfig> current_;
    std::uint64_t version_{1};
};
