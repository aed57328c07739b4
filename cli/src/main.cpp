#include "config.hpp"
#include "embeddings.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "store.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <optional>

using json = nlohmann::json;

static void usage() {
    std::cerr << "ragdesk usage:\n"
              << "  ingest --file <path> [--title T] [--async]\n"
              << "  query --question \"...\" [--mode fine_tuned_only|fine_tuned_rag|base_rag] [--top-k N] [--threshold F]\n"
              << "  search --query \"...\"\n"
              << "  chat --message \"...\"\n"
              << "  list | history | delete --id <document id>\n"
              << "  config show | config init <path>\n"
              << "common options: --db <dbfile> (RAGDESK_DB_PATH), --config <file> (RAGDESK_CONFIG)\n";
}

struct ConsoleEvents : PipelineEvents {
    void document_processed(const std::string& document_id) override {
        std::cout << "[EVENT] document_processed " << document_id << "\n";
    }
};

static void print_ingest(const IngestResult& r) {
    std::cout << (r.success ? "[OK] " : "[FAILED] ") << r.message << "\n"
              << "  document: " << r.document.id << "\n"
              << "  chunks created: " << r.chunks_created << "\n"
              << "  elapsed: " << r.elapsed_ms << " ms\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    init_logging();
    std::string cmd = argv[1];

    std::string db = getenv_or("RAGDESK_DB_PATH", "./data/ragdesk.db");
    std::string config_path = getenv_or("RAGDESK_CONFIG", "");
    std::string file, title, question, id, mode, sub, target;
    std::optional<int> top_k;
    std::optional<float> threshold;
    bool async = false;
    try {
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--db" && i + 1 < argc) db = argv[++i];
            else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
            else if (a == "--file" && i + 1 < argc) file = argv[++i];
            else if (a == "--title" && i + 1 < argc) title = argv[++i];
            else if ((a == "--question" || a == "--query" || a == "--message") && i + 1 < argc) question = argv[++i];
            else if (a == "--id" && i + 1 < argc) id = argv[++i];
            else if (a == "--mode" && i + 1 < argc) mode = argv[++i];
            else if (a == "--top-k" && i + 1 < argc) top_k = std::stoi(argv[++i]);
            else if (a == "--threshold" && i + 1 < argc) threshold = std::stof(argv[++i]);
            else if (a == "--async") async = true;
            else if (sub.empty() && a.rfind("--", 0) != 0) sub = a;
            else if (target.empty() && a.rfind("--", 0) != 0) target = a;
            else { usage(); return 2; }
        }

        ConfigStore configs(config_path.empty() ? config_from_env() : load_config_file(config_path));
        if (top_k || threshold || !mode.empty()) {
            RagConfig c = *configs.snapshot();
            if (top_k) c.top_k = *top_k;
            if (threshold) c.similarity_threshold = *threshold;
            if (!mode.empty()) c.mode = parse_rag_mode(mode);
            configs.update(std::move(c));
        }
        const auto cfg = configs.snapshot();

        if (cmd == "config") {
            if (sub == "show") {
                std::cout << json(*cfg).dump(2) << "\n";
                return 0;
            }
            if (sub == "init" && !target.empty()) {
                save_config_file(target, RagConfig{});
                std::cout << "[OK] Wrote default config to " << target << "\n";
                return 0;
            }
            usage();
            return 2;
        }

        auto db_dir = std::filesystem::path(db).parent_path();
        if (!db_dir.empty()) std::filesystem::create_directories(db_dir);
        RagStore store(db);
        Embedder embedder;
        ConsoleEvents events;
        RagPipeline pipeline(store, embedder, &events);

        if (cmd == "ingest") {
            if (file.empty()) { usage(); return 2; }
            std::optional<std::string> t;
            if (!title.empty()) t = title;
            if (async) {
                auto ticket = pipeline.ingest_async(file, t, *cfg);
                std::cout << "[OK] Document stored: " << ticket.document.id << " (" << ticket.document.title
                          << "), processing chunks...\n";
                auto r = ticket.result.get();
                print_ingest(r);
                return r.success ? 0 : 1;
            }
            auto r = pipeline.ingest(file, t, *cfg);
            print_ingest(r);
            return r.success ? 0 : 1;
        } else if (cmd == "query") {
            if (question.empty()) { usage(); return 2; }
            auto res = pipeline.query(question, cfg->mode, *cfg);
            std::cout << "\n==== Answer (" << rag_mode_name(res.mode_used) << ", " << res.elapsed_ms << " ms) ====\n\n"
                      << res.answer << "\n\n";
            std::cout << "==== Retrieved context ====\n";
            int i = 1;
            for (auto& r : res.retrieved_context) {
                std::cout << "[" << i++ << "] " << r.document_title << " - " << r.source_info
                          << " (score " << r.similarity_score << ")\n";
            }
            return 0;
        } else if (cmd == "search") {
            if (question.empty()) { usage(); return 2; }
            int i = 1;
            for (auto& m : pipeline.search_documents(question, *cfg)) {
                std::cout << "[" << i++ << "] " << m.document.title << " (" << m.document.id << ") score "
                          << m.similarity_score << ", " << m.relevant_chunks.size() << " chunk(s)\n";
            }
            return 0;
        } else if (cmd == "chat") {
            if (question.empty()) { usage(); return 2; }
            auto res = pipeline.chat(question, *cfg);
            std::cout << res.message.content << "\n";
            return 0;
        } else if (cmd == "history") {
            for (auto& m : pipeline.chat_history()) {
                std::cout << m.created_at << " [" << m.role << "] " << m.content << "\n";
            }
            return 0;
        } else if (cmd == "list") {
            for (auto& d : pipeline.list_documents()) {
                std::cout << d.id << "  " << d.title << "  " << d.file_type << "  "
                          << store.count_chunks(d.id) << " chunk(s)  " << d.created_at << "\n";
            }
            return 0;
        } else if (cmd == "delete") {
            if (id.empty()) { usage(); return 2; }
            if (!pipeline.delete_document(id)) {
                std::cerr << "[ERROR] No such document: " << id << "\n";
                return 1;
            }
            std::cout << "[OK] Deleted " << id << "\n";
            return 0;
        } else {
            usage();
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
