#pragma once
#include <cstddef>
#include <string>

enum class StorageKind { Index, Database };

StorageKind parse_storage_kind(const std::string& s);
std::string to_string(StorageKind kind);

struct StorageConfig {
    StorageKind kind{StorageKind::Index};
    std::string db_path{"./data/mail_rag.db"};
    std::string index_path{"./data/index_email.index"};
    std::string checkpoint_path{"./data/last_checked.txt"}; // index backend only
    std::size_t dimension{1536};
    int search_window{100}; // database backend scans this many most recent rows
    int busy_timeout_ms{5000}; // wait for other SQLite writers before failing
};

struct EmbedConfig {
    std::string provider{"ollama"}; // "ollama" | "hash"
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"bge-m3"};
    int timeout_ms{120000};
    bool normalize{true}; // unit-length L2 normalization of returned vectors
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{240000};
    bool summarize{true};
};

struct Config {
    StorageConfig storage;
    EmbedConfig embed;
    LlmConfig llm;
    int top_k{25};
    int max_records{20};
    std::size_t max_summary_chars{4000};
    std::string log_level{"info"};
    std::string log_file;
};

// True when the environment looks like a hosted deployment.
bool is_production_environment();

Config load_config_from_env();
