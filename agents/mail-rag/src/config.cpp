#include "../include/config.hpp"
#include "../include/util.hpp"
#include <stdexcept>

StorageKind parse_storage_kind(const std::string& s) {
    auto v = to_lower(s);
    if (v == "index" || v == "file" || v == "files") return StorageKind::Index;
    if (v == "database" || v == "db" || v == "sql") return StorageKind::Database;
    throw std::invalid_argument("unknown storage backend: " + s);
}

std::string to_string(StorageKind kind) {
    return kind == StorageKind::Index ? "index" : "database";
}

bool is_production_environment() {
    for (const char* key : {"DYNO", "RENDER", "FLY_APP_NAME", "RAILWAY_ENVIRONMENT", "DATABASE_URL"}) {
        if (!getenv_or(key, "").empty()) return true;
    }
    return to_lower(getenv_or("PRODUCTION", "")) == "true";
}

static int env_int(const char* key, int def) {
    auto v = getenv_or(key, "");
    if (v.empty()) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(key) + " is not an integer: " + v);
    }
}

Config load_config_from_env() {
    Config c;
    auto kind = getenv_or("MAILRAG_STORAGE", "");
    c.storage.kind = kind.empty()
        ? (is_production_environment() ? StorageKind::Database : StorageKind::Index)
        : parse_storage_kind(kind);
    auto url = getenv_or("DATABASE_URL", "");
    const std::string sqlite_scheme = "sqlite:///";
    if (url.compare(0, sqlite_scheme.size(), sqlite_scheme) == 0) c.storage.db_path = url.substr(sqlite_scheme.size());
    c.storage.db_path = getenv_or("MAILRAG_DB_PATH", c.storage.db_path);
    c.storage.index_path = getenv_or("MAILRAG_INDEX_PATH", c.storage.index_path);
    c.storage.checkpoint_path = getenv_or("MAILRAG_CHECKPOINT_PATH", c.storage.checkpoint_path);
    c.storage.dimension = (std::size_t)env_int("MAILRAG_DIM", (int)c.storage.dimension);
    c.storage.search_window = env_int("MAILRAG_SEARCH_WINDOW", c.storage.search_window);
    c.storage.busy_timeout_ms = env_int("MAILRAG_BUSY_TIMEOUT_MS", c.storage.busy_timeout_ms);

    c.embed.provider = getenv_or("MAILRAG_EMBEDDER", c.embed.provider);
    c.embed.ollama_url = getenv_or("OLLAMA_URL", c.embed.ollama_url);
    c.embed.embed_model = getenv_or("RAG_EMBED_MODEL", c.embed.embed_model);
    c.llm.ollama_url = c.embed.ollama_url;
    c.llm.llm_model = getenv_or("RAG_LLM_MODEL", c.llm.llm_model);

    c.top_k = env_int("MAILRAG_TOP_K", c.top_k);
    c.max_records = env_int("MAILRAG_MAX_RECORDS", c.max_records);
    c.log_level = getenv_or("MAILRAG_LOG_LEVEL", c.log_level);
    c.log_file = getenv_or("MAILRAG_LOG_FILE", c.log_file);

    if (c.storage.dimension == 0) throw std::invalid_argument("MAILRAG_DIM must be > 0");
    if (c.storage.search_window <= 0) throw std::invalid_argument("MAILRAG_SEARCH_WINDOW must be > 0");
    return c;
}
