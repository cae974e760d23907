#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "document.hpp"

struct IndexLink {
    std::string source_id;
    std::int64_t index_handle{0}; // 0 = no vector index entry
};

class MetadataStore {
public:
    explicit MetadataStore(const std::string& db_path, int busy_timeout_ms = 5000);
    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
    class Transaction {
    public:
        explicit Transaction(MetadataStore& store);
        ~Transaction();
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        void commit();

    private:
        MetadataStore& store_;
        bool done_ {false};
    };

    bool contains(const std::string& source_id);
    std::int64_t insert(const VectorRecord& rec);
    std::optional<VectorRecord> find_by_source_id(const std::string& source_id);
    std::vector<VectorRecord> recent(int limit);
    std::int64_t max_sequence();
    std::int64_t count();

    std::vector<IndexLink> index_links();
    void set_index_handle(const std::string& source_id, std::int64_t handle);

    std::optional<std::string> get_meta(const std::string& key);
    void set_meta(const std::string& key, const std::string& value);

private:
    void init();
    void migrate();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    struct sqlite3_stmt* prepare(const char* sql);
    VectorRecord read_row(struct sqlite3_stmt* st);

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* exists_stmt_ {nullptr};
    struct sqlite3_stmt* by_source_stmt_ {nullptr};
    struct sqlite3_stmt* recent_stmt_ {nullptr};
    struct sqlite3_stmt* max_seq_stmt_ {nullptr};
    struct sqlite3_stmt* count_stmt_ {nullptr};
    struct sqlite3_stmt* links_stmt_ {nullptr};
    struct sqlite3_stmt* set_handle_stmt_ {nullptr};
    struct sqlite3_stmt* get_meta_stmt_ {nullptr};
    struct sqlite3_stmt* set_meta_stmt_ {nullptr};
};
