#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config.hpp"
#include "document.hpp"
#include "metadata_store.hpp"
#include "vector_index.hpp"

struct ConsistencyReport {
    std::int64_t records{0};
    std::int64_t vectors{0};
    std::int64_t orphan_vectors{0};  // index entries with no matching row
    std::int64_t missing_vectors{0}; // rows with no matching index entry

    bool clean() const { return orphan_vectors == 0 && missing_vectors == 0; }
};

// Common contract for both persistence strategies. search() never throws and
// never returns an empty vector; count() reports 0 on internal failure.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual StoreOutcome store(const VectorRecord& rec) = 0;
    virtual std::vector<std::string> search(const std::vector<float>& query, int k) = 0;
    virtual std::int64_t count() = 0;
    virtual TimePoint get_checkpoint() = 0;
    virtual void set_checkpoint(TimePoint t) = 0;
    virtual ConsistencyReport audit() = 0;
    virtual std::string name() const = 0;
    virtual std::size_t dimension() const = 0;
};

// Flat-file vector index + SQLite metadata. The index is written first; a
// crash or failure before the metadata insert leaves an orphan vector that
// search() skips. Rows link to their vector through index_handle, so rows
// written by DatabaseStorage on the same db are indexed when this opens.
// The checkpoint is kept in the side file and mirrored into app_metadata.
class IndexedStorage : public StorageBackend {
public:
    explicit IndexedStorage(const StorageConfig& cfg);

    StoreOutcome store(const VectorRecord& rec) override;
    std::vector<std::string> search(const std::vector<float>& query, int k) override;
    std::int64_t count() override;
    TimePoint get_checkpoint() override;
    void set_checkpoint(TimePoint t) override;
    ConsistencyReport audit() override;
    std::string name() const override { return "index"; }
    std::size_t dimension() const override { return index_.dimension(); }

private:
    ConsistencyReport audit_locked();
    void reconcile();
    bool linked(const IndexLink& link) const;
    TimePoint read_checkpoint_file();

    std::mutex mtx_;
    std::string checkpoint_path_;
    FlatVectorIndex index_;
    MetadataStore meta_;
};

// SQLite only; vectors live in the row. Search ranks the search_window most
// recent rows by brute force.
class DatabaseStorage : public StorageBackend {
public:
    explicit DatabaseStorage(const StorageConfig& cfg);

    StoreOutcome store(const VectorRecord& rec) override;
    std::vector<std::string> search(const std::vector<float>& query, int k) override;
    std::int64_t count() override;
    TimePoint get_checkpoint() override;
    void set_checkpoint(TimePoint t) override;
    ConsistencyReport audit() override;
    std::string name() const override { return "database"; }
    std::size_t dimension() const override { return dim_; }

private:
    std::mutex mtx_;
    std::size_t dim_;
    int window_;
    MetadataStore meta_;
};

std::unique_ptr<StorageBackend> make_storage(const StorageConfig& cfg);
