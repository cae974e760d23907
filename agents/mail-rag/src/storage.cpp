#include "../include/storage.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

static const char* kCheckpointKey = "last_email_check";
static const char* kDimensionKey = "embedding_dim";

static std::vector<std::string> no_results() {
    return {kNoResults};
}

// Records the dimension on first use; both backends share the key.
static void check_dimension_key(MetadataStore& meta, std::size_t dim) {
    auto stored = meta.get_meta(kDimensionKey);
    if (!stored) {
        meta.set_meta(kDimensionKey, std::to_string(dim));
    } else if (std::stoul(*stored) != dim) {
        throw DimensionMismatch(dim, std::stoul(*stored));
    }
}

static TimePoint parse_checkpoint(const std::string& text, const std::string& where) {
    auto t = parse_iso8601(text);
    if (!t) {
        spdlog::warn("checkpoint in {} is unreadable, using epoch", where);
        return epoch();
    }
    return *t;
}

// ---------------------------------------------------------------- index backend

IndexedStorage::IndexedStorage(const StorageConfig& cfg)
    : checkpoint_path_(cfg.checkpoint_path),
      index_(cfg.index_path, cfg.dimension),
      meta_(cfg.db_path, cfg.busy_timeout_ms) {
    check_dimension_key(meta_, cfg.dimension);
    reconcile();
    auto report = audit_locked();
    if (!report.clean()) {
        spdlog::warn("index backend: {} orphan vectors, {} rows without vectors ({} records, {} vectors)",
                     report.orphan_vectors, report.missing_vectors, report.records, report.vectors);
    }
}

bool IndexedStorage::linked(const IndexLink& link) const {
    auto h = link.index_handle;
    return h >= 1 && h <= (std::int64_t)index_.size() && index_.labels()[(size_t)(h - 1)] == link.source_id;
}

// Rows without a valid vector (stored by the database backend, or left
// behind by a truncated index file) get their stored embedding appended.
void IndexedStorage::reconcile() {
    std::vector<std::string> pending;
    for (const auto& link : meta_.index_links()) {
        if (linked(link)) continue;
        if (link.index_handle != 0) meta_.set_index_handle(link.source_id, 0);
        pending.push_back(link.source_id);
    }
    int added = 0;
    for (const auto& id : pending) {
        auto row = meta_.find_by_source_id(id);
        if (!row || row->embedding.size() != index_.dimension()) {
            spdlog::warn("index backend: {} has no usable stored embedding, left unindexed", id);
            continue;
        }
        auto handle = index_.add(row->source_id, row->embedding);
        meta_.set_index_handle(row->source_id, handle);
        ++added;
    }
    if (added) spdlog::info("index backend: indexed {} rows from stored embeddings", added);
}

StoreOutcome IndexedStorage::store(const VectorRecord& rec) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (rec.embedding.size() != index_.dimension()) {
        return StoreOutcome::failed(DimensionMismatch(index_.dimension(), rec.embedding.size()).what());
    }
    std::int64_t handle = 0;
    try {
        if (meta_.contains(rec.source_id)) return StoreOutcome::already_exists();
        handle = index_.add(rec.source_id, rec.embedding);
    } catch (const std::exception& e) {
        return StoreOutcome::failed(e.what());
    }
    try {
        MetadataStore::Transaction tx(meta_);
        VectorRecord row = rec;
        row.insertion_sequence = meta_.max_sequence() + 1;
        row.index_handle = handle;
        meta_.insert(row);
        tx.commit();
    } catch (const std::exception& e) {
        spdlog::error("metadata insert for {} failed after index add: orphan vector at handle {}",
                      rec.source_id, handle);
        return StoreOutcome::failed(std::string(e.what()) + "; orphan vector at handle " + std::to_string(handle));
    }
    return StoreOutcome::inserted();
}

std::vector<std::string> IndexedStorage::search(const std::vector<float>& query, int k) {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        if (k <= 0 || index_.size() == 0) return no_results();
        // Rank everything; orphan hits are skipped so a short-k scan could under-fill.
        auto hits = index_.search(query, (int)index_.size());
        std::vector<std::string> out;
        for (const auto& hit : hits) {
            if ((int)out.size() >= k) break;
            auto row = meta_.find_by_source_id(hit.label);
            if (!row || row->index_handle != hit.handle) continue;
            out.push_back(row->summary);
        }
        return out.empty() ? no_results() : out;
    } catch (const std::exception& e) {
        spdlog::error("index search failed: {}", e.what());
        return no_results();
    }
}

std::int64_t IndexedStorage::count() {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        return meta_.count();
    } catch (const std::exception& e) {
        spdlog::error("count failed: {}", e.what());
        return 0;
    }
}

TimePoint IndexedStorage::read_checkpoint_file() {
    std::ifstream f(checkpoint_path_);
    if (!f) return epoch();
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_checkpoint(ss.str(), checkpoint_path_);
}

// The later of the side file and the shared key, so a checkpoint written by
// the database backend on the same db is honoured.
TimePoint IndexedStorage::get_checkpoint() {
    std::lock_guard<std::mutex> lock(mtx_);
    TimePoint t = read_checkpoint_file();
    try {
        if (auto v = meta_.get_meta(kCheckpointKey)) t = std::max(t, parse_checkpoint(*v, kCheckpointKey));
    } catch (const std::exception& e) {
        spdlog::error("checkpoint read failed: {}", e.what());
    }
    return t;
}

void IndexedStorage::set_checkpoint(TimePoint t) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::filesystem::path p(checkpoint_path_);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        f << format_iso8601(t) << "\n";
        f.flush();
        if (!f) throw StoreFailure("cannot write checkpoint file " + tmp.string());
    }
    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) throw StoreFailure("cannot replace checkpoint file " + p.string() + ": " + ec.message());
    meta_.set_meta(kCheckpointKey, format_iso8601(t));
}

ConsistencyReport IndexedStorage::audit() {
    std::lock_guard<std::mutex> lock(mtx_);
    return audit_locked();
}

ConsistencyReport IndexedStorage::audit_locked() {
    ConsistencyReport r;
    auto links = meta_.index_links();
    r.records = (std::int64_t)links.size();
    r.vectors = (std::int64_t)index_.size();
    std::int64_t good = 0;
    for (const auto& link : links) {
        if (linked(link)) ++good;
    }
    r.orphan_vectors = r.vectors - good;
    r.missing_vectors = r.records - good;
    return r;
}

// ------------------------------------------------------------- database backend

DatabaseStorage::DatabaseStorage(const StorageConfig& cfg)
    : dim_(cfg.dimension), window_(cfg.search_window), meta_(cfg.db_path, cfg.busy_timeout_ms) {
    check_dimension_key(meta_, dim_);
}

StoreOutcome DatabaseStorage::store(const VectorRecord& rec) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (rec.embedding.size() != dim_) {
        return StoreOutcome::failed(DimensionMismatch(dim_, rec.embedding.size()).what());
    }
    try {
        MetadataStore::Transaction tx(meta_);
        if (meta_.contains(rec.source_id)) return StoreOutcome::already_exists();
        VectorRecord row = rec;
        row.insertion_sequence = meta_.max_sequence() + 1;
        meta_.insert(row);
        tx.commit();
        return StoreOutcome::inserted();
    } catch (const std::exception& e) {
        return StoreOutcome::failed(e.what());
    }
}

std::vector<std::string> DatabaseStorage::search(const std::vector<float>& query, int k) {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        if (k <= 0) return no_results();
        if (query.size() != dim_) throw DimensionMismatch(dim_, query.size());
        struct Scored {
            float distance;
            std::int64_t seq;
            std::string summary;
        };
        std::vector<Scored> scored;
        for (auto& rec : meta_.recent(window_)) {
            if (rec.embedding.size() != dim_) {
                spdlog::warn("skipping {}: stored embedding has {} dims", rec.source_id, rec.embedding.size());
                continue;
            }
            scored.push_back({l2_squared(query, rec.embedding), rec.insertion_sequence, std::move(rec.summary)});
        }
        auto n = std::min<size_t>((size_t)k, scored.size());
        std::partial_sort(scored.begin(), scored.begin() + n, scored.end(), [](const Scored& a, const Scored& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return a.seq < b.seq;
        });
        std::vector<std::string> out;
        for (size_t i = 0; i < n; ++i) out.push_back(std::move(scored[i].summary));
        return out.empty() ? no_results() : out;
    } catch (const std::exception& e) {
        spdlog::error("database search failed: {}", e.what());
        return no_results();
    }
}

std::int64_t DatabaseStorage::count() {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        return meta_.count();
    } catch (const std::exception& e) {
        spdlog::error("count failed: {}", e.what());
        return 0;
    }
}

TimePoint DatabaseStorage::get_checkpoint() {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        auto v = meta_.get_meta(kCheckpointKey);
        if (!v) return epoch();
        return parse_checkpoint(*v, kCheckpointKey);
    } catch (const std::exception& e) {
        spdlog::error("checkpoint read failed: {}", e.what());
        return epoch();
    }
}

void DatabaseStorage::set_checkpoint(TimePoint t) {
    std::lock_guard<std::mutex> lock(mtx_);
    meta_.set_meta(kCheckpointKey, format_iso8601(t));
}

ConsistencyReport DatabaseStorage::audit() {
    std::lock_guard<std::mutex> lock(mtx_);
    ConsistencyReport r;
    r.records = meta_.count();
    r.vectors = r.records;
    return r;
}

std::unique_ptr<StorageBackend> make_storage(const StorageConfig& cfg) {
    if (cfg.kind == StorageKind::Database) {
        spdlog::info("storage: database backend at {}", cfg.db_path);
        return std::make_unique<DatabaseStorage>(cfg);
    }
    spdlog::info("storage: index backend ({} + {})", cfg.index_path, cfg.db_path);
    return std::make_unique<IndexedStorage>(cfg);
}
