#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "document.hpp"
#include "providers.hpp"
#include "storage.hpp"

using RelevanceFilter = std::function<bool(const Document&)>;

struct IngestOptions {
    TimeWindow window;
    std::vector<std::string> queries; // tried in order until one yields candidates
    RelevanceFilter relevance;        // null accepts everything
    int max_records{20};              // inserted records per run; 0 = no cap
};

struct PipelineConfig {
    std::size_t dimension{1536};
    std::size_t max_summary_chars{4000};
};

enum class IngestStage { Fetching, Filtering, Transforming, Storing, Checkpointing, Done };

const char* to_string(IngestStage stage);

struct IngestionReport {
    int candidates{0};
    int filtered_out{0};
    int inserted{0};
    int duplicates{0};
    int failures{0};
    std::vector<std::string> errors;
    bool truncated{false};  // max_records reached
    bool cancelled{false};
    bool checkpoint_advanced{false};
    TimePoint checkpoint{};
    IngestStage stage{IngestStage::Fetching};
};

class IngestionPipeline {
public:
    IngestionPipeline(StorageBackend& storage,
                      std::shared_ptr<MailSource> source,
                      std::shared_ptr<Embedder> embedder,
                      std::shared_ptr<Summarizer> summarizer,
                      PipelineConfig cfg);

    // Throws FetchFailure if the source is unreachable, IngestionBusy if a
    // run is already active. Per-document failures are counted, not thrown.
    IngestionReport run(const IngestOptions& opts, const std::atomic<bool>* cancel = nullptr);

private:
    std::vector<Document> fetch(const IngestOptions& opts);
    std::string summarize(const Document& doc);
    std::vector<float> embed(const Document& doc, const std::string& summary);

    StorageBackend& storage_;
    std::shared_ptr<MailSource> source_;
    std::shared_ptr<Embedder> embedder_;
    std::shared_ptr<Summarizer> summarizer_;
    PipelineConfig cfg_;
    std::atomic<bool> running_ {false};
};

std::string fallback_summary(const Document& doc);
TimeWindow month_to_date_window(TimePoint now);
RelevanceFilter make_term_filter(std::vector<std::string> terms);
