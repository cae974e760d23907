#include "../include/ingest.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <ctime>

const char* to_string(IngestStage stage) {
    switch (stage) {
        case IngestStage::Fetching: return "fetching";
        case IngestStage::Filtering: return "filtering";
        case IngestStage::Transforming: return "transforming";
        case IngestStage::Storing: return "storing";
        case IngestStage::Checkpointing: return "checkpointing";
        case IngestStage::Done: return "done";
    }
    return "unknown";
}

namespace {
struct RunGuard {
    std::atomic<bool>& flag;
    explicit RunGuard(std::atomic<bool>& f) : flag(f) {
        bool expected = false;
        if (!flag.compare_exchange_strong(expected, true)) throw IngestionBusy();
    }
    ~RunGuard() { flag = false; }
};
}

IngestionPipeline::IngestionPipeline(StorageBackend& storage,
                                     std::shared_ptr<MailSource> source,
                                     std::shared_ptr<Embedder> embedder,
                                     std::shared_ptr<Summarizer> summarizer,
                                     PipelineConfig cfg)
    : storage_(storage), source_(std::move(source)), embedder_(std::move(embedder)),
      summarizer_(std::move(summarizer)), cfg_(cfg) {
    if (!source_) throw std::invalid_argument("IngestionPipeline: mail source is required");
    if (!embedder_) throw std::invalid_argument("IngestionPipeline: embedder is required");
    if (cfg_.dimension != storage_.dimension()) throw DimensionMismatch(storage_.dimension(), cfg_.dimension);
}

std::vector<Document> IngestionPipeline::fetch(const IngestOptions& opts) {
    std::vector<std::string> queries = opts.queries.empty() ? std::vector<std::string>{""} : opts.queries;
    for (const auto& q : queries) {
        std::vector<Document> found;
        try {
            found = source_->list_candidates(opts.window, q);
        } catch (const FetchFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw FetchFailure(std::string("mail source unreachable: ") + e.what());
        }
        if (!found.empty()) {
            spdlog::info("ingest: {} candidates for query '{}'", found.size(), q);
            return found;
        }
        spdlog::info("ingest: no candidates for query '{}'", q);
    }
    return {};
}

std::string IngestionPipeline::summarize(const Document& doc) {
    if (summarizer_) {
        try {
            if (auto s = summarizer_->summarize(doc)) {
                if (!s->empty()) return truncate_utf8(*s, cfg_.max_summary_chars);
            }
            spdlog::warn("summary for {} came back empty, using fallback", doc.source_id);
        } catch (const std::exception& e) {
            spdlog::warn("summary for {} failed ({}), using fallback", doc.source_id, e.what());
        }
    }
    return truncate_utf8(fallback_summary(doc), cfg_.max_summary_chars);
}

std::vector<float> IngestionPipeline::embed(const Document& doc, const std::string& summary) {
    std::vector<float> vec;
    try {
        vec = embedder_->embed(summary);
    } catch (const std::exception& e) {
        throw TransformFailure("embedding " + doc.source_id + " failed: " + e.what());
    }
    if (vec.size() != cfg_.dimension) {
        throw TransformFailure("embedding " + doc.source_id + ": " +
                               DimensionMismatch(cfg_.dimension, vec.size()).what());
    }
    return vec;
}

IngestionReport IngestionPipeline::run(const IngestOptions& opts, const std::atomic<bool>* cancel) {
    RunGuard guard(running_);
    // whole seconds, the resolution checkpoints are persisted at
    const TimePoint started = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
    IngestionReport report;
    auto fail = [&](const std::string& msg) {
        spdlog::warn("ingest: {}", msg);
        report.errors.push_back(msg);
        ++report.failures;
    };

    report.stage = IngestStage::Fetching;
    auto candidates = fetch(opts);
    report.candidates = (int)candidates.size();

    for (const auto& candidate : candidates) {
        if (cancel && cancel->load()) {
            report.cancelled = true;
            break;
        }
        if (opts.max_records > 0 && report.inserted >= opts.max_records) {
            report.truncated = true;
            break;
        }

        report.stage = IngestStage::Fetching;
        std::optional<Document> doc;
        try {
            doc = source_->get_full(candidate.source_id);
        } catch (const std::exception& e) {
            fail("fetching " + candidate.source_id + " failed: " + e.what());
            continue;
        }
        if (!doc) {
            fail("message " + candidate.source_id + " could not be fetched");
            continue;
        }

        report.stage = IngestStage::Filtering;
        if (!opts.window.contains(doc->timestamp) || (opts.relevance && !opts.relevance(*doc))) {
            ++report.filtered_out;
            continue;
        }

        report.stage = IngestStage::Transforming;
        VectorRecord rec;
        try {
            rec.summary = summarize(*doc);
            rec.embedding = embed(*doc, rec.summary);
        } catch (const TransformFailure& e) {
            fail(e.what());
            continue;
        }
        rec.source_id = doc->source_id;
        rec.sender = doc->sender;
        rec.cc = doc->cc;
        rec.subject = doc->subject;
        rec.timestamp = doc->timestamp;
        rec.body_text = doc->body;

        report.stage = IngestStage::Storing;
        auto outcome = storage_.store(rec);
        switch (outcome.status) {
            case StoreOutcome::Status::Inserted:
                ++report.inserted;
                spdlog::info("ingest: email #{} stored: ({}), ({})", report.inserted,
                             format_iso8601(rec.timestamp), rec.subject);
                break;
            case StoreOutcome::Status::AlreadyExists:
                ++report.duplicates;
                spdlog::debug("ingest: {} already stored", rec.source_id);
                break;
            case StoreOutcome::Status::Failed:
                fail("storing " + rec.source_id + " failed: " + outcome.reason);
                break;
        }
    }

    if (report.cancelled) {
        spdlog::warn("ingest: run cancelled after {} inserted; checkpoint left unchanged", report.inserted);
        report.checkpoint = storage_.get_checkpoint();
        return report;
    }

    report.stage = IngestStage::Checkpointing;
    TimePoint previous = storage_.get_checkpoint();
    TimePoint next = std::max(previous, started);
    report.checkpoint = previous;
    try {
        storage_.set_checkpoint(next);
        report.checkpoint = next;
        report.checkpoint_advanced = next > previous;
    } catch (const std::exception& e) {
        spdlog::error("ingest: checkpoint write failed: {}", e.what());
        report.errors.push_back(std::string("checkpoint write failed: ") + e.what());
    }

    report.stage = IngestStage::Done;
    spdlog::info("ingest: {} candidates, {} inserted, {} duplicates, {} filtered, {} failed",
                 report.candidates, report.inserted, report.duplicates, report.filtered_out, report.failures);
    return report;
}

std::string fallback_summary(const Document& doc) {
    std::string context = doc.body.empty() ? std::string("No body content available")
                                           : truncate_utf8(doc.body, 500);
    return "<Email Start>\n"
           "Date and Time: " + format_iso8601(doc.timestamp) + "\n"
           "Sender: " + doc.sender + "\n"
           "CC: " + doc.cc + "\n"
           "Subject: " + doc.subject + "\n"
           "Email Context: " + context + "...\n"
           "<Email End>";
}

TimeWindow month_to_date_window(TimePoint now) {
    std::time_t t = Clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    tm.tm_mday = 1;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    TimeWindow w;
    w.start = Clock::from_time_t(timegm(&tm));
    return w;
}

RelevanceFilter make_term_filter(std::vector<std::string> terms) {
    for (auto& t : terms) t = to_lower(t);
    return [terms](const Document& d) {
        if (terms.empty()) return true;
        auto sender = to_lower(d.sender);
        auto subject = to_lower(d.subject);
        return std::any_of(terms.begin(), terms.end(), [&](const std::string& t) {
            return sender.find(t) != std::string::npos || subject.find(t) != std::string::npos;
        });
    };
}
