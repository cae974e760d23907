#include "../include/retrieval.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>

Retriever::Retriever(StorageBackend& storage, std::shared_ptr<Embedder> embedder, std::size_t dimension, int top_k)
    : storage_(storage), embedder_(std::move(embedder)), dim_(dimension), top_k_(top_k) {
    if (!embedder_) throw std::invalid_argument("Retriever: embedder is required");
}

std::vector<std::string> Retriever::retrieve(const std::string& query) {
    try {
        auto vec = embedder_->embed(query);
        if (vec.size() != dim_) {
            spdlog::error("query embedding rejected: {}", DimensionMismatch(dim_, vec.size()).what());
            return {kNoResults};
        }
        auto out = storage_.search(vec, top_k_);
        if (out.empty()) return {kNoResults};
        return out;
    } catch (const std::exception& e) {
        spdlog::error("retrieval failed: {}", e.what());
        return {kNoResults};
    }
}

void check_embedding_dimension(Embedder& embedder, std::size_t dimension) {
    auto sample = embedder.embed("dimension check");
    if (sample.size() != dimension) throw DimensionMismatch(dimension, sample.size());
}

std::string render_context(const std::vector<std::string>& items, const std::string& label, TimePoint now) {
    std::string out = "Today's Datetime is " + format_iso8601(now) + "\n\n";
    for (size_t i = 0; i < items.size(); ++i) {
        out += label + "(" + std::to_string(i + 1) + "):\n\n" + items[i] + "\n\n";
    }
    return out;
}

ConversationSession::ConversationSession(Retriever& retriever, AnswerGenerator& generator, SessionConfig cfg)
    : retriever_(retriever), generator_(generator), cfg_(std::move(cfg)) {}

std::string ConversationSession::ask(const std::string& question) {
    if (history_.empty()) {
        auto items = retriever_.retrieve(question);
        spdlog::info("new conversation: {} context items", items.size());
        history_.push_back({"system", cfg_.system_prompt + "\n\n" + render_context(items, cfg_.item_label)});
    }
    history_.push_back({"user", question});

    std::string reply;
    try {
        reply = generator_.generate(history_);
        if (reply.empty()) {
            spdlog::warn("answer generator returned an empty reply");
            reply = kApology;
        }
    } catch (const std::exception& e) {
        spdlog::error("answer generation failed: {}", e.what());
        reply = kApology;
    }
    history_.push_back({"assistant", reply});
    return reply;
}
