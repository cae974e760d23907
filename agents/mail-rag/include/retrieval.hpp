#pragma once
#include <memory>
#include <string>
#include <vector>
#include "document.hpp"
#include "providers.hpp"
#include "storage.hpp"

inline const char* const kApology =
    "I apologize, but there was an error generating an answer. Please check the model server and try again.";

inline const char* const kDefaultSystemPrompt =
    "You are an AI assistant with access to the user's email collection. "
    "Below, you'll find the most relevant emails retrieved for the user's question. "
    "Your job is to answer the question based on these emails. "
    "If you cannot find the answer in the emails, please politely inform the user. "
    "Answer in a conversational, helpful manner as a personal email assistant.";

class Retriever {
public:
    Retriever(StorageBackend& storage, std::shared_ptr<Embedder> embedder, std::size_t dimension, int top_k);

    // Ranked summaries, best first. Never empty, never throws.
    std::vector<std::string> retrieve(const std::string& query);

    int top_k() const { return top_k_; }

private:
    StorageBackend& storage_;
    std::shared_ptr<Embedder> embedder_;
    std::size_t dim_;
    int top_k_;
};

// Throws DimensionMismatch if the embedder does not produce `dimension` floats.
void check_embedding_dimension(Embedder& embedder, std::size_t dimension);

std::string render_context(const std::vector<std::string>& items,
                           const std::string& label = "Item",
                           TimePoint now = Clock::now());

struct SessionConfig {
    std::string system_prompt{kDefaultSystemPrompt};
    std::string item_label{"Item"};
};

class ConversationSession {
public:
    ConversationSession(Retriever& retriever, AnswerGenerator& generator, SessionConfig cfg = {});

    // First question retrieves context; follow-ups reuse the history.
    std::string ask(const std::string& question);

    const std::vector<ChatMessage>& history() const { return history_; }
    void reset() { history_.clear(); }

private:
    Retriever& retriever_;
    AnswerGenerator& generator_;
    SessionConfig cfg_;
    std::vector<ChatMessage> history_;
};
