#pragma once
#include <optional>
#include <string>
#include <vector>
#include "document.hpp"

struct ChatMessage {
    std::string role; // "system" | "user" | "assistant"
    std::string content;
};

// Fetch side. list_candidates may return header-only documents; get_full
// fills in the body. Throwing from list_candidates means the source is
// unreachable.
class MailSource {
public:
    virtual ~MailSource() = default;
    virtual std::vector<Document> list_candidates(const TimeWindow& window, const std::string& query) = 0;
    virtual std::optional<Document> get_full(const std::string& source_id) = 0;
};

class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual std::optional<std::string> summarize(const Document& doc) = 0;
};

class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;
    virtual std::string generate(const std::vector<ChatMessage>& history) = 0;
};
