#pragma once
#include "config.hpp"
#include "providers.hpp"

class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)) {}
    std::vector<float> embed(const std::string& text) override;

private:
    EmbedConfig cfg_;
};

class OllamaSummarizer : public Summarizer {
public:
    explicit OllamaSummarizer(LlmConfig cfg) : cfg_(std::move(cfg)) {}
    std::optional<std::string> summarize(const Document& doc) override;

private:
    LlmConfig cfg_;
};

class OllamaChat : public AnswerGenerator {
public:
    explicit OllamaChat(LlmConfig cfg) : cfg_(std::move(cfg)) {}
    std::string generate(const std::vector<ChatMessage>& history) override;

private:
    LlmConfig cfg_;
};
