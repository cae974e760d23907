#include "../include/ollama.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

static const char* kSummaryInstructions =
    "Summarize the given Email in the following format, keep it brief but don't lose much information:\n\n"
    "OUTPUT FORMAT:\n"
    "<Email Start>\n"
    "Date and Time:  (format: dd-MMM-yyyy HH h:mmtt [with time zone])\n"
    "Sender: \n"
    "CC:\n"
    "Subject:\n"
    "Email Context: \n"
    "<Email End>\n";

static json post(const std::string& url, const json& body, long timeout_ms, const char* what) {
    auto r = http_post_json(url, body.dump(), timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw std::runtime_error(std::string(what) + " failed: status " + std::to_string(r.status));
    }
    return json::parse(r.body);
}

std::vector<float> OllamaEmbedder::embed(const std::string& text) {
    json body = {
        {"model", cfg_.embed_model},
        {"prompt", text}
    };
    auto data = post(cfg_.ollama_url + "/api/embeddings", body, cfg_.timeout_ms, "embedding");
    if (!data.contains("embedding") || !data["embedding"].is_array() || data["embedding"].empty()) {
        throw std::runtime_error("embedding response has no vector");
    }
    auto vec = data["embedding"].get<std::vector<float>>();
    if (cfg_.normalize) l2_normalize(vec);
    return vec;
}

std::optional<std::string> OllamaSummarizer::summarize(const Document& doc) {
    std::string prompt = "The email is the following: \n\n"
                         "date and time: " + format_iso8601(doc.timestamp) + "\n"
                         "from: " + doc.sender + "\n"
                         "cc: " + doc.cc + "\n"
                         "subject: " + doc.subject + "\n"
                         "body: " + doc.body + "\n\n"
                         "Please summarize this email according to the format above.\n";
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"messages", json::array({
            json{{"role","system"},{"content",kSummaryInstructions}},
            json{{"role","user"},{"content",prompt}}
        })}
    };
    auto data = post(cfg_.ollama_url + "/api/chat", body, cfg_.timeout_ms, "summary");
    if (!data.contains("message")) return std::nullopt;
    auto text = data["message"].value("content", std::string());
    if (text.empty()) return std::nullopt;
    return text;
}

std::string OllamaChat::generate(const std::vector<ChatMessage>& history) {
    json messages = json::array();
    for (const auto& m : history) {
        messages.push_back({{"role", m.role}, {"content", m.content}});
    }
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"messages", messages}
    };
    auto data = post(cfg_.ollama_url + "/api/chat", body, cfg_.timeout_ms, "chat");
    if (!data.contains("message")) throw std::runtime_error("chat response has no message");
    return data["message"].value("content", std::string());
}
