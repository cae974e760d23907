#pragma once
#include <filesystem>
#include <map>
#include "providers.hpp"

// Reads an exported mailbox: a JSON array, or {"messages": [...]}, of
//   {"id", "from", "cc", "subject", "date" (ISO-8601), "body"}
// The file is re-read on every list_candidates() call.
class JsonMailboxSource : public MailSource {
public:
    explicit JsonMailboxSource(std::filesystem::path path) : path_(std::move(path)) {}

    std::vector<Document> list_candidates(const TimeWindow& window, const std::string& query) override;
    std::optional<Document> get_full(const std::string& source_id) override;

private:
    void reload();

    std::filesystem::path path_;
    std::map<std::string, Document> by_id_;
    std::vector<std::string> order_;
};
