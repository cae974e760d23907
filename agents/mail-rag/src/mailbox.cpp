#include "../include/mailbox.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

using json = nlohmann::json;

static std::string str_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

void JsonMailboxSource::reload() {
    std::ifstream f(path_);
    if (!f) throw FetchFailure("cannot open mailbox " + path_.string());
    json root;
    try {
        root = json::parse(f);
    } catch (const json::exception& e) {
        throw FetchFailure("mailbox " + path_.string() + " is not valid JSON: " + e.what());
    }
    const json* messages = &root;
    if (root.is_object() && root.contains("messages")) messages = &root["messages"];
    if (!messages->is_array()) throw FetchFailure("mailbox " + path_.string() + " has no message array");

    by_id_.clear();
    order_.clear();
    for (const auto& m : *messages) {
        Document d;
        d.source_id = str_field(m, "id");
        if (d.source_id.empty()) {
            spdlog::warn("mailbox: skipping message without id");
            continue;
        }
        d.sender = str_field(m, "from");
        d.cc = str_field(m, "cc");
        d.subject = str_field(m, "subject");
        d.body = str_field(m, "body");
        auto date = str_field(m, "date");
        auto ts = parse_iso8601(date);
        if (!ts) {
            spdlog::warn("mailbox: message {} has unparseable date '{}'", d.source_id, date);
            ts = epoch();
        }
        d.timestamp = *ts;
        if (!by_id_.count(d.source_id)) order_.push_back(d.source_id);
        by_id_[d.source_id] = std::move(d);
    }
}

std::vector<Document> JsonMailboxSource::list_candidates(const TimeWindow& window, const std::string& query) {
    reload();
    std::vector<Document> out;
    for (const auto& id : order_) {
        const auto& d = by_id_.at(id);
        if (d.timestamp < window.start) continue;
        if (!query.empty() && !contains_ci(d.sender, query) && !contains_ci(d.subject, query)) continue;
        Document header = d;
        header.body.clear();
        out.push_back(std::move(header));
    }
    return out;
}

std::optional<Document> JsonMailboxSource::get_full(const std::string& source_id) {
    auto it = by_id_.find(source_id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}
