#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Returned by search in place of an empty result.
inline const char* const kNoResults = "No relevant emails found.";

struct Document {
    std::string source_id;
    std::string sender;
    std::string cc;
    std::string subject;
    TimePoint timestamp{};
    std::string body;
};

struct VectorRecord {
    std::int64_t id{0}; // row id, assigned by the metadata store
    std::string source_id;
    std::string sender;
    std::string cc;
    std::string subject;
    TimePoint timestamp{};
    std::string body_text;
    std::string summary;
    std::vector<float> embedding;
    std::int64_t insertion_sequence{0};
    std::int64_t index_handle{0}; // vector index entry, 0 when not indexed
    std::string created_at;
};

struct StoreOutcome {
    enum class Status { Inserted, AlreadyExists, Failed };
    Status status{Status::Failed};
    std::string reason;

    static StoreOutcome inserted() { return {Status::Inserted, {}}; }
    static StoreOutcome already_exists() { return {Status::AlreadyExists, {}}; }
    static StoreOutcome failed(std::string why) { return {Status::Failed, std::move(why)}; }
};

struct TimeWindow {
    TimePoint start{};
    TimePoint end{TimePoint::max()};

    bool contains(TimePoint t) const { return t >= start && t <= end; }
};
