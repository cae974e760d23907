#pragma once
#include <string>
#include <vector>
#include <optional>
#include "document.hpp"

std::string getenv_or(const char* key, const std::string& def);

TimePoint epoch();
std::string format_iso8601(TimePoint tp);
std::optional<TimePoint> parse_iso8601(const std::string& text);

float l2_squared(const std::vector<float>& a, const std::vector<float>& b);
float dot(const std::vector<float>& a, const std::vector<float>& b);
void l2_normalize(std::vector<float>& v);

// Raw float32 bytes in host order, as stored in BLOB columns.
std::string encode_embedding(const std::vector<float>& v);
std::vector<float> decode_embedding(const void* data, std::size_t bytes);

std::string truncate_utf8(const std::string& text, std::size_t max_bytes);
std::string to_lower(std::string s);
bool contains_ci(const std::string& haystack, const std::string& needle);
