#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

std::vector<unsigned char> secure_random_bytes(std::size_t count);
std::string base64url_from_bytes(const std::vector<unsigned char>&);
bool constant_time_equals(const std::string& a, const std::string& b);

std::string iso8601_utc(std::chrono::system_clock::time_point tp);
// YYYYMMDDTHHMMSS, UTC
std::string compact_utc_timestamp(std::chrono::system_clock::time_point tp);
std::string human_size(uint64_t num_bytes);

std::string html_escape(const std::string& text);
std::string trim_common_left_spaces(const std::string& text);
