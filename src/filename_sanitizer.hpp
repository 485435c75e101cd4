#pragma once

#include <chrono>
#include <string>

// Keeps ASCII alphanumerics and "-_.() ". Never returns an empty string: an
// input with nothing left becomes "file_<unix seconds>".
std::string sanitize_filename(const std::string& raw,
                              std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// sanitize_filename() prefixed with "YYYYMMDDTHHMMSS_" (UTC).
std::string sanitize_and_prefix(const std::string& raw,
                                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
