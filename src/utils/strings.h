#pragma once
#include <optional>
#include <string>

namespace sqlscope::str {

// Lowercase hex of `bytes` random bytes from OpenSSL's CSPRNG; nullopt if RAND fails.
std::optional<std::string> random_hex(size_t bytes);

// Compares without early exit so response timing does not leak the matching prefix.
bool constant_time_equals(const std::string& a, const std::string& b);

// "1", "true", "yes", "on" (any case).
bool truthy(const char* s);

std::string trim(const std::string& s);

// Returns UTF-8 safe prefix, at most max_bytes, not splitting code points.
std::string utf8_prefix(const std::string& s, size_t max_bytes);

}
