#include "strings.h"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace sqlscope::str {

std::optional<std::string> random_hex(size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (bytes == 0) return std::string();
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) return std::nullopt;
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(bytes * 2);
  for (size_t i = 0; i < bytes; ++i) {
    out[i * 2] = hex[(buffer[i] >> 4) & 0xF];
    out[i * 2 + 1] = hex[buffer[i] & 0xF];
  }
  return out;
}

bool constant_time_equals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool truthy(const char* s) {
  if (!s) return false;
  std::string v(s);
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
  return s.substr(a, b - a);
}

std::string utf8_prefix(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t i = 0, last = 0;
  while (i < s.size() && i < max_bytes) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t adv = 1;
    if ((c & 0x80u) == 0) adv = 1;
    else if ((c & 0xE0u) == 0xC0u) adv = 2;
    else if ((c & 0xF0u) == 0xE0u) adv = 3;
    else if ((c & 0xF8u) == 0xF0u) adv = 4;
    else break; // invalid; stop
    if (i + adv > max_bytes) break;
    last = i + adv;
    i += adv;
  }
  return s.substr(0, last);
}

}
