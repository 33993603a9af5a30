#include "csumattr.hh"

#include <regex>

bool is_valid_digest(const std::string& value) {
  static std::regex digest_regex("^[0-9a-f]{64}$");
  return std::regex_match(value, digest_regex);
}
