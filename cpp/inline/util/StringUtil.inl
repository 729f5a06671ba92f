#include "util/StringUtil.hpp"

#include "util/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace util {

inline uint64_t atou64_safe(const std::string& s) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw CleanException("Not a non-negative integer: \"{}\"", s);
  }
  size_t read = 0;
  uint64_t u;
  try {
    u = std::stoull(s, &read);
  } catch (const std::out_of_range&) {
    throw CleanException("Integer out of range: \"{}\"", s);
  }
  if (read != s.size()) {
    throw CleanException("Not a non-negative integer: \"{}\"", s);
  }
  return u;
}

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  int n = split(result, s, t);
  result.resize(n);
  return result;
}

inline int split(std::vector<std::string>& result, const std::string& s, const char* t) {
  std::string_view sep(t);
  std::size_t token_count = 0;

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      std::string_view tok = sv.substr(start, pos - start);

      if (token_count < result.size())
        result[token_count] = tok;
      else
        result.emplace_back(tok);

      ++token_count;
    }
  } else {
    std::size_t start = 0, end;
    while ((end = s.find(sep, start)) != std::string::npos) {
      std::string_view tok(s.data() + start, end - start);
      if (token_count < result.size())
        result[token_count] = tok;
      else
        result.emplace_back(tok);
      ++token_count;
      start = end + sep.size();
    }
    // last segment
    std::string_view tok(s.data() + start, s.size() - start);
    if (token_count < result.size())
      result[token_count] = tok;
    else
      result.emplace_back(tok);
    ++token_count;
  }

  return int(token_count);
}

inline std::vector<uint64_t> parse_uint64_list(const std::string& s) {
  std::string spaced = s;
  std::replace(spaced.begin(), spaced.end(), ',', ' ');

  std::vector<uint64_t> values;
  for (const std::string& token : split(spaced)) {
    values.push_back(atou64_safe(token));
  }
  return values;
}

}  // namespace util
