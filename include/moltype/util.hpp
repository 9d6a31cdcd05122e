// Copyright Global Phasing Ltd.
//
// Utilities: string helpers and cat().

#ifndef MOLTYPE_UTIL_HPP_
#define MOLTYPE_UTIL_HPP_

#include <string>
#include <vector>

namespace moltype {

inline std::string to_lower(std::string str) {
  for (char& c : str)
    if (c >= 'A' && c <= 'Z')
      c |= 0x20;
  return str;
}

inline std::string trim_str(const std::string& str) {
  std::string ws = " \r\n\t";
  std::string::size_type first = str.find_first_not_of(ws);
  if (first == std::string::npos)
    return std::string{};
  std::string::size_type last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

namespace impl {
inline size_t length(char) { return 1; }
inline size_t length(const std::string& s) { return s.length(); }

inline void add_to_string(std::string&) {}

template <typename T, typename... Args>
void add_to_string(std::string& out, const T& value, Args const&... args) {
  out += value;
  add_to_string(out, args...);
}
}

template<typename S>
inline std::vector<std::string> split_str(const std::string& str, S sep) {
  std::vector<std::string> result;
  std::size_t start = 0, end;
  while ((end = str.find(sep, start)) != std::string::npos) {
    result.emplace_back(str, start, end - start);
    start = end + impl::length(sep);
  }
  result.emplace_back(str, start);
  return result;
}

template<typename T, typename S, typename F>
std::string join_str(const T& iterable, const S& sep, const F& getter) {
  std::string r;
  bool first = true;
  for (const auto& item : iterable) {
    if (!first)
      r += sep;
    r += getter(item);
    first = false;
  }
  return r;
}

template<typename T, typename S>
std::string join_str(const T& iterable, const S& sep) {
  return join_str(iterable, sep, [](const std::string& t) { return t; });
}

// concatenates strings, chars and C strings (not numbers)
template <class... Args>
std::string cat(Args const&... args) {
  std::string out;
  impl::add_to_string(out, args...);
  return out;
}

} // namespace moltype
#endif
// vim:sw=2:ts=2:et
