// Copyright Global Phasing Ltd.
//
// fail() and the exception types thrown by pattern parsing and matching.

#ifndef MOLTYPE_FAIL_HPP_
#define MOLTYPE_FAIL_HPP_

#include <cstddef>    // for size_t
#include <stdexcept>  // for runtime_error
#include <string>
#include <utility>    // for forward

#if defined(__GNUC__) || defined(__clang__)
# define MOLTYPE_COLD __attribute__((cold))
#else
# define MOLTYPE_COLD
#endif

namespace moltype {

[[noreturn]]
inline void fail(const std::string& msg) { throw std::runtime_error(msg); }

template<typename T, typename... Args> [[noreturn]]
void fail(std::string&& str, T&& arg1, Args&&... args) {
  str += arg1;
  fail(std::move(str), std::forward<Args>(args)...);
}
template<typename T, typename... Args> [[noreturn]]
void fail(const std::string& str, T&& arg1, Args&&... args) {
  fail(str + arg1, std::forward<Args>(args)...);
}

/// Malformed pattern text. position is a 0-based byte offset in the text,
/// expected describes what should have been there.
struct SyntaxError : std::runtime_error {
  size_t position;
  std::string expected;

  SyntaxError(size_t pos, const std::string& expected_,
              const std::string& context=std::string())
    : std::runtime_error(make_message(pos, expected_, context)),
      position(pos), expected(expected_) {}

  static std::string make_message(size_t pos, const std::string& expected,
                                  const std::string& context) {
    std::string msg = context.empty() ? "" : context + ": ";
    return msg + "pattern syntax error at position " + std::to_string(pos)
               + ": expected " + expected;
  }
};

/// A pattern uses a primitive that parses but cannot be matched
/// (ring size, recursive $(...) sub-pattern).
struct UnsupportedFeature : std::runtime_error {
  explicit UnsupportedFeature(const std::string& what_)
    : std::runtime_error(what_) {}
};

// unreachable() is used to silence GCC -Wreturn-type and hint the compiler
[[noreturn]] inline void unreachable() {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

} // namespace moltype
#endif
