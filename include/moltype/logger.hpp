// Copyright Global Phasing Ltd.
//
// Logger - passes diagnostic messages from typing and term generation
// to a callback.

#ifndef MOLTYPE_LOGGER_HPP_
#define MOLTYPE_LOGGER_HPP_

#include <cstdio>      // for fprintf
#include <functional>  // for function
#include "util.hpp"    // for cat

namespace moltype {

/// Passes messages to a callback function, without a trailing newline.
/// Severity levels are syslog-like: 8=debug, 6=info, 5=notice, 3=warning.
/// Messages above the threshold are dropped.
struct Logger {
  std::function<void(const std::string&)> callback;
  /// 8=all, 6=all but debug, 5=notes and warnings, 3=warnings, 0=none
  int threshold = 6;

  template<int N, class... Args> void level(Args const&... args) const {
    if (threshold >= N && callback)
      callback(cat(args...));
  }

  template<class... Args> void debug(Args const&... args) const { level<8>("Debug: ", args...); }
  template<class... Args> void mesg(Args const&... args) const { level<6>(args...); }
  template<class... Args> void note(Args const&... args) const { level<5>("Note: ", args...); }
  template<class... Args> void warn(Args const&... args) const { level<3>("Warning: ", args...); }

  /// to be used as: logger.callback = Logger::to_stderr;
  static void to_stderr(const std::string& s) {
    std::fprintf(stderr, "%s\n", s.c_str());
  }
};

} // namespace moltype
#endif
