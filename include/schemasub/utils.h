#ifndef _SCHEMASUB_UTILS_H_
#define _SCHEMASUB_UTILS_H_

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <variant>

enum log_level {
  level_emergent = 0,
  level_alert = 1,
  level_critical = 2,
  level_error = 3,
  level_warning = 4,
  level_notice = 5,
  level_info = 6,
  level_debug = 7
};

namespace schemasub {

const char *toString(log_level Level);

/// Stream for a message of the given level. Returns llvm::nulls() when the
/// message is filtered by the configured level.
llvm::raw_ostream &log(log_level Configured, log_level Level);

template <typename T> using ResultT = std::variant<T, std::string>;

/// Value-or-message result used by the hand written parsers.
template <typename T> struct Result {
  ResultT<T> inner;
  Result(const T &inner) : inner(inner) {}
  Result(T &&inner) : inner(std::move(inner)) {}
  Result(const std::string &msg) : inner(msg) {}
  Result(const char *msg) : inner(std::string(msg)) {}
  bool isOk() const { return std::holds_alternative<T>(inner); }
  bool isErr() const { return std::holds_alternative<std::string>(inner); }
  const std::string &msg() const { return std::get<std::string>(inner); }
  T &get() { return std::get<T>(inner); }
  T &operator*() { return get(); }
};

/// Escape a string so it can be embedded in a diagnostic on one line.
std::string escapeForDiag(llvm::StringRef Str, std::size_t Limit = 80);

} // namespace schemasub

#endif
