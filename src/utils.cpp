#include "utils.h"

namespace schemasub {

const char *toString(log_level Level) {
  switch (Level) {
  case level_emergent:
    return "emergent";
  case level_alert:
    return "alert";
  case level_critical:
    return "critical";
  case level_error:
    return "error";
  case level_warning:
    return "warning";
  case level_notice:
    return "notice";
  case level_info:
    return "info";
  case level_debug:
    return "debug";
  }
  return "unknown";
}

llvm::raw_ostream &log(log_level Configured, log_level Level) {
  if (Level > Configured) {
    return llvm::nulls();
  }
  return llvm::errs() << "[" << toString(Level) << "] ";
}

std::string escapeForDiag(llvm::StringRef Str, std::size_t Limit) {
  std::string Ret;
  for (char C : Str) {
    if (Ret.size() >= Limit) {
      Ret += "...";
      break;
    }
    switch (C) {
    case '\n':
      Ret += "\\n";
      break;
    case '\t':
      Ret += "\\t";
      break;
    case '\r':
      Ret += "\\r";
      break;
    default:
      Ret += C;
    }
  }
  return Ret;
}

} // namespace schemasub
