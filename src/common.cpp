#include "pushid/common.hpp"

#include <sstream>

namespace pushid {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kTimestampOverflow:
      return "Timestamp overflow";
    case ErrorCode::kLengthInvariant:
      return "Length invariant violated";
    case ErrorCode::kSuffixExhausted:
      return "Suffix exhausted";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef PUSHID_VERSION_MAJOR
  return Version{PUSHID_VERSION_MAJOR, PUSHID_VERSION_MINOR, PUSHID_VERSION_PATCH, ""};
#else
  return Version{0, 1, 0, "dev"};
#endif
}

}  // namespace pushid
