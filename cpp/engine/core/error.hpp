/*
===============================================================================
Fragment 1.2 — Core: Error System (ErrorCode + Exception + Require Macro)
File: cpp/engine/core/error.hpp
===============================================================================
*/

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace mcda {

// Stable error codes for JSON/CSV output and CLI exit mapping.
// Keep these values stable once public.
enum class ErrorCode : std::uint16_t {
  Ok = 0,

  // Input / config
  InvalidInput = 10,
  InvalidConfig = 11,
  EmptyInput = 12,

  // Decision-matrix structure
  IncompleteMatrix = 20,
  DegenerateCriterion = 21,

  // Numerical
  NumericalFailure = 30,

  // IO / parsing
  IOError = 40,
  ParseError = 41
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::Ok:                  return "Ok";
    case ErrorCode::InvalidInput:        return "InvalidInput";
    case ErrorCode::InvalidConfig:       return "InvalidConfig";
    case ErrorCode::EmptyInput:          return "EmptyInput";
    case ErrorCode::IncompleteMatrix:    return "IncompleteMatrix";
    case ErrorCode::DegenerateCriterion: return "DegenerateCriterion";
    case ErrorCode::NumericalFailure:    return "NumericalFailure";
    case ErrorCode::IOError:             return "IOError";
    case ErrorCode::ParseError:          return "ParseError";
    default:                             return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Exception type used by MCDA_REQUIRE / fail(). what() is the bare message so
// it can be shown to an analyst as-is; code() and where() are for tooling.
class McdaError final : public std::exception {
public:
  McdaError(ErrorCode c, std::string msg, ErrorSite site = {})
      : code_(c), msg_(msg.empty() ? std::string{"<empty error message>"} : std::move(msg)), site_(site) {}

  const char* what() const noexcept override { return msg_.c_str(); }
  ErrorCode code() const noexcept { return code_; }
  const ErrorSite& where() const noexcept { return site_; }

private:
  ErrorCode code_;
  std::string msg_;
  ErrorSite site_;
};

[[noreturn]] inline void fail(ErrorCode code, std::string msg, ErrorSite site) {
  throw McdaError(code, std::move(msg), site);
}

} // namespace mcda

#define MCDA_SITE ::mcda::ErrorSite{__FILE__, __func__, __LINE__}

// Hard fail for invalid states. `msg` may be a literal or a std::string.
#define MCDA_REQUIRE(cond, code, msg)             \
  do {                                            \
    if (!(cond)) {                                \
      ::mcda::fail((code), (msg), MCDA_SITE);     \
    }                                             \
  } while (0)
