#pragma once

#include "../Rustify/Result.hpp"
#include "../Version.hpp"
#include "Error.hpp"

#include <string_view>

namespace vernum {

// Parses a whole input in a single call.  The cursor lives only for the
// duration of each call, so a OneShotParser can be reused.
class OneShotParser {
  std::string_view s;

public:
  constexpr explicit OneShotParser(const std::string_view str) noexcept
      : s(str) {}

  // MAJOR.MINOR or MAJOR.MINOR.PATCH, decided by whether input remains after
  // the minor component.
  Result<Version, ParseError> parse() const noexcept;
  // Exactly MAJOR.MINOR.
  Result<BaseVersion, ParseError> parseBase() const noexcept;
  // Exactly MAJOR.MINOR.PATCH.
  Result<FullVersion, ParseError> parseFull() const noexcept;
};

}  // namespace vernum
