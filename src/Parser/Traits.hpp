#pragma once

#include "../Rustify/Result.hpp"
#include "../Version.hpp"
#include "Error.hpp"

#include <concepts>
#include <string_view>

namespace vernum {

template <typename P>
concept VersionParser = requires(const P& parser, std::string_view input) {
  {
    parser.parseVersion(input)
  } -> std::same_as<Result<Version, ParseError>>;
};

template <typename P>
concept BaseVersionParser = requires(const P& parser, std::string_view input) {
  { parser.parseBase(input) } -> std::same_as<Result<BaseVersion, ParseError>>;
};

template <typename P>
concept FullVersionParser = requires(const P& parser, std::string_view input) {
  { parser.parseFull(input) } -> std::same_as<Result<FullVersion, ParseError>>;
};

// Backed by OneShotParser.
struct OneShot {
  Result<Version, ParseError> parseVersion(std::string_view input) const noexcept;
  Result<BaseVersion, ParseError> parseBase(std::string_view input) const noexcept;
  Result<FullVersion, ParseError> parseFull(std::string_view input) const noexcept;
};

// Backed by ModularParser.
struct Modular {
  Result<Version, ParseError> parseVersion(std::string_view input) const noexcept;
  Result<BaseVersion, ParseError> parseBase(std::string_view input) const noexcept;
  Result<FullVersion, ParseError> parseFull(std::string_view input) const noexcept;
};

}  // namespace vernum
