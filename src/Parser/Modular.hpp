// An incremental version parser built on the typestate pattern.
//
//   ModularParser<Unparsed>   --parseBase()-->  ModularParser<ParsedBase>
//   ModularParser<ParsedBase> --parsePatch()--> ModularParser<ParsedFull>
//   ModularParser<ParsedBase> --finish()-->     Version (two components)
//   ModularParser<ParsedFull> --finish()-->     Version (three components)
//
// Every transition is rvalue-qualified and consumes the parser it is called
// on, so a state cannot be advanced twice:
//
//   auto base = Try(ModularParser(input).parseBase());
//   if (wantPatch) {
//     return std::move(base).parsePatch();
//   }
#pragma once

#include "../Rustify/Result.hpp"
#include "../Version.hpp"
#include "Component.hpp"
#include "Error.hpp"

#include <concepts>
#include <string_view>

namespace vernum {

// Initial state: nothing has been consumed yet.
struct Unparsed {};

// MAJOR.MINOR has been consumed; trailing input has not been checked.
struct ParsedBase {
  BaseVersion version;
};

// MAJOR.MINOR.PATCH has been consumed; trailing input has not been checked.
struct ParsedFull {
  FullVersion version;
};

template <typename S>
concept ParsedState = std::same_as<S, Unparsed> || std::same_as<S, ParsedBase>
                      || std::same_as<S, ParsedFull>;

template <ParsedState S>
class ModularParser;

template <>
class ModularParser<Unparsed>;
template <>
class ModularParser<ParsedBase>;
template <>
class ModularParser<ParsedFull>;

template <>
class ModularParser<ParsedFull> {
  friend class ModularParser<ParsedBase>;

  ParsedFull state;
  Cursor cursor;

  constexpr ModularParser(const ParsedFull state, const Cursor cursor) noexcept
      : state(state), cursor(cursor) {}

public:
  Result<Version, ParseError> finish() && noexcept;
  Result<FullVersion, ParseError> finishFullVersion() && noexcept;

  // The version parsed so far.  Not yet checked for trailing input.
  constexpr const FullVersion& innerVersion() const noexcept {
    return state.version;
  }
  constexpr std::size_t position() const noexcept {
    return cursor.pos;
  }
};

template <>
class ModularParser<ParsedBase> {
  friend class ModularParser<Unparsed>;

  ParsedBase state;
  Cursor cursor;

  constexpr ModularParser(const ParsedBase state, const Cursor cursor) noexcept
      : state(state), cursor(cursor) {}

public:
  Result<ModularParser<ParsedFull>, ParseError> parsePatch() && noexcept;
  // Parses the patch component if a `.` follows, then finishes as either
  // shape.
  Result<Version, ParseError> parsePatchOrFinish() && noexcept;
  Result<Version, ParseError> finish() && noexcept;
  Result<BaseVersion, ParseError> finishBaseVersion() && noexcept;

  // The version parsed so far.  Not yet checked for trailing input.
  constexpr const BaseVersion& innerVersion() const noexcept {
    return state.version;
  }
  constexpr std::size_t position() const noexcept {
    return cursor.pos;
  }
};

template <>
class ModularParser<Unparsed> {
  Cursor cursor;

public:
  constexpr explicit ModularParser(const std::string_view str) noexcept
      : cursor(str) {}

  Result<ModularParser<ParsedBase>, ParseError> parseBase() && noexcept;
  // A two-component input is rejected.
  Result<ModularParser<ParsedFull>, ParseError> parseFull() && noexcept;
  // Parses either shape, depending on the input.
  Result<Version, ParseError> parse() && noexcept;
};

ModularParser(std::string_view) -> ModularParser<Unparsed>;

}  // namespace vernum
