#include "Modular.hpp"

#include "../Rustify/Result.hpp"
#include "../Version.hpp"
#include "Component.hpp"
#include "Error.hpp"

#include <cstdint>
#include <utility>

namespace vernum {

Result<ModularParser<ParsedBase>, ParseError>
ModularParser<Unparsed>::parseBase() && noexcept {
  const uint64_t major = Try(parseComponent(cursor));
  Try(parseDot(cursor));
  const uint64_t minor = Try(parseComponent(cursor));

  return Ok(ModularParser<ParsedBase>(
      ParsedBase{ BaseVersion{ major, minor } }, cursor
  ));
}

Result<ModularParser<ParsedFull>, ParseError>
ModularParser<Unparsed>::parseFull() && noexcept {
  return Try(std::move(*this).parseBase()).parsePatch();
}

Result<Version, ParseError>
ModularParser<Unparsed>::parse() && noexcept {
  ModularParser<ParsedBase> base = Try(std::move(*this).parseBase());
  if (peekIsDot(base.cursor)) {
    return Try(std::move(base).parsePatch()).finish();
  }
  return std::move(base).finish();
}

Result<ModularParser<ParsedFull>, ParseError>
ModularParser<ParsedBase>::parsePatch() && noexcept {
  Try(parseDot(cursor));
  const uint64_t patch = Try(parseComponent(cursor));

  const auto [major, minor] = state.version;
  return Ok(ModularParser<ParsedFull>(
      ParsedFull{ FullVersion{ major, minor, patch } }, cursor
  ));
}

Result<Version, ParseError>
ModularParser<ParsedBase>::parsePatchOrFinish() && noexcept {
  // Peeking never moves the cursor, so finishing as a two-component version
  // still sees the whole remaining input.
  if (peekIsDot(cursor)) {
    return Try(std::move(*this).parsePatch()).finish();
  }
  return std::move(*this).finish();
}

Result<Version, ParseError>
ModularParser<ParsedBase>::finish() && noexcept {
  return std::move(*this).finishBaseVersion().map([](const BaseVersion ver) {
    return Version(ver);
  });
}

Result<BaseVersion, ParseError>
ModularParser<ParsedBase>::finishBaseVersion() && noexcept {
  Try(expectEnd(cursor));
  return Ok(state.version);
}

Result<Version, ParseError>
ModularParser<ParsedFull>::finish() && noexcept {
  return std::move(*this).finishFullVersion().map([](const FullVersion ver) {
    return Version(ver);
  });
}

Result<FullVersion, ParseError>
ModularParser<ParsedFull>::finishFullVersion() && noexcept {
  Try(expectEnd(cursor));
  return Ok(state.version);
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "../Rustify/Tests.hpp"

#  include <cstdint>
#  include <fmt/format.h>
#  include <limits>
#  include <string>
#  include <string_view>
#  include <tuple>
#  include <utility>

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

// Moves the parser out of a successful result so that the next transition
// can consume it.
template <typename R>
static auto
take(R&& res) {
  auto parser = std::forward<R>(res).unwrap();
  return parser;
}

static void
testParseBaseAccepted() {
  for (const auto& [input, major, minor] :
       { std::tuple{ "0.0", 0UL, 0UL }, std::tuple{ "1.0", 1UL, 0UL },
         std::tuple{ "1.1", 1UL, 1UL }, std::tuple{ "10.20", 10UL, 20UL } }) {
    auto base = take(ModularParser(input).parseBase());
    assertEq(base.innerVersion(), (BaseVersion{ major, minor }));
    assertEq(
        std::move(base).finish().unwrap(), Version::newBaseVersion(major, minor)
    );
  }

  pass();
}

static void
testParseBaseRejected() {
  assertEq(
      ModularParser("").parseBase().unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken(std::nullopt)
  );
  assertEq(
      ModularParser("1.").parseBase().unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken(std::nullopt)
  );
  assertEq(
      ModularParser("1").parseBase().unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(std::nullopt)
  );
  assertEq(
      ModularParser("1,1").parseBase().unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(',')
  );

  for (const std::string_view input : { "01.9", "00.9", "9.01", "9.00" }) {
    assertEq(
        ModularParser(input).parseBase().unwrap_err().kind(),
        ParseErrorReason::LeadingZeroNotAllowed
    );
  }

  pass();
}

static void
testParseBaseOverflow() {
  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();

  const std::string maxInput = fmt::format("{}.{}", max, max);
  assertEq(
      ModularParser(maxInput).parseBase().unwrap().innerVersion(),
      (BaseVersion{ max, max })
  );

  const ParseError err =
      ModularParser("18446744073709551616.0").parseBase().unwrap_err();
  assertEq(err.kind(), ParseErrorReason::Overflow);
  assertTrue(err.getCursor() == std::optional<std::size_t>(0));

  pass();
}

static void
testFinishRejectsTrailingInput() {
  const ParseError err =
      take(ModularParser("1.0.0").parseBase()).finish().unwrap_err();
  assertEq(err.reason(), ParseErrorReason::expectedEndOfInput(".0"));
  assertTrue(err.reason().got == '.');
  assertTrue(err.getCursor() == std::optional<std::size_t>(3));

  pass();
}

static void
testParsePatch() {
  auto full = take(take(ModularParser("1.2.3").parseBase()).parsePatch());
  assertEq(full.innerVersion(), (FullVersion{ 1, 2, 3 }));
  assertEq(full.position(), 5UL);
  assertEq(std::move(full).finishFullVersion().unwrap(), (FullVersion{ 1, 2, 3 }));

  assertEq(
      take(ModularParser("1.2").parseBase()).parsePatch().unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(std::nullopt)
  );
  assertEq(
      take(ModularParser("1.2.").parseBase()).parsePatch().unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken(std::nullopt)
  );
  assertEq(
      take(ModularParser("1.2.3.4").parseFull()).finish().unwrap_err().kind(),
      ParseErrorReason::ExpectedEndOfInput
  );

  pass();
}

static void
testParseFullRejectsBase() {
  assertEq(
      ModularParser("1.2").parseFull().unwrap_err().reason(),
      ParseErrorReason::expectedSeparator(std::nullopt)
  );
  assertEq(
      ModularParser("1.2.3").parseFull().unwrap().innerVersion(),
      (FullVersion{ 1, 2, 3 })
  );

  pass();
}

static void
testParsePatchOrFinish() {
  assertEq(
      take(ModularParser("1.2").parseBase()).parsePatchOrFinish().unwrap(),
      Version::newBaseVersion(1, 2)
  );
  assertEq(
      take(ModularParser("1.2.3").parseBase()).parsePatchOrFinish().unwrap(),
      Version::newFullVersion(1, 2, 3)
  );

  // No `.` follows, so nothing is consumed and the whole tail is reported.
  const ParseError err =
      take(ModularParser("1.2-rc1").parseBase()).parsePatchOrFinish().unwrap_err();
  assertEq(err.reason(), ParseErrorReason::expectedEndOfInput("-rc1"));
  assertTrue(err.getCursor() == std::optional<std::size_t>(3));

  pass();
}

static void
testBranchAfterBase() {
  // A caller may inspect the base before deciding how to continue.
  auto base = take(ModularParser("0.9.1").parseBase());
  assertEq(base.position(), 3UL);
  if (base.innerVersion().major == 0) {
    assertEq(
        take(std::move(base).parsePatch()).finish().unwrap(),
        Version::newFullVersion(0, 9, 1)
    );
  } else {
    error(std::source_location::current(), "unexpected major version");
  }

  pass();
}

static void
testParse() {
  assertEq(ModularParser("1.2").parse().unwrap(), Version::newBaseVersion(1, 2));
  assertEq(
      ModularParser("1.2.3").parse().unwrap(), Version::newFullVersion(1, 2, 3)
  );
  assertEq(
      ModularParser("1.2.3.4").parse().unwrap_err().reason(),
      ParseErrorReason::expectedEndOfInput(".4")
  );
  assertEq(
      ModularParser("1").parse().unwrap_err().kind(),
      ParseErrorReason::ExpectedSeparator
  );
  assertEq(
      ModularParser("1.0.0-alpha").parse().unwrap_err().reason(),
      ParseErrorReason::expectedEndOfInput("-alpha")
  );
  assertEq(
      ModularParser("1.2.").parse().unwrap_err().reason(),
      ParseErrorReason::expectedNumericToken(std::nullopt)
  );

  pass();
}

static void
testDiagnostic() {
  assertEq(
      ModularParser("1.0.0-alpha").parse().unwrap_err().toString(),
      "Unable to parse '1.0.0-alpha' to a version number: Expected end of "
      "input after parsing the last version number component, but got: "
      "'-alpha'\n"
      "1.0.0-alpha\n"
      "     ^~~~~~"
  );
  assertEq(
      ModularParser("1.x").parse().unwrap_err().toString(),
      "Unable to parse '1.x' to a version number: Expected numeric token "
      "(0-9), but got 'x'\n"
      "1.x\n"
      "  ^"
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseBaseAccepted();
  tests::testParseBaseRejected();
  tests::testParseBaseOverflow();
  tests::testFinishRejectsTrailingInput();
  tests::testParsePatch();
  tests::testParseFullRejectsBase();
  tests::testParsePatchOrFinish();
  tests::testBranchAfterBase();
  tests::testParse();
  tests::testDiagnostic();
}

#endif
