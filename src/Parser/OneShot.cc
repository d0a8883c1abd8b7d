#include "OneShot.hpp"

#include "../Rustify/Result.hpp"
#include "../Version.hpp"
#include "Component.hpp"
#include "Error.hpp"

#include <cstdint>

namespace vernum {

Result<Version, ParseError>
OneShotParser::parse() const noexcept {
  Cursor cursor(s);

  const uint64_t major = Try(parseComponent(cursor));
  Try(parseDot(cursor));
  const uint64_t minor = Try(parseComponent(cursor));

  if (!peekIsDot(cursor)) {
    Try(expectEnd(cursor));
    return Ok(Version::newBaseVersion(major, minor));
  }

  Try(parseDot(cursor));
  const uint64_t patch = Try(parseComponent(cursor));
  Try(expectEnd(cursor));
  return Ok(Version::newFullVersion(major, minor, patch));
}

Result<BaseVersion, ParseError>
OneShotParser::parseBase() const noexcept {
  Cursor cursor(s);

  const uint64_t major = Try(parseComponent(cursor));
  Try(parseDot(cursor));
  const uint64_t minor = Try(parseComponent(cursor));
  Try(expectEnd(cursor));
  return Ok(BaseVersion{ major, minor });
}

Result<FullVersion, ParseError>
OneShotParser::parseFull() const noexcept {
  Cursor cursor(s);

  const uint64_t major = Try(parseComponent(cursor));
  Try(parseDot(cursor));
  const uint64_t minor = Try(parseComponent(cursor));
  Try(parseDot(cursor));
  const uint64_t patch = Try(parseComponent(cursor));
  Try(expectEnd(cursor));
  return Ok(FullVersion{ major, minor, patch });
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "../Rustify/Tests.hpp"
#  include "Modular.hpp"

#  include <cstdint>
#  include <limits>
#  include <string_view>

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static constexpr std::string_view INPUTS[] = {
  "",
  "0",
  "1",
  "1.",
  "1,1",
  "1.2",
  "1.2.",
  "1.2.3",
  "1.2.3.4",
  "0.0",
  "0.0.0",
  "01.0",
  "1.01",
  "1.0.01",
  "00.0",
  "x.1",
  "1.x",
  "1.2.x",
  " 1.2",
  "1.2 ",
  "1.0.0-alpha",
  "1.0.0+build",
  "1.2-rc1",
  "v1.2.3",
  "18446744073709551615.0",
  "18446744073709551616.0",
  "0.18446744073709551615.1",
  "0.0.18446744073709551616",
  "99999999999999999999999.0",
};

static void
testParse() {
  const OneShotParser parser("1.2.3");
  assertEq(parser.parse().unwrap(), Version::newFullVersion(1, 2, 3));
  // The parser keeps no state between calls.
  assertEq(parser.parse().unwrap(), Version::newFullVersion(1, 2, 3));

  assertEq(OneShotParser("4.5").parse().unwrap(), Version::newBaseVersion(4, 5));
  assertEq(
      OneShotParser("1.2.3.4").parse().unwrap_err().reason(),
      ParseErrorReason::expectedEndOfInput(".4")
  );

  pass();
}

static void
testParseBase() {
  assertEq(OneShotParser("1.2").parseBase().unwrap(), (BaseVersion{ 1, 2 }));

  const ParseError err = OneShotParser("1.2.3").parseBase().unwrap_err();
  assertEq(err.reason(), ParseErrorReason::expectedEndOfInput(".3"));
  assertTrue(err.getCursor() == std::optional<std::size_t>(3));

  pass();
}

static void
testParseFull() {
  assertEq(
      OneShotParser("1.2.3").parseFull().unwrap(), (FullVersion{ 1, 2, 3 })
  );

  const ParseError err = OneShotParser("1.2").parseFull().unwrap_err();
  assertEq(err.reason(), ParseErrorReason::expectedSeparator(std::nullopt));
  assertTrue(err.getCursor() == std::optional<std::size_t>(3));

  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
  assertEq(
      OneShotParser("18446744073709551615.0.18446744073709551615")
          .parseFull()
          .unwrap(),
      (FullVersion{ max, 0, max })
  );

  pass();
}

static void
testAgreesWithModular() {
  for (const std::string_view input : INPUTS) {
    const auto oneShot = OneShotParser(input).parse();
    const auto modular = ModularParser(input).parse();

    assertEq(oneShot.is_ok(), modular.is_ok(), input);
    if (oneShot.is_ok()) {
      assertEq(oneShot.unwrap(), modular.unwrap(), input);
    } else {
      assertEq(oneShot.unwrap_err(), modular.unwrap_err(), input);
    }
  }

  pass();
}

static void
testShapeSpecificAgreesWithModular() {
  for (const std::string_view input : INPUTS) {
    const auto oneShotBase = OneShotParser(input).parseBase();
    const auto modularBase = BaseVersion::parse(input);
    assertEq(oneShotBase.is_ok(), modularBase.is_ok(), input);
    if (oneShotBase.is_err()) {
      assertEq(oneShotBase.unwrap_err(), modularBase.unwrap_err(), input);
    }

    const auto oneShotFull = OneShotParser(input).parseFull();
    const auto modularFull = FullVersion::parse(input);
    assertEq(oneShotFull.is_ok(), modularFull.is_ok(), input);
    if (oneShotFull.is_err()) {
      assertEq(oneShotFull.unwrap_err(), modularFull.unwrap_err(), input);
    }
  }

  pass();
}

}  // namespace tests

int
main() {
  tests::testParse();
  tests::testParseBase();
  tests::testParseFull();
  tests::testAgreesWithModular();
  tests::testShapeSpecificAgreesWithModular();
}

#endif
