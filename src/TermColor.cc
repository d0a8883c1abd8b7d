#include "TermColor.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string_view>
#include <unistd.h>

namespace vernum {

ColorMode
parseColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    return ColorMode::Always;
  } else if (str == "auto") {
    return ColorMode::Auto;
  } else if (str == "never") {
    return ColorMode::Never;
  } else {
    spdlog::warn("unknown color mode `{}`; falling back to auto", str);
    return ColorMode::Auto;
  }
}

struct ColorState {
  // ColorState is a singleton
  ColorState(const ColorState&) = delete;
  ColorState& operator=(const ColorState&) = delete;
  ColorState(ColorState&&) noexcept = delete;
  ColorState& operator=(ColorState&&) noexcept = delete;
  ~ColorState() noexcept = default;

  void set(const ColorMode mode) noexcept {
    this->mode = mode;
  }
  ColorMode get() const noexcept {
    return mode;
  }

  static ColorState& instance() noexcept {
    static ColorState instance;
    return instance;
  }

private:
  ColorMode mode = ColorMode::Auto;

  // --color given on the command line overrides this.
  ColorState() noexcept {
    if (const char* color = std::getenv("VERNUM_TERM_COLOR")) {
      mode = parseColorMode(color);
    }
  }
};

void
setColorMode(const ColorMode mode) noexcept {
  ColorState::instance().set(mode);
}
void
setColorMode(const std::string_view str) noexcept {
  setColorMode(parseColorMode(str));
}

ColorMode
getColorMode() noexcept {
  return ColorState::instance().get();
}

static bool
isTerm(const std::ostream& os) noexcept {
  if (&os == &std::cout) {
    return isatty(fileno(stdout));
  } else if (&os == &std::cerr) {
    return isatty(fileno(stderr));
  }
  return false;
}

bool
shouldColor(const std::ostream& os) noexcept {
  switch (getColorMode()) {
    case ColorMode::Always:
      return true;
    case ColorMode::Auto:
      return isTerm(os);
    case ColorMode::Never:
      return false;
  }
  return false;
}
bool
shouldColorStdout() noexcept {
  return shouldColor(std::cout);
}
bool
shouldColorStderr() noexcept {
  return shouldColor(std::cerr);
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "Rustify/Tests.hpp"

#  include <fmt/format.h>
#  include <sstream>

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testParseColorMode() {
  assertTrue(parseColorMode("always") == ColorMode::Always);
  assertTrue(parseColorMode("auto") == ColorMode::Auto);
  assertTrue(parseColorMode("never") == ColorMode::Never);
  assertTrue(parseColorMode("sometimes") == ColorMode::Auto);

  pass();
}

static void
testColorAlways() {
  setColorMode(ColorMode::Always);
  assertEq(Red("1.x").toStr(), "\033[31m1.x\033[0m");
  assertEq(Bold(Red("^~")).toErrStr(), "\033[31;1m^~\033[0m");

  // A custom stream is never a terminal, but Always does not ask.
  std::ostringstream oss;
  oss << Green("base");
  assertEq(oss.str(), "\033[32mbase\033[0m");

  pass();
}

static void
testColorNever() {
  setColorMode("never");
  assertEq(Bold(Cyan("--parser")).toStr(), "--parser");
  assertEq(Yellow("Warning: ").toErrStr(), "Warning: ");

  pass();
}

static void
testColorAutoOnCustomStream() {
  setColorMode(ColorMode::Auto);
  std::ostringstream oss;
  oss << Bold(Yellow("1.2"));
  assertEq(oss.str(), "1.2");

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseColorMode();
  tests::testColorAlways();
  tests::testColorNever();
  tests::testColorAutoOnCustomStream();
}

#endif
