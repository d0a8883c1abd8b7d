#include "Vernum.hpp"

#include "Cli.hpp"
#include "Diag.hpp"
#include "Parser/Error.hpp"
#include "Parser/Traits.hpp"
#include "Rustify/Result.hpp"
#include "TermColor.hpp"
#include "Version.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fmt/core.h>
#include <optional>
#include <span>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <spdlog/version.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef VERNUM_PKG_VERSION
#  error "VERNUM_PKG_VERSION is not defined"
#endif

#if defined(__GNUC__) && !defined(__clang__)
#  define COMPILER_VERSION "GCC " __VERSION__
#else
#  define COMPILER_VERSION __VERSION__
#endif

namespace vernum {

#if SPDLOG_VERSION > 11500
#  define LOG_ENV "VERNUM_LOG"  // NOLINT
static constexpr const char* LOG_ENV_USED = LOG_ENV;
static constexpr const char* LOG_ENV_UNUSED = "SPDLOG_LEVEL";
#else
#  define LOG_ENV  // NOLINT
static constexpr const char* LOG_ENV_USED = "SPDLOG_LEVEL";
static constexpr const char* LOG_ENV_UNUSED = "VERNUM_LOG";
#endif

std::string_view
toString(const Backend backend) noexcept {
  switch (backend) {
    case Backend::Modular:
      return "modular";
    case Backend::OneShot:
      return "oneshot";
  }
  return "unknown";
}

Result<Backend>
parseBackend(const std::string_view name) noexcept {
  if (name == "modular") {
    return Ok(Backend::Modular);
  } else if (name == "oneshot") {
    return Ok(Backend::OneShot);
  }
  Bail("invalid parser `{}`: expected `modular` or `oneshot`", name);
}

std::string_view
toString(const Expect expect) noexcept {
  switch (expect) {
    case Expect::Any:
      return "any";
    case Expect::Base:
      return "base";
    case Expect::Full:
      return "full";
  }
  return "unknown";
}

Result<Expect>
parseExpect(const std::string_view name) noexcept {
  if (name == "any") {
    return Ok(Expect::Any);
  } else if (name == "base") {
    return Ok(Expect::Base);
  } else if (name == "full") {
    return Ok(Expect::Full);
  }
  Bail("invalid shape `{}`: expected `any`, `base` or `full`", name);
}

const Cli&
getCli() noexcept {
  static const Cli cli =  //
      Cli{ "vernum" }
          .setDesc("Parse MAJOR.MINOR[.PATCH] version numbers")
          .addOpt(
              Opt{ "--verbose" }
                  .setShort("-v")
                  .setDesc("Use verbose output (-vv very verbose output)")
          )
          .addOpt(
              Opt{ "-vv" }
                  .setShort("-vv")
                  .setDesc("Use very verbose output")
                  .setHidden(true)
          )
          .addOpt(
              Opt{ "--quiet" }
                  .setShort("-q")
                  .setDesc("Do not print diagnostics")
          )
          .addOpt(
              Opt{ "--color" }
                  .setDesc("Coloring: auto, always, never")
                  .setPlaceholder("<WHEN>")
          )
          .addOpt(
              Opt{ "--parser" }
                  .setDesc("Parser backend: modular, oneshot")
                  .setPlaceholder("<NAME>")
                  .setDefault("modular")
          )
          .addOpt(
              Opt{ "--expect" }
                  .setDesc("Required shape: any, base, full")
                  .setPlaceholder("<SHAPE>")
                  .setDefault("any")
          )
          .addOpt(
              Opt{ "--keep-going" }  //
                  .setDesc("Report every invalid version, not only the first")
          )
          .addOpt(
              Opt{ "--help" }  //
                  .setShort("-h")
                  .setDesc("Print help")
          )
          .addOpt(
              Opt{ "--version" }
                  .setShort("-V")
                  .setDesc("Print version info and exit")
          )
          .setArg(
              Arg{ "VERSION" }
                  .setDesc("Version numbers to parse")
                  .setVariadic(true)
          );
  return cli;
}

static FullVersion
fmtVersion() noexcept {
  constexpr uint64_t fmtMajor = FMT_VERSION / 10000;
  constexpr uint64_t fmtMinor = FMT_VERSION / 100 % 100;
  constexpr uint64_t fmtPatch = FMT_VERSION % 100;
  return { fmtMajor, fmtMinor, fmtPatch };
}

static FullVersion
spdlogVersion() noexcept {
  return { SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH };
}

static void
printVersion() noexcept {
  fmt::print("vernum {}\n", VERNUM_PKG_VERSION);
  if (isVerbose()) {
    fmt::print(
        "release: {}\n"
        "compiler: {}\n"
        "fmt: {}\n"
        "spdlog: {}\n",
        VERNUM_PKG_VERSION, COMPILER_VERSION, fmtVersion(), spdlogVersion()
    );
  }
}

Result<std::optional<Config>>
parseArgs(const CliArgsView args) noexcept {
  Config config;
  bool showVersion = false;

  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    // Global options
    if (arg == "-h" || arg == "--help") {
      getCli().printHelp();
      return Ok(std::optional<Config>());
    } else if (arg == "-V" || arg == "--version") {
      showVersion = true;
    } else if (arg == "-v" || arg == "--verbose") {
      setDiagLevel(DiagLevel::Verbose);
    } else if (arg == "-vv") {
      setDiagLevel(DiagLevel::VeryVerbose);
    } else if (arg == "-q" || arg == "--quiet") {
      setDiagLevel(DiagLevel::Off);
    } else if (arg == "--color") {
      Ensure(itr + 1 < args.end(), "missing argument for `--color`");
      setColorMode(*++itr);
    }

    // Parser options
    else if (arg == "--parser") {
      Ensure(itr + 1 < args.end(), "missing argument for `--parser`");
      config.backend = Try(parseBackend(*++itr));
    } else if (arg == "--expect") {
      Ensure(itr + 1 < args.end(), "missing argument for `--expect`");
      config.expect = Try(parseExpect(*++itr));
    } else if (arg == "--keep-going") {
      config.keepGoing = true;
    }

    // Positional arguments
    else if (arg == "--") {
      config.inputs.insert(config.inputs.end(), itr + 1, args.end());
      break;
    } else if (arg.starts_with('-') && arg.size() > 1) {
      return getCli().noSuchArg(arg);
    } else {
      config.inputs.emplace_back(arg);
    }
  }

  if (showVersion) {
    printVersion();
    return Ok(std::optional<Config>());
  }
  if (config.inputs.empty()) {
    getCli().printHelp();
    return Ok(std::optional<Config>());
  }
  return Ok(std::optional<Config>(std::move(config)));
}

template <typename P>
  requires VersionParser<P> && BaseVersionParser<P> && FullVersionParser<P>
static Result<Version, ParseError>
parseWith(
    const P& parser, const std::string_view input, const Expect expect
) noexcept {
  if (expect == Expect::Base) {
    return parser.parseBase(input).map([](const BaseVersion ver) {
      return Version(ver);
    });
  } else if (expect == Expect::Full) {
    return parser.parseFull(input).map([](const FullVersion ver) {
      return Version(ver);
    });
  }
  return parser.parseVersion(input);
}

Result<Version, ParseError>
parseInput(
    const std::string_view input, const Backend backend, const Expect expect
) noexcept {
  if (backend == Backend::OneShot) {
    return parseWith(OneShot{}, input, expect);
  }
  return parseWith(Modular{}, input, expect);
}

static void
reportParseError(const ParseError& err) noexcept {
  Diag::error("{}", err.message());
  if (isQuiet()) {
    return;
  }

  // The annotation is printed on its own lines so that the caret aligns with
  // the input regardless of the message.
  if (const std::optional<std::size_t> cursor = err.getCursor()) {
    eprintln("{}", err.getInput());
    eprintln(
        "{}", Bold(Red(renderUnderline(err.getInput(), cursor.value())))
    );
  }
}

Result<void>
run(const Config& config) noexcept {
  spdlog::debug(
      "parser={}, expect={}, keep-going={}, inputs={}",
      toString(config.backend), toString(config.expect), config.keepGoing,
      config.inputs.size()
  );
  Diag::verbose("Using the {} parser", toString(config.backend));

  std::size_t failed = 0;
  for (const std::string& input : config.inputs) {
    spdlog::trace("parsing `{}`", input);

    const Result<Version, ParseError> res =
        parseInput(input, config.backend, config.expect);
    if (res.is_ok()) {
      const Version& ver = res.unwrap();
      println("{}: {} {}", input, toString(ver.variant()), ver);
      Diag::veryVerbose(
          "  major={} minor={} patch={}", ver.getMajor(), ver.getMinor(),
          ver.getPatch().has_value() ? std::to_string(ver.getPatch().value())
                                     : "-"
      );
      continue;
    }

    reportParseError(res.unwrap_err());
    ++failed;
    if (!config.keepGoing) {
      Bail("could not parse `{}` due to the previous error", input);
    }
  }

  if (failed > 0) {
    Bail("could not parse {} of {} versions", failed, config.inputs.size());
  }
  return Ok();
}

static std::string
formatAnyhowError(std::string s) {
  if (!s.empty() && s.back() == '\n') {
    s.pop_back();  // remove the last '\n' since Diag::error adds one.
  }
  return s;
}

static Result<void>
runWithArgs(const int argc, char* argv[]) noexcept {  // NOLINT(*-avoid-c-arrays)
  // Drop the first argument (program name)
  const std::vector<std::string> args =
      Try(getCli().expandOpts({ argv + 1, argv + argc }));
  const std::optional<Config> config = Try(parseArgs(args));
  if (!config.has_value()) {
    return Ok();
  }
  return run(config.value());
}

Result<void, void>
vernumMain(int argc, char* argv[]) noexcept {  // NOLINT(*-avoid-c-arrays)
  // Set up logger
  spdlog::cfg::load_env_levels(LOG_ENV);
  if (std::getenv(LOG_ENV_UNUSED)) {
    Diag::warn(
        "{} is set but not used. Use {} instead.", LOG_ENV_UNUSED, LOG_ENV_USED
    );
  }

  return runWithArgs(argc, argv)
      .map_err([](const auto& e) { return formatAnyhowError(e->what()); })
      .map_err([](std::string e) { Diag::error("{}", std::move(e)); });
}

}  // namespace vernum

#ifdef VERNUM_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace vernum;  // NOLINT(build/namespaces,google-build-using-namespace)

static Result<std::optional<Config>>
parseArgsOf(const std::vector<std::string>& args) {
  return parseArgs(args);
}

static void
testParseBackendAndExpect() {
  assertTrue(parseBackend("modular").unwrap() == Backend::Modular);
  assertTrue(parseBackend("oneshot").unwrap() == Backend::OneShot);
  assertEq(
      parseBackend("fast").unwrap_err()->what(),
      "invalid parser `fast`: expected `modular` or `oneshot`"
  );

  assertTrue(parseExpect("any").unwrap() == Expect::Any);
  assertTrue(parseExpect("base").unwrap() == Expect::Base);
  assertTrue(parseExpect("full").unwrap() == Expect::Full);
  assertIsErr(parseExpect("semver"));

  for (const Backend backend : { Backend::Modular, Backend::OneShot }) {
    assertTrue(parseBackend(toString(backend)).unwrap() == backend);
  }

  pass();
}

static void
testParseArgs() {
  {
    const Config config =
        parseArgsOf({ "1.2", "--parser", "oneshot", "1.2.3" }).unwrap().value();
    assertTrue(config.backend == Backend::OneShot);
    assertTrue(config.expect == Expect::Any);
    assertFalse(config.keepGoing);
    assertEq(config.inputs, (std::vector<std::string>{ "1.2", "1.2.3" }));
  }
  {
    const Config config =
        parseArgsOf({ "--keep-going", "--expect", "full", "--", "-1.0" })
            .unwrap()
            .value();
    assertTrue(config.backend == Backend::Modular);
    assertTrue(config.expect == Expect::Full);
    assertTrue(config.keepGoing);
    assertEq(config.inputs, (std::vector<std::string>{ "-1.0" }));
  }
  {
    assertEq(
        parseArgsOf({ "--parser" }).unwrap_err()->what(),
        "missing argument for `--parser`"
    );
    assertIsErr(parseArgsOf({ "--expect", "major" }));
    assertIsErr(parseArgsOf({ "--frobnicate", "1.2" }));
  }

  pass();
}

static void
testParseInput() {
  for (const Backend backend : { Backend::Modular, Backend::OneShot }) {
    assertEq(
        parseInput("1.2", backend, Expect::Any).unwrap(),
        Version::newBaseVersion(1, 2)
    );
    assertEq(
        parseInput("1.2.3", backend, Expect::Full).unwrap(),
        Version::newFullVersion(1, 2, 3)
    );
    assertEq(
        parseInput("1.2.3", backend, Expect::Base).unwrap_err().kind(),
        ParseErrorReason::ExpectedEndOfInput
    );
    assertEq(
        parseInput("1.2", backend, Expect::Full).unwrap_err().kind(),
        ParseErrorReason::ExpectedSeparator
    );
  }

  pass();
}

static void
testRun() {
  setDiagLevel(DiagLevel::Off);

  Config config;
  config.inputs = { "1.2", "1.2.3" };
  assertIsOk(run(config));

  config.inputs = { "1.2", "01.2", "1.x" };
  assertEq(
      run(config).unwrap_err()->what(),
      "could not parse `01.2` due to the previous error"
  );

  config.keepGoing = true;
  assertEq(
      run(config).unwrap_err()->what(), "could not parse 2 of 3 versions"
  );

  setDiagLevel(DiagLevel::Info);

  pass();
}

}  // namespace tests

int
main() {
  vernum::setColorMode("never");

  tests::testParseBackendAndExpect();
  tests::testParseArgs();
  tests::testParseInput();
  tests::testRun();
}

#endif
