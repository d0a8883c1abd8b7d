// Two-component (MAJOR.MINOR) and three-component (MAJOR.MINOR.PATCH)
// version numbers.
//
// Unlike semver, the two-component shorthand `1.0` is accepted, and no
// pre-release or build metadata labels are.
#pragma once

#include "Parser/Error.hpp"
#include "Rustify/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <fmt/ostream.h>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace vernum {

struct FullVersion;

// MAJOR.MINOR
struct BaseVersion {
  uint64_t major{};
  uint64_t minor{};

  static Result<BaseVersion, ParseError> parse(std::string_view str) noexcept;
  static constexpr BaseVersion
  from(const std::tuple<uint64_t, uint64_t>& tuple) noexcept {
    return { std::get<0>(tuple), std::get<1>(tuple) };
  }

  // The patch component is set to 0.
  FullVersion toFullVersionLossy() const noexcept;
  std::string toString() const noexcept;
};
std::ostream& operator<<(std::ostream& os, const BaseVersion& ver);
bool operator==(const BaseVersion& lhs, const BaseVersion& rhs) noexcept;
bool operator!=(const BaseVersion& lhs, const BaseVersion& rhs) noexcept;
bool operator<(const BaseVersion& lhs, const BaseVersion& rhs) noexcept;
bool operator>(const BaseVersion& lhs, const BaseVersion& rhs) noexcept;
bool operator<=(const BaseVersion& lhs, const BaseVersion& rhs) noexcept;
bool operator>=(const BaseVersion& lhs, const BaseVersion& rhs) noexcept;

// MAJOR.MINOR.PATCH
struct FullVersion {
  uint64_t major{};
  uint64_t minor{};
  uint64_t patch{};

  static Result<FullVersion, ParseError> parse(std::string_view str) noexcept;
  static constexpr FullVersion
  from(const std::tuple<uint64_t, uint64_t, uint64_t>& tuple) noexcept {
    return { std::get<0>(tuple), std::get<1>(tuple), std::get<2>(tuple) };
  }

  // The patch component is dropped.
  BaseVersion toBaseVersionLossy() const noexcept;
  std::string toString() const noexcept;
};
std::ostream& operator<<(std::ostream& os, const FullVersion& ver);
bool operator==(const FullVersion& lhs, const FullVersion& rhs) noexcept;
bool operator!=(const FullVersion& lhs, const FullVersion& rhs) noexcept;
bool operator<(const FullVersion& lhs, const FullVersion& rhs) noexcept;
bool operator>(const FullVersion& lhs, const FullVersion& rhs) noexcept;
bool operator<=(const FullVersion& lhs, const FullVersion& rhs) noexcept;
bool operator>=(const FullVersion& lhs, const FullVersion& rhs) noexcept;

enum class Variant : uint8_t {
  Base,  // MAJOR.MINOR
  Full,  // MAJOR.MINOR.PATCH
};
std::string_view toString(Variant variant) noexcept;

// Either a BaseVersion or a FullVersion.
class Version {
  std::variant<BaseVersion, FullVersion> inner;

public:
  // NOLINTBEGIN(google-explicit-constructor,hicpp-explicit-conversions)
  constexpr Version(const BaseVersion ver) noexcept : inner(ver) {}
  constexpr Version(const FullVersion ver) noexcept : inner(ver) {}
  // NOLINTEND(google-explicit-constructor,hicpp-explicit-conversions)

  static constexpr Version
  newBaseVersion(const uint64_t major, const uint64_t minor) noexcept {
    return BaseVersion{ major, minor };
  }
  static constexpr Version newFullVersion(
      const uint64_t major, const uint64_t minor, const uint64_t patch
  ) noexcept {
    return FullVersion{ major, minor, patch };
  }
  static constexpr Version
  from(const std::tuple<uint64_t, uint64_t>& tuple) noexcept {
    return BaseVersion::from(tuple);
  }
  static constexpr Version
  from(const std::tuple<uint64_t, uint64_t, uint64_t>& tuple) noexcept {
    return FullVersion::from(tuple);
  }

  // Parses either shape; which one is decided by the input.
  static Result<Version, ParseError> parse(std::string_view str) noexcept;

  uint64_t getMajor() const noexcept;
  uint64_t getMinor() const noexcept;
  // std::nullopt for a two-component version.
  std::optional<uint64_t> getPatch() const noexcept;

  Variant variant() const noexcept {
    return std::holds_alternative<BaseVersion>(inner) ? Variant::Base
                                                      : Variant::Full;
  }
  bool is(const Variant v) const noexcept {
    return variant() == v;
  }

  const BaseVersion* asBase() const noexcept {
    return std::get_if<BaseVersion>(&inner);
  }
  const FullVersion* asFull() const noexcept {
    return std::get_if<FullVersion>(&inner);
  }

  template <typename Fn>
    requires std::is_invocable_v<Fn, const Version&>
  auto map(Fn&& fn) const {
    return std::invoke(std::forward<Fn>(fn), *this);
  }

  std::string toString() const noexcept;

  friend bool operator==(const Version& lhs, const Version& rhs) noexcept {
    return lhs.inner == rhs.inner;
  }
  friend bool operator!=(const Version& lhs, const Version& rhs) noexcept {
    return !(lhs == rhs);
  }
};
std::ostream& operator<<(std::ostream& os, const Version& ver);

}  // namespace vernum

template <>
struct std::hash<vernum::BaseVersion> {
  std::size_t operator()(const vernum::BaseVersion& ver) const noexcept {
    const std::size_t h = std::hash<uint64_t>{}(ver.major);
    return h ^ (std::hash<uint64_t>{}(ver.minor) + 0x9e3779b9 + (h << 6) + (h >> 2));
  }
};

template <>
struct std::hash<vernum::FullVersion> {
  std::size_t operator()(const vernum::FullVersion& ver) const noexcept {
    std::size_t h = std::hash<vernum::BaseVersion>{}(ver.toBaseVersionLossy());
    return h ^ (std::hash<uint64_t>{}(ver.patch) + 0x9e3779b9 + (h << 6) + (h >> 2));
  }
};

template <>
struct std::hash<vernum::Version> {
  std::size_t operator()(const vernum::Version& ver) const noexcept {
    if (const vernum::BaseVersion* base = ver.asBase()) {
      return std::hash<vernum::BaseVersion>{}(*base);
    }
    // Distinguish 1.2 from 1.2.0.
    return ~std::hash<vernum::FullVersion>{}(*ver.asFull());
  }
};

template <>
struct fmt::formatter<vernum::BaseVersion> : ostream_formatter {};

template <>
struct fmt::formatter<vernum::FullVersion> : ostream_formatter {};

template <>
struct fmt::formatter<vernum::Version> : ostream_formatter {};
