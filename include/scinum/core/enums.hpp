#ifndef SCINUM_CORE_ENUMS_HPP
#define SCINUM_CORE_ENUMS_HPP

#include <cstdint>

namespace scinum {

// Conditions raised by an operation. Several may be set at once.
enum class Status : std::uint8_t {
  None = 0,
  DivideByZero = 1 << 0, // divisor was the canonical zero
  Overflow = 1 << 1,     // saturated to the largest magnitude
  Underflow = 1 << 2,    // saturated to the smallest magnitude
  Absorbed = 1 << 3,     // smaller addend was below the precision threshold
  Invalid = 1 << 4,      // non-finite mantissa
};

constexpr Status operator|(Status A, Status B) {
  return static_cast<Status>(static_cast<std::uint8_t>(A) |
                             static_cast<std::uint8_t>(B));
}

constexpr Status operator&(Status A, Status B) {
  return static_cast<Status>(static_cast<std::uint8_t>(A) &
                             static_cast<std::uint8_t>(B));
}

constexpr Status &operator|=(Status &A, Status B) { return A = A | B; }

constexpr bool any(Status S) { return S != Status::None; }

constexpr bool has(Status S, Status Flag) { return any(S & Flag); }

// Name of the most severe flag in S, for diagnostics.
inline const char *statusName(Status S) {
  if (has(S, Status::Invalid))      return "invalid mantissa";
  if (has(S, Status::DivideByZero)) return "division by zero";
  if (has(S, Status::Overflow))     return "exponent overflow";
  if (has(S, Status::Underflow))    return "exponent underflow";
  if (has(S, Status::Absorbed))     return "negligible operand absorbed";
  return "ok";
}

enum class Notation {
  Scientific, // "2.500e10"
  Compact     // "1.5K", "300K", "5M", "2.5e10"
};

} // namespace scinum

#endif // SCINUM_CORE_ENUMS_HPP
