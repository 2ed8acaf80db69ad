#ifndef SCINUM_CORE_DISPLAY_HPP
#define SCINUM_CORE_DISPLAY_HPP

// Display formats.
//
// Scientific: fixed fractional digits, 'e', plain signed exponent.
//   (2.5, 10)   -> "2.500e10"
//   (-1.25, -3) -> "-1.250e-3"
//   zero        -> "0.000e0"
//
// Compact: trailing zeros trimmed, K/M suffixes below 1e9.
//   (1.5, 3)  -> "1.5K"      (3, 5) -> "300K"      (5, 6) -> "5M"
//   (3, 10)   -> "3e10"      zero   -> "0"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ostream>
#include <string>

#include "scinum/core/enums.hpp"
#include "scinum/core/limits.hpp"
#include "scinum/core/normalize.hpp"
#include "scinum/core/scientific.hpp"

namespace scinum {

namespace detail {

inline std::string formatFixed(double X, int Digits) {
  char Buf[64];
  std::snprintf(Buf, sizeof(Buf), "%.*f", Digits, X);
  return Buf;
}

inline double parsed(const std::string &Text) {
  return std::strtod(Text.c_str(), nullptr);
}

inline std::string formatTrimmed(double X, int Digits) {
  std::string Text = formatFixed(X, Digits);
  if (Text.find('.') != std::string::npos) {
    Text.erase(Text.find_last_not_of('0') + 1);
    if (Text.back() == '.')
      Text.pop_back();
  }
  if (Text == "-0")
    Text = "0";
  return Text;
}

inline int clampDigits(int Digits) {
  return std::clamp(Digits, 0, MaxDisplayDigits);
}

} // namespace detail

inline std::string toDisplayString(Scientific V, int Digits = DisplayDigits) {
  Digits = detail::clampDigits(Digits);
  double M = V.mantissa();
  WideExponent E = V.exponent();

  std::string Mantissa = detail::formatFixed(M, Digits);
  // Rounding to Digits can carry 9.9996 up to 10.000.
  if (std::fabs(detail::parsed(Mantissa)) >= 10.0) {
    Mantissa = detail::formatFixed(M / 10.0, Digits);
    ++E;
  }
  return Mantissa + "e" + std::to_string(E);
}

inline std::string toCompactString(Scientific V,
                                   int Precision = CompactPrecision) {
  if (V.isZero())
    return "0";
  Precision = detail::clampDigits(Precision);
  WideExponent E = V.exponent();

  if (E < 9) {
    static constexpr const char *Suffixes[] = {"", "K", "M"};
    int Tier = E < 0 ? 0 : static_cast<int>(E / 3);
    double Scaled = detail::scaleByPow10(V.mantissa(),
                                         static_cast<int>(E) - 3 * Tier);
    std::string Text = detail::formatTrimmed(Scaled, Precision);
    if (std::fabs(detail::parsed(Text)) < 1000.0)
      return Text + Suffixes[Tier];
    // Rounded up into the next tier: 999.999 -> "1K".
    if (Tier < 2)
      return detail::formatTrimmed(Scaled / 1000.0, Precision) +
             Suffixes[Tier + 1];
    E = 9;
    return detail::formatTrimmed(V.mantissa() < 0 ? -1.0 : 1.0, Precision) +
           "e" + std::to_string(E);
  }

  std::string Mantissa = detail::formatTrimmed(V.mantissa(), Precision);
  if (std::fabs(detail::parsed(Mantissa)) >= 10.0) {
    Mantissa = detail::formatTrimmed(V.mantissa() / 10.0, Precision);
    ++E;
  }
  return Mantissa + "e" + std::to_string(E);
}

inline std::string toString(Scientific V,
                            Notation N = Notation::Scientific) {
  switch (N) {
  case Notation::Scientific: return toDisplayString(V);
  case Notation::Compact:    return toCompactString(V);
  }
  return toDisplayString(V);
}

inline std::ostream &operator<<(std::ostream &OS, Scientific V) {
  return OS << toDisplayString(V);
}

} // namespace scinum

#endif // SCINUM_CORE_DISPLAY_HPP
