#ifndef SCINUM_CORE_NORMALIZE_HPP
#define SCINUM_CORE_NORMALIZE_HPP

// Normalization: bring a raw (mantissa, exponent) pair to the form
//
//   mantissa == 0 && exponent == 0         (canonical zero), or
//   1 <= |mantissa| < 10
//
// Every value the library hands out has passed through normalize().
//
// An exponent past the range saturates the whole value, not just the
// exponent: overflow gives the largest magnitude with M's sign, underflow
// the smallest. Either way the result keeps its order against the operands.

#include <cmath>

#include "scinum/core/enums.hpp"
#include "scinum/core/limits.hpp"

namespace scinum {

struct Normalized {
  double Mantissa;
  Exponent Exp;
  Status Flags;
};

namespace detail {

// Beyond this many decades no finite double times 10^K is finite and
// nonzero: 10^-324 is below the smallest subnormal, 1.8e308 is the largest.
inline constexpr int ScaleCutoff = 650;

// M * 10^K, applied in steps of at most 10^MaxScaleStep so the scale
// factor itself never overflows or flushes to zero.
inline double scaleByPow10(double M, int K) {
  if (K > ScaleCutoff)
    return std::copysign(HUGE_VAL, M);
  if (K < -ScaleCutoff)
    return std::copysign(0.0, M);
  const double Step = std::pow(10.0, MaxScaleStep);
  while (K > MaxScaleStep) {
    M *= Step;
    K -= MaxScaleStep;
  }
  while (K < -MaxScaleStep) {
    M /= Step;
    K += MaxScaleStep;
  }
  if (K >= 0)
    return M * std::pow(10.0, K);
  return M / std::pow(10.0, -K);
}

} // namespace detail

inline Normalized normalize(double M, WideExponent E) {
  if (!std::isfinite(M))
    return {0.0, 0, Status::Invalid};
  if (M == 0.0)
    return {0.0, 0, Status::None};

  double Mag = std::fabs(M);
  if (Mag >= 10.0 || Mag < 1.0) {
    int K = static_cast<int>(std::floor(std::log10(Mag)));
    M = detail::scaleByPow10(M, -K);
    E += K;
  }

  // log10 and the scaling are each rounded, so M can land just outside
  // [1, 10), including exactly on 10.0.
  while (std::fabs(M) >= 10.0) {
    M /= 10.0;
    ++E;
  }
  while (std::fabs(M) < 1.0) {
    M *= 10.0;
    --E;
  }

  if (E > ExponentMax)
    return {std::copysign(std::nextafter(10.0, 0.0), M), ExponentMax,
            Status::Overflow};
  if (E < ExponentMin)
    return {std::copysign(1.0, M), ExponentMin, Status::Underflow};
  return {M, static_cast<Exponent>(E), Status::None};
}

} // namespace scinum

#endif // SCINUM_CORE_NORMALIZE_HPP
