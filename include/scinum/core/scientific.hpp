#ifndef SCINUM_CORE_SCIENTIFIC_HPP
#define SCINUM_CORE_SCIENTIFIC_HPP

#include <compare>

#include "scinum/core/enums.hpp"
#include "scinum/core/exceptions.hpp"
#include "scinum/core/limits.hpp"
#include "scinum/core/normalize.hpp"

namespace scinum {

namespace detail {
struct Builder;
} // namespace detail

// A value mantissa * 10^exponent with the mantissa kept in [1, 10) by
// magnitude, or the canonical zero (0, 0).
//
// Immutable: operations return new values. Because every value is
// normalized, equality is plain equality of the pair and ordering reduces
// to sign, then exponent, then mantissa.
class Scientific {
public:
  // Canonical zero.
  constexpr Scientific() = default;

  // Normalizing constructor. An exponent pushed out of range saturates.
  // Throws ArithmeticError for a NaN or infinite mantissa.
  Scientific(double Mantissa, Exponent Exp) {
    Normalized N = normalize(Mantissa, Exp);
    if (has(N.Flags, Status::Invalid))
      throw ArithmeticError("construct", Status::Invalid);
    M = N.Mantissa;
    E = N.Exp;
  }

  static constexpr Scientific zero() { return Scientific(); }
  static constexpr Scientific one() { return Scientific(1.0, Exponent{0}, Raw{}); }
  static Scientific fromDouble(double X) { return Scientific(X, 0); }

  constexpr double mantissa() const { return M; }
  constexpr Exponent exponent() const { return E; }

  constexpr bool isZero() const { return M == 0.0; }
  constexpr bool isNegative() const { return M < 0.0; }
  constexpr int signum() const { return M > 0.0 ? 1 : (M < 0.0 ? -1 : 0); }

  // Negation and absolute value keep the exponent, so they stay normalized.
  constexpr Scientific operator-() const {
    return isZero() ? *this : Scientific(-M, E, Raw{});
  }
  constexpr Scientific abs() const {
    return isNegative() ? -*this : *this;
  }

  friend constexpr bool operator==(const Scientific &,
                                   const Scientific &) = default;

  friend constexpr std::strong_ordering operator<=>(const Scientific &A,
                                                    const Scientific &B) {
    int SA = A.signum();
    int SB = B.signum();
    if (SA != SB)
      return SA <=> SB;
    if (SA == 0)
      return std::strong_ordering::equal;
    if (A.E != B.E) {
      std::strong_ordering ByExp = A.E <=> B.E;
      return SA > 0 ? ByExp : 0 <=> ByExp;
    }
    if (A.M < B.M)
      return std::strong_ordering::less;
    if (A.M > B.M)
      return std::strong_ordering::greater;
    return std::strong_ordering::equal;
  }

private:
  friend struct detail::Builder;

  struct Raw {};
  constexpr Scientific(double Mantissa, Exponent Exp, Raw)
      : M(Mantissa), E(Exp) {}

  double M = 0.0;
  Exponent E = 0;
};

namespace detail {

// The only way to wrap an already-normalized pair without renormalizing.
struct Builder {
  static constexpr Scientific make(const Normalized &N) {
    return Scientific(N.Mantissa, N.Exp, Scientific::Raw{});
  }
};

} // namespace detail

inline constexpr Scientific negate(Scientific A) { return -A; }
inline constexpr Scientific abs(Scientific A) { return A.abs(); }

// -1, 0 or 1.
inline constexpr int compare(const Scientific &A, const Scientific &B) {
  std::strong_ordering O = A <=> B;
  return O < 0 ? -1 : (O > 0 ? 1 : 0);
}

// Nearest double; +-inf above DBL_MAX, +-0 below the smallest subnormal.
inline double toDouble(Scientific A) {
  return detail::scaleByPow10(A.mantissa(), A.exponent());
}

} // namespace scinum

#endif // SCINUM_CORE_SCIENTIFIC_HPP
