#ifndef SCINUM_CORE_ARITHMETIC_HPP
#define SCINUM_CORE_ARITHMETIC_HPP

// Arithmetic comes in two forms:
//
//   checked::add(a, b) -> Result   never throws; status in Result::Flags
//   add<Policy>(a, b)  -> value    throws ArithmeticError for any status
//                                  bit the exception policy traps
//
// The operators + - * / use exceptions::Default.

#include "scinum/core/enums.hpp"
#include "scinum/core/exceptions.hpp"
#include "scinum/core/limits.hpp"
#include "scinum/core/normalize.hpp"
#include "scinum/core/scientific.hpp"

namespace scinum {

struct Result {
  Scientific Value;
  Status Flags = Status::None;

  // False only when the operation had no numeric answer (division by
  // zero). Saturated and absorbed results are still results.
  constexpr bool ok() const { return !has(Flags, Status::DivideByZero); }
};

namespace detail {

inline Result finish(const Normalized &N) {
  return {Builder::make(N), N.Flags};
}

} // namespace detail

namespace checked {

inline Result add(Scientific A, Scientific B) {
  if (A.isZero())
    return {B};
  if (B.isZero())
    return {A};

  WideExponent Gap = WideExponent(A.exponent()) - B.exponent();
  const Scientific &Hi = Gap >= 0 ? A : B;
  const Scientific &Lo = Gap >= 0 ? B : A;
  WideExponent Distance = Gap >= 0 ? Gap : -Gap;

  if (Distance > NegligibleExponentGap)
    return {Hi, Status::Absorbed};

  double Aligned =
      detail::scaleByPow10(Lo.mantissa(), -static_cast<int>(Distance));
  return detail::finish(normalize(Hi.mantissa() + Aligned, Hi.exponent()));
}

inline Result sub(Scientific A, Scientific B) { return add(A, -B); }

inline Result mul(Scientific A, Scientific B) {
  if (A.isZero() || B.isZero())
    return {Scientific::zero()};
  return detail::finish(
      normalize(A.mantissa() * B.mantissa(),
                WideExponent(A.exponent()) + B.exponent()));
}

inline Result div(Scientific A, Scientific B) {
  if (B.isZero())
    return {Scientific::zero(), Status::DivideByZero};
  if (A.isZero())
    return {Scientific::zero()};
  return detail::finish(
      normalize(A.mantissa() / B.mantissa(),
                WideExponent(A.exponent()) - B.exponent()));
}

} // namespace checked

template <ExceptionPolicy Exc = exceptions::Default>
Scientific add(Scientific A, Scientific B) {
  Result R = checked::add(A, B);
  trap<Exc>("add", R.Flags);
  return R.Value;
}

template <ExceptionPolicy Exc = exceptions::Default>
Scientific sub(Scientific A, Scientific B) {
  Result R = checked::sub(A, B);
  trap<Exc>("sub", R.Flags);
  return R.Value;
}

template <ExceptionPolicy Exc = exceptions::Default>
Scientific mul(Scientific A, Scientific B) {
  Result R = checked::mul(A, B);
  trap<Exc>("mul", R.Flags);
  return R.Value;
}

template <ExceptionPolicy Exc = exceptions::Default>
Scientific div(Scientific A, Scientific B) {
  Result R = checked::div(A, B);
  trap<Exc>("div", R.Flags);
  return R.Value;
}

inline Scientific operator+(Scientific A, Scientific B) { return add(A, B); }
inline Scientific operator-(Scientific A, Scientific B) { return sub(A, B); }
inline Scientific operator*(Scientific A, Scientific B) { return mul(A, B); }
inline Scientific operator/(Scientific A, Scientific B) { return div(A, B); }

} // namespace scinum

#endif // SCINUM_CORE_ARITHMETIC_HPP
