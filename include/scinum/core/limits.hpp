#ifndef SCINUM_CORE_LIMITS_HPP
#define SCINUM_CORE_LIMITS_HPP

#include <cstdint>
#include <limits>

namespace scinum {

// Power-of-ten exponent. Intermediate exponent arithmetic is done in
// WideExponent so that sums and differences of two Exponents never wrap.
using Exponent = std::int32_t;
using WideExponent = std::int64_t;

inline constexpr Exponent ExponentMax = std::numeric_limits<Exponent>::max();
inline constexpr Exponent ExponentMin = std::numeric_limits<Exponent>::min();

// Decimal digits a double carries reliably. When two addends' exponents
// differ by more than this, the smaller one cannot change the larger one's
// mantissa in any meaningful digit and is dropped.
inline constexpr int NegligibleExponentGap =
    std::numeric_limits<double>::digits10;

// Largest power of ten applied to a mantissa in a single scaling step.
// 10^300 and 10^-300 are both normal doubles.
inline constexpr int MaxScaleStep = 300;

// Fractional mantissa digits in the scientific display string.
inline constexpr int DisplayDigits = 3;

// Upper bound on any caller-chosen display digit count.
inline constexpr int MaxDisplayDigits = std::numeric_limits<double>::max_digits10;

// Default fractional digits for compact (K/M suffixed) display.
inline constexpr int CompactPrecision = 2;

static_assert(sizeof(WideExponent) > sizeof(Exponent),
              "wide exponent must hold the sum of two exponents");
static_assert(NegligibleExponentGap == 15, "IEEE 754 binary64 expected");
static_assert(MaxScaleStep < std::numeric_limits<double>::max_exponent10,
              "scale step must stay finite");
static_assert(DisplayDigits >= 0 && DisplayDigits <= MaxDisplayDigits);

} // namespace scinum

#endif // SCINUM_CORE_LIMITS_HPP
