#ifndef SCINUM_CORE_EXCEPTIONS_HPP
#define SCINUM_CORE_EXCEPTIONS_HPP

#include <concepts>
#include <stdexcept>
#include <string>

#include "scinum/core/enums.hpp"

namespace scinum {

// Thrown by the policy-driven operations for trapped conditions, and by
// the constructor for a non-finite mantissa.
class ArithmeticError : public std::domain_error {
public:
  ArithmeticError(const char *Operation, Status Flags)
      : std::domain_error(std::string("scinum: ") + Operation + ": " +
                          statusName(Flags)),
        Flags(Flags) {}

  Status status() const noexcept { return Flags; }

private:
  Status Flags;
};

// An exception policy names the status bits that throw. Division by zero
// must always be among them.
template <typename E>
concept ExceptionPolicy = requires {
  { E::traps } -> std::convertible_to<Status>;
} && has(E::traps, Status::DivideByZero);

namespace exceptions {

// Exponent overflow and underflow saturate and are reported only through
// checked operations.
struct Saturating {
  static constexpr Status traps = Status::DivideByZero | Status::Invalid;
};

// Every out-of-range exponent throws.
struct Strict {
  static constexpr Status traps = Status::DivideByZero | Status::Invalid |
                                  Status::Overflow | Status::Underflow;
};

using Default = Saturating;

static_assert(ExceptionPolicy<Saturating>);
static_assert(ExceptionPolicy<Strict>);
static_assert(!has(Saturating::traps, Status::Absorbed));
static_assert(!has(Strict::traps, Status::Absorbed));

} // namespace exceptions

// Throw if any bit of Flags is trapped by the policy.
template <ExceptionPolicy Exc>
void trap(const char *Operation, Status Flags) {
  Status Trapped = Flags & Exc::traps;
  if (any(Trapped))
    throw ArithmeticError(Operation, Trapped);
}

} // namespace scinum

#endif // SCINUM_CORE_EXCEPTIONS_HPP
