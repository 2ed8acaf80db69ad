// Cross-validation tests: verify that independent implementations agree.
//
// Every test is an instance of the same pattern: take two adapters that
// should agree, run them on the same inputs, compare outputs. No adapter
// is privileged; the library under test is just the scinum adapter.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <vector>

#include "harness/impl_mpfr.hpp"
#include "harness/impl_native.hpp"
#include "harness/impl_scinum.hpp"
#include "harness/test_harness.hpp"

using namespace scinum;
using namespace scinum::testing;

// ===================================================================
// MPFR global state (must be set before any decode)
// ===================================================================

struct MpfrInit {
  MpfrInit() { oracle::widenExponentRange(); }
};

static MpfrInit GlobalMpfrInit;

// ===================================================================
// verifyAgreement: generic pairwise comparison
// ===================================================================

template <typename AdapterA, typename AdapterB, typename IterFn>
void verifyAgreement(const AdapterA &A, const AdapterB &B, IterFn Iter,
                     std::initializer_list<Op> Ops) {
  Approximately Cmp;

  for (auto O : Ops) {
    SUBCASE(opName(O)) {
      auto ImplA = [&](Scientific X, Scientific Y) {
        return A.dispatch(O, X, Y);
      };
      auto ImplB = [&](Scientific X, Scientific Y) {
        return B.dispatch(O, X, Y);
      };
      auto R = testAgainst(opName(O), O, Iter, ImplA, ImplB, Cmp);
      CHECK(R.Failed == 0);
    }
  }
}

// ===================================================================
// Arithmetic and ordering agreement
// ===================================================================

TEST_CASE("scinum vs MPFR: full exponent range") {
  const std::vector<Scientific> Interesting = interestingValues();
  auto Iter = combined(
      TargetedPairs{Interesting.data(), static_cast<int>(Interesting.size())},
      RandomPairs{42, 100000, -100000000, 100000000},
      NearPairs{7, 100000});
  verifyAgreement(ScinumAdapter{}, MpfrAdapter{}, Iter,
                  {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Eq, Op::Lt,
                   Op::Le});
}

TEST_CASE("scinum vs MPFR: saturated exponents") {
  auto Iter = RandomPairs{99, 20000, ExponentMax - 20, ExponentMax};
  verifyAgreement(ScinumAdapter{}, MpfrAdapter{}, Iter,
                  {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Lt});

  auto Tiny = RandomPairs{100, 20000, ExponentMin, ExponentMin + 20};
  verifyAgreement(ScinumAdapter{}, MpfrAdapter{}, Tiny,
                  {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Lt});
}

TEST_CASE("scinum vs Native: double range") {
  const std::vector<Scientific> Interesting = nativeInterestingValues();
  auto Iter = combined(
      TargetedPairs{Interesting.data(), static_cast<int>(Interesting.size())},
      RandomPairs{42, 100000, -150, 150});
  verifyAgreement(ScinumAdapter{}, NativeAdapter{}, Iter,
                  {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Eq, Op::Lt,
                   Op::Le});
}

TEST_CASE("Native vs MPFR: double range") {
  // Keeps the oracle honest: the host FPU is an independent third opinion
  // wherever it can answer.
  const std::vector<Scientific> Interesting = nativeInterestingValues();
  auto Iter = combined(
      TargetedPairs{Interesting.data(), static_cast<int>(Interesting.size())},
      RandomPairs{1234, 50000, -150, 150});
  verifyAgreement(NativeAdapter{}, MpfrAdapter{}, Iter,
                  {Op::Add, Op::Sub, Op::Mul, Op::Div, Op::Eq, Op::Lt,
                   Op::Le});
}

// ===================================================================
// Properties over random operands
// ===================================================================

TEST_CASE("add and mul are commutative bit for bit") {
  auto Iter = combined(RandomPairs{5, 50000, -1000, 1000}, NearPairs{6, 50000});
  ScinumAdapter Lib;
  Exact Cmp;
  auto Swapped = [&](Op O) {
    return [&Lib, O](Scientific X, Scientific Y) {
      return Lib.dispatch(O, Y, X);
    };
  };
  for (auto O : {Op::Add, Op::Mul}) {
    auto Straight = [&Lib, O](Scientific X, Scientific Y) {
      return Lib.dispatch(O, X, Y);
    };
    auto R = testAgainst(opName(O), O, Iter, Straight, Swapped(O), Cmp);
    CHECK(R.Failed == 0);
  }
}

TEST_CASE("every derived value is normalized") {
  ScinumAdapter Lib;
  int Bad = 0;
  RandomPairs{11, 50000, -1000000, 1000000}([&](Scientific X, Scientific Y) {
    for (auto O : {Op::Add, Op::Sub, Op::Mul, Op::Div}) {
      Scientific V = Lib.dispatch(O, X, Y).Value;
      double Mag = V.mantissa() < 0 ? -V.mantissa() : V.mantissa();
      bool Ok = V.isZero() ? V.exponent() == 0 : (Mag >= 1.0 && Mag < 10.0);
      if (!Ok)
        ++Bad;
    }
  });
  CHECK(Bad == 0);
}
