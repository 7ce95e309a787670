#pragma once

#include <cstdint>
#include <limits>

#include "auction.hpp" // auction::i64, auction::u32

#if defined(_MSC_VER)
#  include <intrin.h>
#endif

namespace auction::math
{

  // Returns true on overflow; *out untouched in that case.
  inline bool mul_i64_overflow(i64 a, i64 b, i64* out) noexcept
  {
#if defined(_MSC_VER)
    __int64 high = 0;
    const __int64 low = _mul128(static_cast<__int64>(a), static_cast<__int64>(b), &high);

    // If high is not sign-extension of low's sign bit, overflow occurred
    const __int64 expected_high = (low < 0) ? -1 : 0;
    if ( high != expected_high )
      return true;

    *out = static_cast<i64>(low);
    return false;
#else
    const __int128 prod = static_cast<__int128>(a) * static_cast<__int128>(b);
    if ( prod > static_cast<__int128>(std::numeric_limits<i64>::max()) )
      return true;
    if ( prod < static_cast<__int128>(std::numeric_limits<i64>::min()) )
      return true;
    *out = static_cast<i64>(prod);
    return false;
#endif
  }

  inline bool add_i64_overflow(i64 a, i64 b, i64* out) noexcept
  {
    if ( b > 0 && a > std::numeric_limits<i64>::max() - b )
      return true;
    if ( b < 0 && a < std::numeric_limits<i64>::min() - b )
      return true;
    *out = a + b;
    return false;
  }

#if defined(_MSC_VER)
  // Signed 128-bit product as (high, low) for ordered comparison.
  struct Wide
  {
    __int64 high;
    unsigned __int64 low;
  };

  inline Wide mul_wide(i64 a, i64 b) noexcept
  {
    Wide w{};
    w.low = static_cast<unsigned __int64>(_mul128(a, b, &w.high));
    return w;
  }

  inline bool wide_ge(Wide a, Wide b) noexcept
  {
    if ( a.high != b.high )
      return a.high > b.high;
    return a.low >= b.low;
  }
#endif

  // Exact increment rule: value * 100 >= previous * (100 + pct), and value > previous.
  // Compared in 128-bit so no rounding lets an equal-amount bid through.
  inline bool meets_increment(i64 value_q, i64 previous_q, u32 pct) noexcept
  {
    if ( value_q <= previous_q )
      return false;
#if defined(_MSC_VER)
    return wide_ge(mul_wide(value_q, 100), mul_wide(previous_q, static_cast<i64>(100) + pct));
#else
    const __int128 lhs = static_cast<__int128>(value_q) * 100;
    const __int128 rhs = static_cast<__int128>(previous_q) * (100 + static_cast<__int128>(pct));
    return lhs >= rhs;
#endif
  }

  // Smallest amount satisfying meets_increment (ceil), saturating at i64 max.
  inline i64 min_next_bid(i64 previous_q, u32 pct) noexcept
  {
    if ( previous_q == std::numeric_limits<i64>::max() )
      return previous_q;
#if defined(_MSC_VER)
    // ceil(previous * (100 + pct) / 100) == previous + ceil(previous * pct / 100)
    i64 bump = 0;
    if ( mul_i64_overflow(previous_q, static_cast<i64>(pct), &bump) )
      return std::numeric_limits<i64>::max();
    bump = bump / 100 + ((bump % 100) > 0 ? 1 : 0);
    i64 next = 0;
    if ( add_i64_overflow(previous_q, bump, &next) )
      return std::numeric_limits<i64>::max();
#else
    const __int128 scaled = static_cast<__int128>(previous_q) * (100 + static_cast<__int128>(pct));
    __int128 next = scaled / 100 + ((scaled % 100) > 0 ? 1 : 0);
    if ( next > static_cast<__int128>(std::numeric_limits<i64>::max()) )
      return std::numeric_limits<i64>::max();
#endif
    if ( next <= previous_q )
      next = previous_q + 1;
    return static_cast<i64>(next);
  }

} // namespace auction::math
