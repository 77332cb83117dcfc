/**
 * @file decimal128.hpp
 * @brief Ember JSON - IEEE 754-2008 decimal128 values
 *
 * Text is converted with libmpdec (mpdecimal) in a decimal128 context, so
 * precision, exponent range and clamping follow the standard exactly. The
 * result is kept in the binary integer decimal (BID) layout used by BSON:
 *
 *   high: [sign:1][biased exponent:14][coefficient bits 112..64:49]
 *   low:  [coefficient bits 63..0:64]
 *
 * License: MIT
 */

#ifndef EMBER_JSON_DECIMAL128_HPP
#define EMBER_JSON_DECIMAL128_HPP

#include "ember_json/error.hpp"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <new>
#include <string>
#include <string_view>

#include <mpdecimal.h>

namespace ember {
namespace json {

namespace detail {

struct MpdDeleter {
  void operator()(mpd_t *d) const noexcept { mpd_del(d); }
};
using MpdPtr = std::unique_ptr<mpd_t, MpdDeleter>;

struct MpdFree {
  void operator()(void *p) const noexcept { mpd_free(p); }
};

inline MpdPtr mpd_make() {
  MpdPtr d(mpd_qnew());
  if (!d)
    throw std::bad_alloc();
  return d;
}

constexpr int kDecimalExponentBias = 6176;
constexpr uint64_t kDecimalSignBit = 1ULL << 63;
constexpr uint64_t kDecimalInfinity = 0x7800000000000000ULL;
constexpr uint64_t kDecimalNaN = 0x7C00000000000000ULL;
constexpr uint64_t kDecimalSNaN = 0x7E00000000000000ULL;
constexpr uint64_t kDecimalCoefficientHighMask = 0x0001FFFFFFFFFFFFULL;

// 10^34 - 1, the largest canonical coefficient
constexpr uint64_t kDecimalMaxCoefficientHigh = 0x0001ED09BEAD87C0ULL;
constexpr uint64_t kDecimalMaxCoefficientLow = 0x378D8E63FFFFFFFFULL;

} // namespace detail

class Decimal128 {
  uint64_t high_ = 0x3040000000000000ULL; // 0E+0
  uint64_t low_ = 0;

public:
  constexpr Decimal128() = default;
  constexpr Decimal128(uint64_t high, uint64_t low) : high_(high), low_(low) {}

  constexpr uint64_t high() const { return high_; }
  constexpr uint64_t low() const { return low_; }

  constexpr bool is_negative() const {
    return (high_ & detail::kDecimalSignBit) != 0;
  }
  constexpr bool is_nan() const {
    return (high_ & detail::kDecimalNaN) == detail::kDecimalNaN;
  }
  constexpr bool is_infinite() const {
    return !is_nan() && (high_ & detail::kDecimalInfinity) ==
                            detail::kDecimalInfinity;
  }

  /**
   * @brief Parses decimal text ("1.50", "-1E+10", "NaN", "Infinity")
   *
   * Fails with Error::DecimalParse when the text is not a decimal number,
   * overflows the decimal128 range, or would need rounding. Trailing zeros
   * are significant and preserved.
   */
  static ParseResult parse(std::string_view text, Decimal128 &out);

  /// Scientific string form, the inverse of parse() ("1.50", "1.5E-7").
  std::string to_string() const;

  friend bool operator==(const Decimal128 &, const Decimal128 &) = default;
};

inline ParseResult Decimal128::parse(std::string_view text, Decimal128 &out) {
  mpd_context_t ctx;
  mpd_ieee_context(&ctx, MPD_DECIMAL128);

  const std::string buf(text);
  detail::MpdPtr dec = detail::mpd_make();
  uint32_t status = 0;
  mpd_qset_string(dec.get(), buf.c_str(), &ctx, &status);

  if (status & MPD_Malloc_error)
    throw std::bad_alloc();
  if (status & MPD_Conversion_syntax)
    return ParseResult::fail(Error::DecimalParse,
                             "'" + buf + "' is not a valid decimal128 string");
  if (status & MPD_Overflow)
    return ParseResult::fail(Error::DecimalParse,
                             "value '" + buf + "' is out of range for decimal128");
  if (status & MPD_Inexact)
    return ParseResult::fail(Error::DecimalParse,
                             "value '" + buf +
                                 "' cannot be represented exactly as decimal128");

  const uint64_t sign = mpd_isnegative(dec.get()) ? detail::kDecimalSignBit : 0;
  if (mpd_isinfinite(dec.get())) {
    out = Decimal128(sign | detail::kDecimalInfinity, 0);
    return ParseResult::ok();
  }
  if (mpd_issnan(dec.get())) {
    out = Decimal128(sign | detail::kDecimalSNaN, 0);
    return ParseResult::ok();
  }
  if (mpd_isnan(dec.get())) {
    out = Decimal128(sign | detail::kDecimalNaN, 0);
    return ParseResult::ok();
  }

  uint64_t coeff_high = 0;
  uint64_t coeff_low = 0;
  if (!mpd_iszero(dec.get())) {
    detail::MpdPtr coeff = detail::mpd_make();
    if (!mpd_qcopy(coeff.get(), dec.get(), &status))
      throw std::bad_alloc();
    mpd_set_positive(coeff.get());
    coeff->exp = 0;

    uint16_t *words = nullptr;
    const size_t n = mpd_qexport_u16(&words, 0, 1U << 16, coeff.get(), &status);
    std::unique_ptr<uint16_t, detail::MpdFree> guard(words);
    if (n == SIZE_MAX)
      throw std::bad_alloc();
    for (size_t i = 0; i < n && i < 8; ++i) {
      if (i < 4)
        coeff_low |= static_cast<uint64_t>(words[i]) << (16 * i);
      else
        coeff_high |= static_cast<uint64_t>(words[i]) << (16 * (i - 4));
    }
  }

  const uint64_t biased =
      static_cast<uint64_t>(dec->exp + detail::kDecimalExponentBias);
  out = Decimal128(sign | (biased << 49) |
                       (coeff_high & detail::kDecimalCoefficientHighMask),
                   coeff_low);
  return ParseResult::ok();
}

inline std::string Decimal128::to_string() const {
  if (is_nan())
    return "NaN";
  if (is_infinite())
    return is_negative() ? "-Infinity" : "Infinity";

  uint64_t coeff_high;
  uint64_t coeff_low = low_;
  int64_t biased;
  if (((high_ >> 61) & 3) == 3) {
    // Combination field 11: coefficient would exceed 113 bits, so it is
    // non-canonical and reads as zero.
    biased = static_cast<int64_t>((high_ >> 47) & 0x3FFF);
    coeff_high = 0;
    coeff_low = 0;
  } else {
    biased = static_cast<int64_t>((high_ >> 49) & 0x3FFF);
    coeff_high = high_ & detail::kDecimalCoefficientHighMask;
  }
  if (coeff_high > detail::kDecimalMaxCoefficientHigh ||
      (coeff_high == detail::kDecimalMaxCoefficientHigh &&
       coeff_low > detail::kDecimalMaxCoefficientLow)) {
    coeff_high = 0;
    coeff_low = 0;
  }

  uint16_t words[8];
  size_t n = 0;
  for (size_t i = 0; i < 8; ++i) {
    const uint64_t part = i < 4 ? coeff_low : coeff_high;
    words[i] = static_cast<uint16_t>(part >> (16 * (i % 4)));
    if (words[i] != 0)
      n = i + 1;
  }
  if (n == 0)
    n = 1;

  mpd_context_t ctx;
  mpd_maxcontext(&ctx);
  detail::MpdPtr dec = detail::mpd_make();
  uint32_t status = 0;
  mpd_qimport_u16(dec.get(), words, n, is_negative() ? MPD_NEG : MPD_POS,
                  1U << 16, &ctx, &status);
  if (status & MPD_Malloc_error)
    throw std::bad_alloc();
  dec->exp = biased - detail::kDecimalExponentBias;

  std::unique_ptr<char, detail::MpdFree> text(mpd_to_sci(dec.get(), 1));
  if (!text)
    throw std::bad_alloc();
  return std::string(text.get());
}

} // namespace json
} // namespace ember

#endif // EMBER_JSON_DECIMAL128_HPP
