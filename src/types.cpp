// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "zonematch/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace zonematch {

namespace {

// Largest magnitude accepted; keeps raw values clear of the invalid marker.
constexpr double kMaxMagnitude = 9.0e18;
constexpr int64_t kMaxIntegerPart = 9000000000;

}  // namespace

Decimal::Decimal(double value) noexcept {
  const double scaled = value * static_cast<double>(kScale);
  if (!std::isfinite(scaled) || std::abs(scaled) >= kMaxMagnitude) {
    raw_ = kInvalidRaw;
    return;
  }
  raw_ = static_cast<int64_t>(std::llround(scaled));
}

Decimal Decimal::parse(const std::string& text) {
  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }

  int64_t integer_part = 0;
  int64_t fraction = 0;
  int fraction_digits = 0;
  int digit_count = 0;
  bool round_up = false;
  bool seen_point = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        throw std::invalid_argument("Decimal: multiple decimal points in '" +
                                    text + "'");
      }
      seen_point = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("Decimal: unexpected character in '" +
                                  text + "'");
    }
    const int digit = c - '0';
    ++digit_count;
    if (!seen_point) {
      integer_part = integer_part * 10 + digit;
      if (integer_part > kMaxIntegerPart) {
        throw std::invalid_argument("Decimal: value out of range '" + text +
                                    "'");
      }
    } else if (fraction_digits < kFractionDigits) {
      fraction = fraction * 10 + digit;
      ++fraction_digits;
    } else if (fraction_digits == kFractionDigits) {
      round_up = digit >= 5;
      ++fraction_digits;  // Only the first dropped digit decides rounding
    }
  }

  if (digit_count == 0) {
    throw std::invalid_argument("Decimal: no digits in '" + text + "'");
  }

  for (int i = std::min(fraction_digits, kFractionDigits); i < kFractionDigits;
       ++i) {
    fraction *= 10;
  }

  int64_t magnitude = integer_part * kScale + fraction + (round_up ? 1 : 0);
  return fromRaw(negative ? -magnitude : magnitude);
}

double Decimal::toDouble() const noexcept {
  if (!isValid()) return std::numeric_limits<double>::quiet_NaN();
  const int64_t integer_part = raw_ / kScale;
  const int64_t fraction = raw_ % kScale;
  return static_cast<double>(integer_part) +
         static_cast<double>(fraction) / static_cast<double>(kScale);
}

std::string Decimal::toString() const {
  if (!isValid()) return "NaN";

  const bool negative = raw_ < 0;
  const uint64_t magnitude =
      negative ? static_cast<uint64_t>(-(raw_ + 1)) + 1 : static_cast<uint64_t>(raw_);
  const uint64_t integer_part = magnitude / kScale;
  uint64_t fraction = magnitude % kScale;

  std::string out = negative ? "-" : "";
  out += std::to_string(integer_part);
  if (fraction == 0) return out;

  std::string digits(kFractionDigits, '0');
  for (int i = kFractionDigits - 1; i >= 0; --i) {
    digits[i] = static_cast<char>('0' + fraction % 10);
    fraction /= 10;
  }
  digits.erase(digits.find_last_not_of('0') + 1);
  return out + "." + digits;
}

}  // namespace zonematch
