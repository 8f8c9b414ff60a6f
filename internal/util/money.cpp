#include "money.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace chronicle::util {

namespace {

constexpr int64_t kMaxCents = std::numeric_limits<int64_t>::max();

} // namespace

Money Money::Parse(const std::string& text) {
  std::size_t pos      = 0;
  bool        negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }

  int64_t units  = 0;
  bool    digits = false;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    const int d = text[pos] - '0';
    if (units > (kMaxCents / 100 - d) / 10) {
      throw std::invalid_argument("amount out of range: " + text);
    }
    units  = units * 10 + d;
    digits = true;
    ++pos;
  }

  int64_t cents = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int places = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (places == 2) {
        throw std::invalid_argument("amount has more than two decimal places: " + text);
      }
      cents  = cents * 10 + (text[pos] - '0');
      digits = true;
      ++places;
      ++pos;
    }
    if (places == 1) cents *= 10;
  }

  if (!digits || pos != text.size()) {
    throw std::invalid_argument("invalid amount: " + text);
  }

  if (units > (kMaxCents - cents) / 100) {
    throw std::invalid_argument("amount out of range: " + text);
  }
  const int64_t total = units * 100 + cents;
  return Money(negative ? -total : total);
}

std::string Money::ToString() const {
  const bool     negative = cents_ < 0;
  const uint64_t abs      = negative ? 0 - static_cast<uint64_t>(cents_) : static_cast<uint64_t>(cents_);
  std::string   frac     = std::to_string(abs % 100);
  if (frac.size() < 2) frac.insert(frac.begin(), '0');
  return (negative ? "-" : "") + std::to_string(abs / 100) + "." + frac;
}

} // namespace chronicle::util
