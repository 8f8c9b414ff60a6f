#include "internal/util/money.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using chronicle::util::Money;

void TestParseAndFormat() {
  assert(Money::Parse("12").Cents() == 1200);
  assert(Money::Parse("12.3").Cents() == 1230);
  assert(Money::Parse("12.34").Cents() == 1234);
  assert(Money::Parse("-0.05").Cents() == -5);
  assert(Money::Parse("+7.50").Cents() == 750);

  assert(Money::FromCents(130000).ToString() == "1300.00");
  assert(Money::FromCents(-5).ToString() == "-0.05");
  assert(Money::FromCents(7).ToString() == "0.07");
}

void TestParseRejectsMalformed() {
  for (const std::string bad : {"", "-", "abc", "1.234", "1,00", "1.2.3", ".", "99999999999999999999", "92233720368547758.08",
                                "92233720368547759", "-99999999999999999999.99"}) {
    bool threw = false;
    try {
      (void)Money::Parse(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw && "malformed amount must be rejected");
  }

  // the widest amount int64 cents can hold
  assert(Money::Parse("92233720368547758.07").Cents() == std::numeric_limits<int64_t>::max());
  assert(Money::Parse("-92233720368547758.07").Cents() == -std::numeric_limits<int64_t>::max());
}

void TestArithmeticOverflowThrows() {
  const auto top = Money::FromCents(std::numeric_limits<int64_t>::max());
  const auto low = Money::FromCents(std::numeric_limits<int64_t>::min());

  assert(!top.CheckedAdd(Money::FromCents(1)).has_value());
  assert(!low.CheckedAdd(Money::FromCents(-1)).has_value());
  assert(*top.CheckedAdd(Money::FromCents(-1)) == Money::FromCents(std::numeric_limits<int64_t>::max() - 1));

  bool threw = false;
  try {
    Money sum = top;
    sum += Money::FromCents(1);
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)(low - Money::FromCents(1));
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);

  assert(low.ToString() == "-92233720368547758.08");
}

void TestArithmeticIsExact() {
  // 0.1 + 0.2 in binary floating point is not 0.3
  Money sum = Money::Parse("0.10") + Money::Parse("0.20");
  assert(sum == Money::Parse("0.30"));

  Money balance = Money::FromCents(100000);
  balance += Money::FromCents(50000);
  balance -= Money::FromCents(20000);
  assert(balance.Cents() == 130000);
  assert(-balance == Money::FromCents(-130000));
  assert(Money::FromCents(1) > Money());
}

void TestUuidFormat() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto id = chronicle::util::NewId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(seen.insert(id).second);
    assert(chronicle::util::ToString(chronicle::util::FromString(id)) == id);
  }

  assert(chronicle::util::NewVersionToken() != chronicle::util::NewVersionToken());
  for (const std::string bad : {"", "not-a-uuid", "0123456789abcdef0123456789abcdef00", "0123456789abcdef0123456789abcdeg"}) {
    bool threw = false;
    try {
      (void)chronicle::util::FromString(bad);
    } catch (const chronicle::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestTimeConversions() {
  const auto tp = chronicle::util::FromUnixMillis(1700000000123);
  assert(chronicle::util::ToUnixMillis(tp) == 1700000000123);
  assert(chronicle::util::ToUnixMillis(chronicle::util::FromProto(chronicle::util::ToProto(tp))) == 1700000000123);
  assert(chronicle::util::FormatUtc(chronicle::util::FromUnixMillis(0)) == "1970-01-01T00:00:00Z");
}

void TestErrorKindNames() {
  assert(chronicle::util::Describe(chronicle::util::ErrorKind::kConcurrencyConflict) == "ConcurrencyConflict");
  assert(chronicle::util::Describe(chronicle::util::WriteStatus::kStreamNotFound) == "StreamNotFound");

  chronicle::util::SerializationError e("account-1", "bad payload");
  assert(e.Kind() == chronicle::util::ErrorKind::kSerializationError);
  assert(e.Key() == "account-1");

  bool wrapped = false;
  try {
    chronicle::util::GuardStorage("doc/1", []() -> int { throw std::runtime_error("disk I/O error"); });
  } catch (const chronicle::util::StorageUnavailable& su) {
    wrapped = su.Key() == "doc/1";
  }
  assert(wrapped);
}

} // namespace

int main() {
  TestParseAndFormat();
  TestParseRejectsMalformed();
  TestArithmeticIsExact();
  TestArithmeticOverflowThrows();
  TestUuidFormat();
  TestTimeConversions();
  TestErrorKindNames();

  std::cout << "chronicle_unit_money: pass\n";
  return 0;
}
