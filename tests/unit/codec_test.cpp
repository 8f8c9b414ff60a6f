#include "internal/codec/json_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "chronicle/bank/v1/account_events.pb.h"
#include "chronicle/catalog/v1/documents.pb.h"
#include "internal/util/errors.hpp"

namespace {

using chronicle::bank::v1::AccountOpened;
using chronicle::bank::v1::MoneyDeposited;
using chronicle::codec::JsonCodec;

void TestEncodeTagsPayloadWithFullName() {
  JsonCodec codec;

  AccountOpened e;
  e.set_account_id("acc-1");
  e.set_account_number("ACC-0001");
  e.set_owner_name("Alice Johnson");
  e.set_initial_balance_cents(100000);

  const auto encoded = codec.Encode(e);
  assert(encoded.type == "chronicle.bank.v1.AccountOpened");
  assert(encoded.data.find("\"account_number\":\"ACC-0001\"") != std::string::npos);

  const auto decoded = codec.DecodeAs<AccountOpened>(encoded.type, encoded.data);
  assert(decoded.account_id() == "acc-1");
  assert(decoded.initial_balance_cents() == 100000);
}

void TestDynamicDecodeResolvesType() {
  JsonCodec codec;

  MoneyDeposited e;
  e.set_account_id("acc-2");
  e.set_amount_cents(500);
  const auto encoded = codec.Encode(e);

  auto message = codec.Decode(encoded.type, encoded.data);
  assert(message != nullptr);
  assert(message->GetDescriptor() == MoneyDeposited::descriptor());
  assert(static_cast<const MoneyDeposited&>(*message).amount_cents() == 500);
}

void TestUnknownFieldsAreIgnoredOnDecode() {
  JsonCodec  codec;
  const auto user = codec.DecodeAs<chronicle::catalog::v1::User>("chronicle.catalog.v1.User",
                                                                 R"({"id":"u1","name":"Eve","email":"eve@test.com","nickname":"e"})");
  assert(user.name() == "Eve");
}

void TestTypeMismatchIsSerializationError() {
  JsonCodec  codec;
  AccountOpened e;
  e.set_account_id("acc-3");
  const auto encoded = codec.Encode(e);

  bool threw = false;
  try {
    (void)codec.DecodeAs<MoneyDeposited>(encoded.type, encoded.data);
  } catch (const chronicle::util::SerializationError& err) {
    threw = err.Kind() == chronicle::util::ErrorKind::kSerializationError;
  }
  assert(threw);
}

void TestMalformedPayloadIsSerializationError() {
  JsonCodec codec;

  bool threw = false;
  try {
    (void)codec.DecodeAs<AccountOpened>("chronicle.bank.v1.AccountOpened", "{not json");
  } catch (const chronicle::util::SerializationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)codec.Decode("chronicle.bank.v1.NoSuchEvent", "{}");
  } catch (const chronicle::util::SerializationError& err) {
    threw = err.Key() == "chronicle.bank.v1.NoSuchEvent";
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeTagsPayloadWithFullName();
  TestDynamicDecodeResolvesType();
  TestUnknownFieldsAreIgnoredOnDecode();
  TestTypeMismatchIsSerializationError();
  TestMalformedPayloadIsSerializationError();

  std::cout << "chronicle_unit_codec: pass\n";
  return 0;
}
