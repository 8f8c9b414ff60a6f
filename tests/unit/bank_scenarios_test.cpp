#include "internal/bank/account_service.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/bank/projections.hpp"
#include "internal/core/store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/maintenance/data_seeder.hpp"
#include "internal/maintenance/database_reset.hpp"
#include "internal/util/errors.hpp"

namespace {

using chronicle::bank::AccountService;
using chronicle::bank::BankAccountFolder;
using chronicle::bank::CommandStatus;
using chronicle::bank::v1::AccountBalance;
using chronicle::util::Money;

std::shared_ptr<chronicle::core::Store> MakeStore() {
  chronicle::core::StoreOptions options;
  options.projections = chronicle::bank::BankProjections();
  chronicle::bank::DeclareBankIndexes(options.indexes);
  return std::make_shared<chronicle::core::Store>(std::make_shared<chronicle::db::memory::MemoryRepository>(), std::move(options));
}

void TestOpenAccountIsVisibleInBothModels() {
  auto           store = MakeStore();
  AccountService accounts(store);

  auto opened = accounts.Open("ACC-0001", "Alice Johnson", Money::Parse("1000.00"), "A");
  assert(opened.ok());
  assert(opened.account_id == "A");
  assert(opened.version == 1);

  auto rebuilt = accounts.Load("A");
  assert(rebuilt.has_value());
  assert(rebuilt->balance == Money::Parse("1000.00"));

  auto balance = accounts.Balance("A");
  assert(balance.has_value());
  assert(balance->balance_cents() == 100000);
  assert(balance->account_number() == "ACC-0001");
}

void TestDepositAndWithdraw() {
  auto           store = MakeStore();
  AccountService accounts(store);
  assert(accounts.Open("ACC-0001", "Alice Johnson", Money::Parse("1000"), "A").ok());

  assert(accounts.Deposit("A", Money::Parse("500"), "Salary").ok());
  auto withdrawn = accounts.Withdraw("A", Money::Parse("200"), "Rent");
  assert(withdrawn.ok());
  assert(withdrawn.version == 3);

  assert(accounts.Load("A")->balance == Money::Parse("1300"));
  assert(accounts.Balance("A")->balance_cents() == 130000);
  assert(*store->Streams().GetVersion("A") == 3);

  auto history = accounts.History("A");
  assert(history.has_value());
  assert(history->transactions_size() == 3);
  assert(history->transactions(1).description() == "Salary");
  assert(history->transactions(2).amount_cents() == -20000);
}

void TestBusinessRulesReject() {
  auto           store = MakeStore();
  AccountService accounts(store);
  assert(accounts.Open("ACC-0002", "Bob Williams", Money::Parse("50"), "B").ok());

  assert(accounts.Withdraw("B", Money::Parse("50.01"), "too much").status == CommandStatus::kRejected);
  assert(accounts.Deposit("B", Money::Parse("0"), "nothing").status == CommandStatus::kRejected);
  assert(accounts.Withdraw("B", Money::Parse("-1"), "negative").status == CommandStatus::kRejected);
  assert(accounts.Open("", "Nobody", Money::Parse("1")).status == CommandStatus::kRejected);
  assert(accounts.Open("ACC-0003", "Nobody", Money::Parse("-1")).status == CommandStatus::kRejected);

  assert(accounts.Deposit("nope", Money::Parse("1"), "x").status == CommandStatus::kNotFound);
  assert(accounts.Withdraw("nope", Money::Parse("1"), "x").status == CommandStatus::kNotFound);
  assert(accounts.Close("nope", "x").status == CommandStatus::kNotFound);

  // opening twice under the same id is a stream precondition failure
  assert(accounts.Open("ACC-0002", "Bob Williams", Money::Parse("1"), "B").status == CommandStatus::kConflict);

  assert(accounts.Close("B", "moving").ok());
  assert(accounts.Balance("B")->is_closed());
  assert(accounts.Deposit("B", Money::Parse("1"), "late").status == CommandStatus::kRejected);
  assert(accounts.Close("B", "again").status == CommandStatus::kRejected);

  // no rejected command wrote anything
  assert(*store->Streams().GetVersion("B") == 2);
  assert(accounts.History("B")->transactions(1).type() == "Closed");
}

void TestDepositCannotOverflowBalance() {
  auto           store = MakeStore();
  AccountService accounts(store);
  assert(accounts.Open("ACC-0009", "Ivan Petrov", Money::Parse("92233720368547758.07"), "I").ok());

  assert(accounts.Deposit("I", Money::Parse("0.01"), "one cent too many").status == CommandStatus::kRejected);
  assert(*store->Streams().GetVersion("I") == 1);

  // an event appended past the service still cannot wrap the read model
  chronicle::bank::v1::MoneyDeposited e;
  e.set_account_id("I");
  e.set_amount_cents(1);
  bool threw = false;
  try {
    (void)store->Events().Append("I", chronicle::bank::kBankAccountAggregate, chronicle::events::ExpectedVersion::Exactly(1), e);
  } catch (const chronicle::util::ProjectionFailed&) {
    threw = true;
  }
  assert(threw);
  assert(*store->Streams().GetVersion("I") == 1);
  assert(accounts.Balance("I")->balance_cents() == std::numeric_limits<int64_t>::max());

  assert(accounts.Withdraw("I", Money::Parse("0.07"), "trim").ok());
  assert(accounts.Deposit("I", Money::Parse("0.07"), "refill").ok());
  assert(accounts.Load("I")->balance == Money::Parse("92233720368547758.07"));
}

void TestStaleVersionIsAConflict() {
  auto           store = MakeStore();
  AccountService accounts(store);
  assert(accounts.Open("ACC-0004", "Charlie Brown", Money::Parse("10"), "C").ok());
  assert(accounts.Deposit("C", Money::Parse("1"), "a").ok());
  assert(accounts.Deposit("C", Money::Parse("1"), "b").ok());

  chronicle::bank::v1::MoneyDeposited e;
  e.set_account_id("C");
  e.set_amount_cents(100);
  auto stale = store->Events().Append("C", chronicle::bank::kBankAccountAggregate, chronicle::events::ExpectedVersion::Exactly(5), e);
  assert(stale.status == chronicle::util::WriteStatus::kConcurrencyConflict);
  assert(*store->Streams().GetVersion("C") == 3);
  assert(accounts.Load("C")->balance == Money::Parse("12"));
}

void TestListAccountsOrderedByNumber() {
  auto           store = MakeStore();
  AccountService accounts(store);
  assert(accounts.Open("ACC-0300", "Diana Davis", Money::Parse("3"), "z").ok());
  assert(accounts.Open("ACC-0100", "Hermann Smith", Money::Parse("1"), "y").ok());
  assert(accounts.Open("ACC-0200", "Eve Adams", Money::Parse("2"), "x").ok());

  const auto listed = accounts.ListAccounts();
  assert(listed.size() == 3);
  assert(listed[0].account_number() == "ACC-0100");
  assert(listed[1].account_number() == "ACC-0200");
  assert(listed[2].account_number() == "ACC-0300");

  chronicle::documents::DocumentQuery open_accounts;
  open_accounts.filter = {chronicle::documents::Eq("is_closed", false), chronicle::documents::Ge("balance_cents", 200.0)};
  assert(store->Documents().QueryAs<AccountBalance>(open_accounts).size() == 2);
}

void TestSeedAndReset() {
  auto store = MakeStore();
  chronicle::maintenance::DataSeeder seeder(store, 42);

  assert(seeder.SeedUsers(3) == 3);
  assert(seeder.SeedProducts(4) == 4);
  assert(seeder.SeedBankAccounts(2) == 2);

  AccountService accounts(store);
  const auto     listed = accounts.ListAccounts();
  assert(listed.size() == 2);
  for (const auto& balance : listed) {
    // projection and fold agree, and seeding never overdraws
    const auto rebuilt = accounts.Load(balance.id());
    assert(rebuilt.has_value());
    assert(rebuilt->balance.Cents() == balance.balance_cents());
    assert(balance.balance_cents() >= 0);
  }

  chronicle::maintenance::DatabaseReset reset(store);
  reset.ResetDocuments();
  assert(accounts.ListAccounts().empty());
  assert(store->Streams().ListStreams().size() == 2);

  // the log still holds everything the projections need
  store->RebuildProjection(AccountBalance::descriptor()->full_name());
  assert(accounts.ListAccounts().size() == 2);

  reset.CompleteReset();
  assert(store->Streams().ListStreams().empty());
  assert(accounts.ListAccounts().empty());
}

} // namespace

int main() {
  TestOpenAccountIsVisibleInBothModels();
  TestDepositAndWithdraw();
  TestBusinessRulesReject();
  TestDepositCannotOverflowBalance();
  TestStaleVersionIsAConflict();
  TestListAccountsOrderedByNumber();
  TestSeedAndReset();

  std::cout << "chronicle_unit_bank_scenarios: pass\n";
  return 0;
}
