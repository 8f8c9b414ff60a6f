#include "internal/bank/projections.hpp"

#include "chronicle/bank/v1/account_events.pb.h"
#include "internal/projection/document_projection.hpp"
#include "internal/util/money.hpp"

namespace chronicle::bank {

using chronicle::bank::v1::AccountBalance;
using chronicle::bank::v1::AccountClosed;
using chronicle::bank::v1::AccountOpened;
using chronicle::bank::v1::MoneyDeposited;
using chronicle::bank::v1::MoneyWithdrawn;
using chronicle::bank::v1::TransactionEntry;
using chronicle::bank::v1::TransactionHistory;

namespace {

TransactionEntry Entry(const std::string& type, int64_t amount_cents, const std::string& description,
                       const google::protobuf::Timestamp& when) {
  TransactionEntry entry;
  entry.set_type(type);
  entry.set_amount_cents(amount_cents);
  entry.set_description(description);
  *entry.mutable_when() = when;
  return entry;
}

} // namespace

std::shared_ptr<const projection::Projection> MakeAccountBalanceProjection() {
  auto p = std::make_shared<projection::DocumentProjection<AccountBalance>>();

  p->Create<AccountOpened>([](const AccountOpened& e) {
     AccountBalance view;
     view.set_id(e.account_id());
     view.set_account_number(e.account_number());
     view.set_owner_name(e.owner_name());
     view.set_balance_cents(e.initial_balance_cents());
     *view.mutable_last_modified() = e.opened_at();
     view.set_is_closed(false);
     return view;
   })
      .Update<MoneyDeposited>([](AccountBalance view, const MoneyDeposited& e) {
        view.set_balance_cents((util::Money::FromCents(view.balance_cents()) + util::Money::FromCents(e.amount_cents())).Cents());
        *view.mutable_last_modified() = e.deposited_at();
        return view;
      })
      .Update<MoneyWithdrawn>([](AccountBalance view, const MoneyWithdrawn& e) {
        view.set_balance_cents((util::Money::FromCents(view.balance_cents()) - util::Money::FromCents(e.amount_cents())).Cents());
        *view.mutable_last_modified() = e.withdrawn_at();
        return view;
      })
      .Update<AccountClosed>([](AccountBalance view, const AccountClosed& e) {
        view.set_is_closed(true);
        *view.mutable_last_modified() = e.closed_at();
        return view;
      });

  return p;
}

std::shared_ptr<const projection::Projection> MakeTransactionHistoryProjection() {
  auto p = std::make_shared<projection::DocumentProjection<TransactionHistory>>();

  p->Create<AccountOpened>([](const AccountOpened& e) {
     TransactionHistory view;
     view.set_id(e.account_id());
     view.set_account_number(e.account_number());
     *view.add_transactions() = Entry("Opened", e.initial_balance_cents(), "Account opened with initial deposit", e.opened_at());
     return view;
   })
      .Update<MoneyDeposited>([](TransactionHistory view, const MoneyDeposited& e) {
        *view.add_transactions() = Entry("Deposit", e.amount_cents(), e.description(), e.deposited_at());
        return view;
      })
      .Update<MoneyWithdrawn>([](TransactionHistory view, const MoneyWithdrawn& e) {
        *view.add_transactions() = Entry("Withdrawal", -e.amount_cents(), e.description(), e.withdrawn_at());
        return view;
      })
      .Update<AccountClosed>([](TransactionHistory view, const AccountClosed& e) {
        *view.add_transactions() = Entry("Closed", 0, e.reason(), e.closed_at());
        return view;
      });

  return p;
}

std::vector<std::shared_ptr<const projection::Projection>> BankProjections() {
  return {MakeAccountBalanceProjection(), MakeTransactionHistoryProjection()};
}

void DeclareBankIndexes(documents::IndexRegistry& indexes) {
  indexes.Declare<AccountBalance>("account_number")
      .Declare<AccountBalance>("owner_name")
      .Declare<AccountBalance>("balance_cents")
      .Declare<AccountBalance>("is_closed");
}

} // namespace chronicle::bank
