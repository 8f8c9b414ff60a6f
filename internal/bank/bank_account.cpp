#include "internal/bank/bank_account.hpp"

namespace chronicle::bank {

using chronicle::bank::v1::AccountClosed;
using chronicle::bank::v1::AccountOpened;
using chronicle::bank::v1::MoneyDeposited;
using chronicle::bank::v1::MoneyWithdrawn;

const aggregate::AggregateFolder<BankAccount>& BankAccountFolder() {
  static const aggregate::AggregateFolder<BankAccount> kFolder = [] {
    aggregate::AggregateFolder<BankAccount> folder;

    folder.On<AccountOpened>([](BankAccount s, const AccountOpened& e) {
      s.id             = e.account_id();
      s.account_number = e.account_number();
      s.owner_name     = e.owner_name();
      s.balance        = util::Money::FromCents(e.initial_balance_cents());
      s.is_closed      = false;
      s.created_at     = util::FromProto(e.opened_at());
      s.last_modified  = s.created_at;
      return s;
    });

    folder.On<MoneyDeposited>([](BankAccount s, const MoneyDeposited& e) {
      s.balance += util::Money::FromCents(e.amount_cents());
      s.last_modified = util::FromProto(e.deposited_at());
      return s;
    });

    folder.On<MoneyWithdrawn>([](BankAccount s, const MoneyWithdrawn& e) {
      s.balance -= util::Money::FromCents(e.amount_cents());
      s.last_modified = util::FromProto(e.withdrawn_at());
      return s;
    });

    folder.On<AccountClosed>([](BankAccount s, const AccountClosed& e) {
      s.is_closed     = true;
      s.last_modified = util::FromProto(e.closed_at());
      return s;
    });

    return folder;
  }();
  return kFolder;
}

} // namespace chronicle::bank
