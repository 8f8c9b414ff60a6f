#include "internal/bank/account_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::bank {

namespace {

CommandResult Fail(CommandStatus status, const std::string& account_id, std::string message) {
  CommandResult r;
  r.status     = status;
  r.account_id = account_id;
  r.message    = std::move(message);
  CHRONICLE_LOG_INFO("Account command refused", {observability::StringField("account_id", account_id),
                                                 observability::StringField("status", ToString(status)),
                                                 observability::StringField("reason", r.message)});
  return r;
}

} // namespace

const char* ToString(CommandStatus status) {
  switch (status) {
    case CommandStatus::kOk:
      return "ok";
    case CommandStatus::kNotFound:
      return "not_found";
    case CommandStatus::kRejected:
      return "rejected";
    case CommandStatus::kConflict:
      return "conflict";
  }
  return "unknown";
}

AccountService::AccountService(std::shared_ptr<core::Store> store) : store_(std::move(store)) {
}

CommandResult AccountService::FromAppend(const std::string& account_id, const events::AppendResult& r) const {
  if (r.ok()) {
    CommandResult out;
    out.account_id = account_id;
    out.version    = r.version;
    return out;
  }
  if (r.status == util::WriteStatus::kStreamNotFound) {
    return Fail(CommandStatus::kNotFound, account_id, r.message);
  }
  return Fail(CommandStatus::kConflict, account_id, std::string(util::Describe(r.status)) + ": " + r.message);
}

CommandResult AccountService::Open(const std::string& account_number, const std::string& owner_name, util::Money initial_balance,
                                   const std::string& account_id) {
  const auto id = account_id.empty() ? util::NewId() : account_id;

  if (account_number.empty() || owner_name.empty()) {
    return Fail(CommandStatus::kRejected, id, "account number and owner name are required");
  }
  if (initial_balance < util::Money()) {
    return Fail(CommandStatus::kRejected, id, "initial balance must not be negative");
  }

  v1::AccountOpened e;
  e.set_account_id(id);
  e.set_account_number(account_number);
  e.set_owner_name(owner_name);
  e.set_initial_balance_cents(initial_balance.Cents());
  *e.mutable_opened_at() = util::ToProto(util::Now());

  return FromAppend(id, store_->Events().Append(id, kBankAccountAggregate, events::ExpectedVersion::NoStream(), e));
}

CommandResult AccountService::Deposit(const std::string& account_id, util::Money amount, const std::string& description) {
  if (amount <= util::Money()) {
    return Fail(CommandStatus::kRejected, account_id, "deposit amount must be positive");
  }

  const auto account = store_->Aggregates().RebuildAt(account_id, BankAccountFolder(), events::kLatestVersion);
  if (!account) {
    return Fail(CommandStatus::kNotFound, account_id, "account " + account_id + " not found");
  }
  if (!account->state.CanDeposit()) {
    return Fail(CommandStatus::kRejected, account_id, "account is closed");
  }
  if (!account->state.balance.CheckedAdd(amount)) {
    return Fail(CommandStatus::kRejected, account_id, "deposit would overflow the balance");
  }

  v1::MoneyDeposited e;
  e.set_account_id(account_id);
  e.set_amount_cents(amount.Cents());
  e.set_description(description);
  *e.mutable_deposited_at() = util::ToProto(util::Now());

  return FromAppend(account_id, store_->Events().Append(account_id, kBankAccountAggregate,
                                                        events::ExpectedVersion::Exactly(account->version), e));
}

CommandResult AccountService::Withdraw(const std::string& account_id, util::Money amount, const std::string& description) {
  if (amount <= util::Money()) {
    return Fail(CommandStatus::kRejected, account_id, "withdrawal amount must be positive");
  }

  const auto account = store_->Aggregates().RebuildAt(account_id, BankAccountFolder(), events::kLatestVersion);
  if (!account) {
    return Fail(CommandStatus::kNotFound, account_id, "account " + account_id + " not found");
  }
  if (!account->state.CanWithdraw(amount)) {
    return Fail(CommandStatus::kRejected, account_id,
                account->state.is_closed ? "account is closed" : "insufficient funds: balance " + account->state.balance.ToString());
  }

  v1::MoneyWithdrawn e;
  e.set_account_id(account_id);
  e.set_amount_cents(amount.Cents());
  e.set_description(description);
  *e.mutable_withdrawn_at() = util::ToProto(util::Now());

  return FromAppend(account_id, store_->Events().Append(account_id, kBankAccountAggregate,
                                                        events::ExpectedVersion::Exactly(account->version), e));
}

CommandResult AccountService::Close(const std::string& account_id, const std::string& reason) {
  const auto account = store_->Aggregates().RebuildAt(account_id, BankAccountFolder(), events::kLatestVersion);
  if (!account) {
    return Fail(CommandStatus::kNotFound, account_id, "account " + account_id + " not found");
  }
  if (account->state.is_closed) {
    return Fail(CommandStatus::kRejected, account_id, "account is already closed");
  }

  v1::AccountClosed e;
  e.set_account_id(account_id);
  e.set_final_balance_cents(account->state.balance.Cents());
  e.set_reason(reason);
  *e.mutable_closed_at() = util::ToProto(util::Now());

  return FromAppend(account_id, store_->Events().Append(account_id, kBankAccountAggregate,
                                                        events::ExpectedVersion::Exactly(account->version), e));
}

std::optional<BankAccount> AccountService::Load(const std::string& account_id) const {
  return store_->Aggregates().Rebuild(account_id, BankAccountFolder());
}

std::optional<v1::AccountBalance> AccountService::Balance(const std::string& account_id) const {
  auto loaded = store_->Documents().Load<v1::AccountBalance>(account_id);
  if (!loaded) return std::nullopt;
  return std::move(loaded->doc);
}

std::optional<v1::TransactionHistory> AccountService::History(const std::string& account_id) const {
  auto loaded = store_->Documents().Load<v1::TransactionHistory>(account_id);
  if (!loaded) return std::nullopt;
  return std::move(loaded->doc);
}

std::vector<v1::AccountBalance> AccountService::ListAccounts() const {
  const auto& documents = store_->Documents();

  documents::DocumentQuery query;
  if (documents.Indexes().IsIndexed(v1::AccountBalance::descriptor()->full_name(), "account_number")) {
    query.order_by = "account_number";
  }
  return documents.QueryAs<v1::AccountBalance>(query);
}

} // namespace chronicle::bank
