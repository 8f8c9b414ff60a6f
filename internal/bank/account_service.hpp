#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chronicle/bank/v1/account_events.pb.h"
#include "internal/bank/bank_account.hpp"
#include "internal/core/store.hpp"
#include "internal/util/money.hpp"

namespace chronicle::bank {

enum class CommandStatus {
  kOk,
  kNotFound,
  kRejected, // business rule
  kConflict, // stream moved since it was loaded
};

const char* ToString(CommandStatus status);

struct CommandResult {
  CommandStatus status = CommandStatus::kOk;
  std::string   account_id;
  uint64_t      version = 0;
  std::string   message;

  bool ok() const {
    return status == CommandStatus::kOk;
  }
};

/*
  AccountService

  Each command rebuilds the account from its stream, checks the business
  rule, and appends with the version it observed. A concurrent writer
  turns into kConflict; the caller decides whether to retry.
*/
class AccountService {
 public:
  explicit AccountService(std::shared_ptr<core::Store> store);

  // A new account id is generated when account_id is empty.
  CommandResult Open(const std::string& account_number, const std::string& owner_name, util::Money initial_balance,
                     const std::string& account_id = {});

  CommandResult Deposit(const std::string& account_id, util::Money amount, const std::string& description);

  CommandResult Withdraw(const std::string& account_id, util::Money amount, const std::string& description);

  CommandResult Close(const std::string& account_id, const std::string& reason);

  std::optional<BankAccount> Load(const std::string& account_id) const;

  std::optional<v1::AccountBalance> Balance(const std::string& account_id) const;

  std::optional<v1::TransactionHistory> History(const std::string& account_id) const;

  // Ordered by account number when that field is indexed, else by id.
  std::vector<v1::AccountBalance> ListAccounts() const;

 private:
  CommandResult FromAppend(const std::string& account_id, const events::AppendResult& r) const;

  std::shared_ptr<core::Store> store_;
};

} // namespace chronicle::bank
