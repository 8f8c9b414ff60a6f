#pragma once

#include <string>

#include "chronicle/bank/v1/account_events.pb.h"
#include "internal/aggregate/aggregate_folder.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace chronicle::bank {

inline constexpr const char* kBankAccountAggregate = "BankAccount";

// Write-side state, rebuilt from the account stream.
struct BankAccount {
  std::string     id;
  std::string     account_number;
  std::string     owner_name;
  util::Money     balance;
  bool            is_closed = false;
  util::TimePoint created_at;
  util::TimePoint last_modified;

  bool CanWithdraw(util::Money amount) const {
    return !is_closed && balance >= amount;
  }

  bool CanDeposit() const {
    return !is_closed;
  }
};

const aggregate::AggregateFolder<BankAccount>& BankAccountFolder();

} // namespace chronicle::bank
