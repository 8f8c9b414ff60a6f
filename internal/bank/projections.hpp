#pragma once

#include <memory>
#include <vector>

#include "internal/documents/index_registry.hpp"
#include "internal/projection/projection.hpp"

namespace chronicle::bank {

// AccountBalance document per account stream: balance, owner, closed flag.
std::shared_ptr<const projection::Projection> MakeAccountBalanceProjection();

// TransactionHistory document per account stream: one entry per event.
std::shared_ptr<const projection::Projection> MakeTransactionHistoryProjection();

std::vector<std::shared_ptr<const projection::Projection>> BankProjections();

// account_number, owner_name, balance_cents and is_closed on AccountBalance
void DeclareBankIndexes(documents::IndexRegistry& indexes);

} // namespace chronicle::bank
