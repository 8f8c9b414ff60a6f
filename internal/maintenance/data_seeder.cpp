#include "internal/maintenance/data_seeder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>

#include "chronicle/bank/v1/account_events.pb.h"
#include "chronicle/catalog/v1/documents.pb.h"
#include "internal/bank/bank_account.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::maintenance {

namespace {

constexpr std::array<const char*, 10> kUserNames = {"Alice", "Bob", "Charlie", "Diana", "Eve", "Frank", "Grace", "Henry", "Iris", "Jack"};
constexpr std::array<const char*, 3>  kDomains   = {"example.com", "test.com", "demo.com"};

constexpr std::array<const char*, 20> kProductNames = {"Laptop", "Mouse",    "Keyboard", "Monitor",  "Headphones",
                                                       "Webcam", "Microphone", "Speakers", "USB Hub", "Cable",
                                                       "Desk",   "Chair",    "Lamp",     "Notebook", "Pen",
                                                       "Backpack", "Water Bottle", "Coffee Mug", "Plant", "Calendar"};
constexpr std::array<const char*, 8>  kTags = {"electronics", "office", "accessories", "furniture", "premium", "budget", "bestseller", "new"};

constexpr std::array<const char*, 5> kOwners       = {"Hermann Smith", "Alice Johnson", "Bob Williams", "Charlie Brown", "Diana Davis"};
constexpr std::array<const char*, 6> kDescriptions = {"Salary", "Bonus", "Rent", "Groceries", "Utilities", "Shopping"};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

google::protobuf::Timestamp DaysAgo(int days) {
  return util::ToProto(util::Now() - std::chrono::hours(24 * days));
}

} // namespace

DataSeeder::DataSeeder(std::shared_ptr<core::Store> store, uint32_t seed) : store_(std::move(store)), rng_(seed) {
}

int DataSeeder::Uniform(int lo, int hi) {
  return std::uniform_int_distribution<int>(lo, hi)(rng_);
}

std::size_t DataSeeder::SeedUsers(std::size_t count) {
  const auto n = std::min(count, kUserNames.size());

  for (std::size_t i = 0; i < n; ++i) {
    catalog::v1::User user;
    user.set_id(util::NewId());
    user.set_name(kUserNames[i]);
    user.set_email(Lower(kUserNames[i]) + "@" + kDomains[i % kDomains.size()]);

    const auto r = store_->Documents().Store(user.id(), user);
    if (!r.ok()) {
      throw util::StorageUnavailable(user.id(), "seeding user failed: " + r.message);
    }
  }

  CHRONICLE_LOG_INFO("Seeded users", {observability::IntField("count", static_cast<int64_t>(n))});
  return n;
}

std::size_t DataSeeder::SeedProducts(std::size_t count) {
  const auto n = std::min(count, kProductNames.size());

  for (std::size_t i = 0; i < n; ++i) {
    catalog::v1::Product product;
    product.set_id(util::NewId());
    product.set_sku("PRD-" + std::to_string(1000 + i));
    product.set_name(kProductNames[i]);
    product.set_description("High quality " + Lower(kProductNames[i]) + " for professionals");
    product.set_price_cents(Uniform(1000, 51000));
    product.set_stock_quantity(Uniform(0, 99));

    const int tag_count = Uniform(1, 3);
    for (int t = 0; t < tag_count; ++t) {
      const std::string tag = kTags[Uniform(0, static_cast<int>(kTags.size()) - 1)];
      if (std::find(product.tags().begin(), product.tags().end(), tag) == product.tags().end()) product.add_tags(tag);
    }

    *product.mutable_created_at() = DaysAgo(Uniform(0, 364));

    const auto r = store_->Documents().Store(product.id(), product);
    if (!r.ok()) {
      throw util::StorageUnavailable(product.id(), "seeding product failed: " + r.message);
    }
  }

  CHRONICLE_LOG_INFO("Seeded products", {observability::IntField("count", static_cast<int64_t>(n))});
  return n;
}

std::size_t DataSeeder::SeedBankAccounts(std::size_t count) {
  const auto n = std::min(count, kOwners.size());
  const auto& codec = store_->Codec();

  for (std::size_t i = 0; i < n; ++i) {
    const auto account_id = util::NewId();
    auto       balance    = util::Money::FromCents(Uniform(500, 5000) * 100LL);

    std::vector<codec::EncodedEvent> events;

    bank::v1::AccountOpened opened;
    opened.set_account_id(account_id);
    opened.set_account_number("ACC-" + std::to_string(10000 + i));
    opened.set_owner_name(kOwners[i]);
    opened.set_initial_balance_cents(balance.Cents());
    *opened.mutable_opened_at() = DaysAgo(Uniform(30, 364));
    events.push_back(codec.Encode(opened));

    const int transactions = Uniform(3, 9);
    for (int j = 0; j < transactions; ++j) {
      const auto        amount      = util::Money::FromCents(Uniform(50, 500) * 100LL);
      const std::string description = kDescriptions[Uniform(0, static_cast<int>(kDescriptions.size()) - 1)];

      // withdrawals never overdraw the seeded account
      if (Uniform(0, 1) == 0 || balance < amount) {
        bank::v1::MoneyDeposited e;
        e.set_account_id(account_id);
        e.set_amount_cents(amount.Cents());
        e.set_description(description);
        *e.mutable_deposited_at() = DaysAgo(Uniform(1, 29));
        events.push_back(codec.Encode(e));
        balance += amount;
      } else {
        bank::v1::MoneyWithdrawn e;
        e.set_account_id(account_id);
        e.set_amount_cents(amount.Cents());
        e.set_description(description);
        *e.mutable_withdrawn_at() = DaysAgo(Uniform(1, 29));
        events.push_back(codec.Encode(e));
        balance -= amount;
      }
    }

    const auto r = store_->Events().AppendToStream(account_id, bank::kBankAccountAggregate, events::ExpectedVersion::NoStream(),
                                                   std::move(events));
    if (!r.ok()) {
      throw util::StorageUnavailable(account_id, "seeding account failed: " + r.message);
    }
  }

  CHRONICLE_LOG_INFO("Seeded bank accounts", {observability::IntField("count", static_cast<int64_t>(n))});
  return n;
}

void DataSeeder::SeedAll() {
  SeedUsers();
  SeedProducts();
  SeedBankAccounts();
}

} // namespace chronicle::maintenance
