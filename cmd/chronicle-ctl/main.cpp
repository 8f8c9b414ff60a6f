#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "api/chronicle/v1.hpp"
#include "internal/bank/account_service.hpp"
#include "internal/bank/projections.hpp"
#include "internal/catalog/catalog_indexes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/maintenance/data_seeder.hpp"
#include "internal/maintenance/database_reset.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

using namespace chronicle;

static void Usage() {
  std::cout << "Usage:\n"
            << "  chronicle-ctl --config <config.yaml> seed [users|products|accounts|all]\n"
            << "  chronicle-ctl --config <config.yaml> reset <documents|events|all|schema>\n"
            << "  chronicle-ctl --config <config.yaml> account open <account_number> <owner_name> <initial_balance>\n"
            << "  chronicle-ctl --config <config.yaml> account deposit <account_id> <amount> [description]\n"
            << "  chronicle-ctl --config <config.yaml> account withdraw <account_id> <amount> [description]\n"
            << "  chronicle-ctl --config <config.yaml> account close <account_id> [reason]\n"
            << "  chronicle-ctl --config <config.yaml> account show <account_id>\n"
            << "  chronicle-ctl --config <config.yaml> account history <account_id>\n"
            << "  chronicle-ctl --config <config.yaml> account list\n"
            << "  chronicle-ctl --config <config.yaml> users [email]\n"
            << "  chronicle-ctl --config <config.yaml> products [min_price max_price]\n"
            << "  chronicle-ctl --config <config.yaml> streams [aggregate_type]\n"
            << "  chronicle-ctl --config <config.yaml> events <stream_id>\n"
            << "  chronicle-ctl --config <config.yaml> rebuild <document_type>\n";
}

static core::StoreOptions Options() {
  core::StoreOptions options;
  options.projections = bank::BankProjections();
  bank::DeclareBankIndexes(options.indexes);
  catalog::DeclareCatalogIndexes(options.indexes);
  return options;
}

static void PrintBalance(const bank::v1::AccountBalance& b) {
  std::cout << b.id() << "  " << b.account_number() << "  " << b.owner_name() << "  "
            << util::Money::FromCents(b.balance_cents()).ToString() << (b.is_closed() ? "  (closed)" : "") << "\n";
}

static int Report(const bank::CommandResult& r) {
  if (!r.ok()) {
    std::cerr << bank::ToString(r.status) << ": " << r.account_id << ": " << r.message << "\n";
    return 2;
  }
  std::cout << r.account_id << " version=" << r.version << "\n";
  return 0;
}

static int RunAccount(const std::shared_ptr<core::Store>& store, const std::vector<std::string>& args) {
  if (args.empty()) {
    Usage();
    return 1;
  }

  bank::AccountService accounts(store);
  const auto&          sub = args[0];

  if (sub == "open" && args.size() >= 4) {
    return Report(accounts.Open(args[1], args[2], util::Money::Parse(args[3])));
  }
  if (sub == "deposit" && args.size() >= 3) {
    return Report(accounts.Deposit(args[1], util::Money::Parse(args[2]), args.size() >= 4 ? args[3] : "Deposit"));
  }
  if (sub == "withdraw" && args.size() >= 3) {
    return Report(accounts.Withdraw(args[1], util::Money::Parse(args[2]), args.size() >= 4 ? args[3] : "Withdrawal"));
  }
  if (sub == "close" && args.size() >= 2) {
    return Report(accounts.Close(args[1], args.size() >= 3 ? args[2] : "Closed by request"));
  }

  if (sub == "show" && args.size() >= 2) {
    const auto account = accounts.Load(args[1]);
    if (!account) {
      std::cerr << util::Describe(util::ErrorKind::kStreamNotFound) << ": " << args[1] << "\n";
      return 2;
    }
    const auto version = store->Streams().GetVersion(args[1]);
    std::cout << "aggregate:  " << account->account_number << "  " << account->owner_name << "  " << account->balance.ToString()
              << (account->is_closed ? "  (closed)" : "") << "  version=" << version.value_or(0) << "\n";

    if (const auto balance = accounts.Balance(args[1])) {
      std::cout << "projection: ";
      PrintBalance(*balance);
    } else {
      std::cout << "projection: <absent>\n";
    }
    return 0;
  }

  if (sub == "history" && args.size() >= 2) {
    const auto history = accounts.History(args[1]);
    if (!history) {
      std::cerr << util::Describe(util::ErrorKind::kDocumentNotFound) << ": " << args[1] << "\n";
      return 2;
    }
    std::cout << history->account_number() << "\n";
    for (const auto& t : history->transactions()) {
      std::cout << "  " << util::FormatUtc(util::FromProto(t.when())) << "  " << t.type() << "  "
                << util::Money::FromCents(t.amount_cents()).ToString() << "  " << t.description() << "\n";
    }
    return 0;
  }

  if (sub == "list") {
    for (const auto& b : accounts.ListAccounts()) PrintBalance(b);
    return 0;
  }

  Usage();
  return 1;
}

static int Run(const std::shared_ptr<core::Store>& store, const std::string& cmd, const std::vector<std::string>& args) {
  // ------------------------------------------------------------
  if (cmd == "seed") {
    maintenance::DataSeeder seeder(store);
    const std::string       what = args.empty() ? "all" : args[0];
    if (what == "users") {
      std::cout << "seeded " << seeder.SeedUsers() << " users\n";
    } else if (what == "products") {
      std::cout << "seeded " << seeder.SeedProducts() << " products\n";
    } else if (what == "accounts") {
      std::cout << "seeded " << seeder.SeedBankAccounts() << " bank accounts\n";
    } else if (what == "all") {
      seeder.SeedAll();
      std::cout << "seeded sample data\n";
    } else {
      Usage();
      return 1;
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "reset") {
    if (args.empty()) {
      Usage();
      return 1;
    }
    maintenance::DatabaseReset reset(store);
    if (args[0] == "documents") {
      reset.ResetDocuments();
    } else if (args[0] == "events") {
      reset.ResetEvents();
    } else if (args[0] == "all") {
      reset.CompleteReset();
    } else if (args[0] == "schema") {
      reset.RecreateSchema();
    } else {
      Usage();
      return 1;
    }
    std::cout << "reset " << args[0] << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "account") {
    return RunAccount(store, args);
  }

  // ------------------------------------------------------------
  if (cmd == "users") {
    documents::DocumentQuery query;
    query.order_by = "name";
    if (!args.empty()) query.filter.push_back(documents::Eq("email", args[0]));

    for (const auto& u : store->Documents().QueryAs<catalog::v1::User>(query)) {
      std::cout << u.id() << "  " << u.name() << "  " << u.email() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "products") {
    documents::DocumentQuery query;
    query.order_by = "price_cents";
    if (args.size() >= 2) {
      query.filter.push_back(documents::Ge("price_cents", static_cast<double>(util::Money::Parse(args[0]).Cents())));
      query.filter.push_back(documents::Le("price_cents", static_cast<double>(util::Money::Parse(args[1]).Cents())));
    }

    for (const auto& p : store->Documents().QueryAs<catalog::v1::Product>(query)) {
      std::cout << p.sku() << "  " << p.name() << "  " << util::Money::FromCents(p.price_cents()).ToString() << "  stock=" << p.stock_quantity()
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "streams") {
    for (const auto& s : store->Streams().ListStreams(args.empty() ? std::string() : args[0])) {
      std::cout << s.id << "  " << s.aggregate_type << "  version=" << s.version << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "events") {
    if (args.empty()) {
      Usage();
      return 1;
    }
    auto stream = store->Events().FetchStream(args[0]);
    while (auto e = stream.Next()) {
      std::cout << e->version << "  #" << e->sequence << "  " << e->type << "  " << e->data << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "rebuild") {
    if (args.empty()) {
      Usage();
      return 1;
    }
    const auto applied = store->RebuildProjection(args[0]);
    std::cout << "rebuilt " << args[0] << " from " << applied << " events\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  const std::string        cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto store = factory::Build(config, Options());
    const int rc = Run(store, cmd, args);

    observability::ShutdownLogging();
    return rc;
  } catch (const util::StoreError& e) {
    std::cerr << util::Describe(e.Kind()) << ": " << e.Key() << ": " << e.what() << "\n";
    CHRONICLE_LOG_ERROR("Command failed", {observability::StringField("kind", util::Describe(e.Kind())),
                                           observability::StringField("key", e.Key()), observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    CHRONICLE_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }
}
