#include "internal/documents/document_store.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "chronicle/catalog/v1/documents.pb.h"
#include "internal/catalog/catalog_indexes.hpp"
#include "internal/core/store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using chronicle::catalog::v1::Contact;
using chronicle::catalog::v1::Product;
using chronicle::catalog::v1::User;
using chronicle::documents::DocumentQuery;
using chronicle::util::WriteStatus;

namespace docs = chronicle::documents;

std::shared_ptr<chronicle::core::Store> MakeStore() {
  chronicle::core::StoreOptions options;
  chronicle::catalog::DeclareCatalogIndexes(options.indexes);
  return std::make_shared<chronicle::core::Store>(std::make_shared<chronicle::db::memory::MemoryRepository>(), std::move(options));
}

Product MakeProduct(const std::string& id, const std::string& name, int64_t price_cents, int32_t stock) {
  Product p;
  p.set_id(id);
  p.set_sku("PRD-" + id);
  p.set_name(name);
  p.set_price_cents(price_cents);
  p.set_stock_quantity(stock);
  return p;
}

void TestGetOnMissingDocumentIsAbsent() {
  auto store = MakeStore();
  assert(!store->Documents().Get("chronicle.catalog.v1.User", "nobody").has_value());
  assert(!store->Documents().Load<User>("nobody").has_value());
}

void TestPutThenGetRoundTrips() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  const std::string data = R"({"id":"u1","name":"Alice","email":"alice@example.com"})";
  auto              put  = documents.Put("chronicle.catalog.v1.User", "u1", data);
  assert(put.ok());
  assert(!put.version_token.empty());

  auto got = documents.Get("chronicle.catalog.v1.User", "u1");
  assert(got.has_value());
  assert(got->data == data);
  assert(got->version_token == put.version_token);

  User user;
  user.set_id("u2");
  user.set_name("Bob");
  user.set_email("bob@test.com");
  assert(documents.Store("u2", user).ok());

  auto loaded = documents.Load<User>("u2");
  assert(loaded.has_value());
  assert(loaded->doc.name() == "Bob");
  assert(loaded->doc.email() == "bob@test.com");
}

void TestCompareAndSwapOnVersionToken() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  User user;
  user.set_id("u3");
  user.set_name("Charlie");
  const auto v1 = documents.Store("u3", user).version_token;

  // two callers both loaded v1
  auto first_loaded  = documents.Load<User>("u3");
  auto second_loaded = documents.Load<User>("u3");
  assert(first_loaded->version_token == v1 && second_loaded->version_token == v1);

  first_loaded->doc.set_email("charlie@example.com");
  second_loaded->doc.set_email("charlie@test.com");

  auto winner = documents.Store("u3", first_loaded->doc, first_loaded->version_token);
  auto loser  = documents.Store("u3", second_loaded->doc, second_loaded->version_token);

  assert(winner.ok());
  assert(winner.version_token != v1);
  assert(loser.status == WriteStatus::kConcurrencyConflict);
  assert(loser.version_token.empty());

  auto stored = documents.Load<User>("u3");
  assert(stored->doc.email() == "charlie@example.com");
  assert(stored->version_token == winner.version_token);

  // last write wins without a token, and still rotates it
  auto blind = documents.Store("u3", second_loaded->doc);
  assert(blind.ok());
  assert(blind.version_token != winner.version_token);
  assert(documents.Load<User>("u3")->doc.email() == "charlie@test.com");

  // a token for a document that does not exist cannot match
  auto phantom = documents.Store("u4", user, std::string("some-token"));
  assert(phantom.status == WriteStatus::kConcurrencyConflict);
  assert(!documents.Load<User>("u4").has_value());
}

void TestDelete() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  assert(documents.Store("p1", MakeProduct("p1", "Lamp", 2500, 3)).ok());
  assert(documents.Delete("chronicle.catalog.v1.Product", "p1"));
  assert(!documents.Delete("chronicle.catalog.v1.Product", "p1"));
  assert(!documents.Load<Product>("p1").has_value());
}

void TestQueryFiltersOrdersAndPages() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  assert(documents.Store("p1", MakeProduct("p1", "Laptop", 120000, 5)).ok());
  assert(documents.Store("p2", MakeProduct("p2", "Mouse", 2500, 0)).ok());
  assert(documents.Store("p3", MakeProduct("p3", "Keyboard", 7500, 12)).ok());
  assert(documents.Store("p4", MakeProduct("p4", "Monitor", 30000, 7)).ok());
  assert(documents.Store("p5", MakeProduct("p5", "Cable", 7500, 40)).ok());

  DocumentQuery range;
  range.filter   = {docs::Ge("price_cents", 5000.0), docs::Le("price_cents", 50000.0)};
  range.order_by = "price_cents";
  auto in_range  = documents.QueryAs<Product>(range);
  assert(in_range.size() == 3);
  // equal prices fall back to id order
  assert(in_range[0].id() == "p3");
  assert(in_range[1].id() == "p5");
  assert(in_range[2].id() == "p4");

  DocumentQuery by_price_desc;
  by_price_desc.order_by   = "price_cents";
  by_price_desc.descending = true;
  by_price_desc.offset     = 1;
  by_price_desc.limit      = 2;
  auto page                = documents.QueryAs<Product>(by_price_desc);
  assert(page.size() == 2);
  assert(page[0].id() == "p4");
  assert(page[1].id() == "p5");

  DocumentQuery out_of_stock;
  out_of_stock.filter = {docs::Eq("stock_quantity", 0.0)};
  auto empty_shelf    = documents.QueryAs<Product>(out_of_stock);
  assert(empty_shelf.size() == 1);
  assert(empty_shelf[0].name() == "Mouse");

  DocumentQuery by_name;
  by_name.filter = {docs::Eq("name", std::string("Keyboard"))};
  assert(documents.Query("chronicle.catalog.v1.Product", by_name).size() == 1);

  DocumentQuery past_end;
  past_end.offset = 10;
  assert(documents.QueryAs<Product>(past_end).empty());

  // offset + limit must not wrap around
  DocumentQuery unbounded;
  unbounded.order_by = "price_cents";
  unbounded.offset   = 2;
  unbounded.limit    = std::numeric_limits<std::size_t>::max();
  auto tail          = documents.QueryAs<Product>(unbounded);
  assert(tail.size() == 3);
  assert(tail[0].id() == "p5");
  assert(tail[2].id() == "p1");

  unbounded.offset = std::numeric_limits<std::size_t>::max();
  assert(documents.QueryAs<Product>(unbounded).empty());

  assert(documents.Count("chronicle.catalog.v1.Product") == 5);
  assert(documents.Count("chronicle.catalog.v1.Product", {docs::Gt("stock_quantity", 6.0)}) == 3);
}

void TestQueryOnNestedField() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  for (const auto& [id, city] : std::vector<std::pair<std::string, std::string>>{{"c1", "Berlin"}, {"c2", "Paris"}, {"c3", "Berlin"}}) {
    Contact contact;
    contact.set_id(id);
    contact.set_name("Contact " + id);
    contact.mutable_home_address()->set_city(city);
    assert(documents.Store(id, contact).ok());
  }

  DocumentQuery query;
  query.filter = {docs::Eq("home_address.city", std::string("Berlin"))};
  auto found   = documents.QueryAs<Contact>(query);
  assert(found.size() == 2);
  assert(found[0].id() == "c1" && found[1].id() == "c3");
}

void TestUndeclaredFieldIsRejected() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  DocumentQuery query;
  query.filter = {docs::Eq("description", std::string("anything"))};

  bool threw = false;
  try {
    (void)documents.Query("chronicle.catalog.v1.Product", query);
  } catch (const chronicle::util::InvalidArgument& e) {
    threw = e.Key() == "chronicle.catalog.v1.Product";
  }
  assert(threw);

  DocumentQuery ordered;
  ordered.order_by = "description";
  threw            = false;
  try {
    (void)documents.Query("chronicle.catalog.v1.Product", ordered);
  } catch (const chronicle::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteWhereAndDeleteAll() {
  auto  store     = MakeStore();
  auto& documents = store->Documents();

  assert(documents.Store("p1", MakeProduct("p1", "Desk", 40000, 0)).ok());
  assert(documents.Store("p2", MakeProduct("p2", "Chair", 15000, 0)).ok());
  assert(documents.Store("p3", MakeProduct("p3", "Pen", 150, 100)).ok());

  User user;
  user.set_id("u1");
  assert(documents.Store("u1", user).ok());

  assert(documents.DeleteWhere("chronicle.catalog.v1.Product", {docs::Eq("stock_quantity", 0.0)}) == 2);
  assert(documents.Count("chronicle.catalog.v1.Product") == 1);
  assert(documents.DeleteWhere("chronicle.catalog.v1.Product", {docs::Eq("stock_quantity", 0.0)}) == 0);

  documents.DeleteAllDocuments();
  assert(documents.Count("chronicle.catalog.v1.Product") == 0);
  assert(!documents.Load<User>("u1").has_value());
}

void TestEmptyKeyIsInvalid() {
  auto store = MakeStore();

  bool threw = false;
  try {
    (void)store->Documents().Put("chronicle.catalog.v1.User", "", "{}");
  } catch (const chronicle::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGetOnMissingDocumentIsAbsent();
  TestPutThenGetRoundTrips();
  TestCompareAndSwapOnVersionToken();
  TestDelete();
  TestQueryFiltersOrdersAndPages();
  TestQueryOnNestedField();
  TestUndeclaredFieldIsRejected();
  TestDeleteWhereAndDeleteAll();
  TestEmptyKeyIsInvalid();

  std::cout << "chronicle_unit_document_store: pass\n";
  return 0;
}
