#include "internal/catalog/catalog_indexes.hpp"

#include "chronicle/catalog/v1/documents.pb.h"

namespace chronicle::catalog {

using chronicle::catalog::v1::Contact;
using chronicle::catalog::v1::Order;
using chronicle::catalog::v1::Product;
using chronicle::catalog::v1::User;

void DeclareCatalogIndexes(documents::IndexRegistry& indexes) {
  indexes.Declare<User>("name").Declare<User>("email");

  indexes.Declare<Product>("sku")
      .Declare<Product>("name")
      .Declare<Product>("price_cents")
      .Declare<Product>("stock_quantity");

  indexes.Declare<Order>("order_number").Declare<Order>("user_id").Declare<Order>("status").Declare<Order>("total_cents");

  indexes.Declare<Contact>("email").Declare<Contact>("home_address.city");
}

} // namespace chronicle::catalog
