#pragma once

#include "internal/documents/index_registry.hpp"

namespace chronicle::catalog {

// Queryable fields of the sample User, Product, Order and Contact documents.
void DeclareCatalogIndexes(documents::IndexRegistry& indexes);

} // namespace chronicle::catalog
