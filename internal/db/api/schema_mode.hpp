#pragma once

namespace chronicle::db {

enum class SchemaMode {
  None,
  CreateAll,
  CreateOrUpdate,
  CreateOnly,
};

} // namespace chronicle::db
