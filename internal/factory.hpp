#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/store.hpp"
#include "internal/db/api/repository.hpp"

namespace chronicle::factory {

/*
  Composition root. The ONLY place allowed to know concrete DB types.
*/

// Opens the configured backend; does not touch the schema.
std::shared_ptr<db::Repository> BuildRepository(const chronicle::runtime::config::RuntimeConfig& config);

db::SchemaMode ToSchemaMode(chronicle::runtime::config::SchemaMode mode);

/*
  Opens the backend, applies database.auto_create, and wires the store.
  events.fetch_page_size, when set, overrides options.fetch_page_size.
*/
std::shared_ptr<core::Store> Build(const chronicle::runtime::config::RuntimeConfig& config, core::StoreOptions options);

} // namespace chronicle::factory
