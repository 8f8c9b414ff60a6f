#include "internal/maintenance/database_reset.hpp"

#include "internal/observability/logging.hpp"

namespace chronicle::maintenance {

DatabaseReset::DatabaseReset(std::shared_ptr<core::Store> store) : store_(std::move(store)) {
}

void DatabaseReset::ResetDocuments() {
  store_->Documents().DeleteAllDocuments();
}

void DatabaseReset::ResetEvents() {
  store_->Events().DeleteAllEventData();
}

void DatabaseReset::CompleteReset() {
  CHRONICLE_LOG_INFO("Performing complete database reset");
  ResetEvents();
  ResetDocuments();
}

void DatabaseReset::RecreateSchema() {
  store_->RecreateSchema();
}

} // namespace chronicle::maintenance
