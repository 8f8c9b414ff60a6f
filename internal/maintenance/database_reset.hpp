#pragma once

#include <memory>

#include "internal/core/store.hpp"

namespace chronicle::maintenance {

/*
  Administrative resets. None of these run inside a normal request path.
*/
class DatabaseReset {
 public:
  explicit DatabaseReset(std::shared_ptr<core::Store> store);

  // All documents, projection documents included; schema kept.
  void ResetDocuments();

  // All streams and events; documents kept.
  void ResetEvents();

  void CompleteReset();

  void RecreateSchema();

 private:
  std::shared_ptr<core::Store> store_;
};

} // namespace chronicle::maintenance
