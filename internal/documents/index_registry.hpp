#pragma once

#include <map>
#include <set>
#include <string>

namespace chronicle::documents {

/*
  Fields a document type may be filtered or ordered on, declared when the
  store is built. The document id is always queryable.
*/
class IndexRegistry {
 public:
  IndexRegistry& Declare(const std::string& document_type, const std::string& field) {
    fields_[document_type].insert(field);
    return *this;
  }

  template <typename TDoc>
  IndexRegistry& Declare(const std::string& field) {
    return Declare(TDoc::descriptor()->full_name(), field);
  }

  bool IsIndexed(const std::string& document_type, const std::string& field) const {
    if (field.empty() || field == "id") return true;
    const auto it = fields_.find(document_type);
    return it != fields_.end() && it->second.contains(field);
  }

 private:
  std::map<std::string, std::set<std::string>> fields_;
};

} // namespace chronicle::documents
