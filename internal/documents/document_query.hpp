#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace chronicle::documents {

enum class Op { kEq, kNe, kLt, kLe, kGt, kGe };

using FieldValue = std::variant<std::string, double, bool>;

/*
  field is a dotted path into the document JSON ("home_address.city").
  int64 fields, which protobuf JSON renders as strings, compare
  numerically against a numeric value.
*/
struct Predicate {
  std::string field;
  Op          op = Op::kEq;
  FieldValue  value;
};

// All predicates must hold. Empty matches every document.
using Filter = std::vector<Predicate>;

struct DocumentQuery {
  Filter filter;

  // empty or "id" orders by document id
  std::string order_by;
  bool        descending = false;

  std::optional<std::size_t> limit;
  std::size_t                offset = 0;
};

Predicate Eq(std::string field, FieldValue value);
Predicate Ne(std::string field, FieldValue value);
Predicate Lt(std::string field, FieldValue value);
Predicate Le(std::string field, FieldValue value);
Predicate Gt(std::string field, FieldValue value);
Predicate Ge(std::string field, FieldValue value);

// nullptr when a path segment is missing or not an object.
const google::protobuf::Value* Lookup(const google::protobuf::Struct& doc, const std::string& path);

bool Matches(const google::protobuf::Struct& doc, const Predicate& predicate);

// <0, 0, >0; a missing value sorts first
int CompareField(const google::protobuf::Value* a, const google::protobuf::Value* b);

} // namespace chronicle::documents
