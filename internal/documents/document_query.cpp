#include "internal/documents/document_query.hpp"

#include <cstdlib>

namespace chronicle::documents {

namespace {

std::optional<double> AsNumber(const google::protobuf::Value& v) {
  if (v.kind_case() == google::protobuf::Value::kNumberValue) return v.number_value();
  if (v.kind_case() == google::protobuf::Value::kStringValue) {
    const auto& s = v.string_value();
    if (s.empty()) return std::nullopt;
    char*  end    = nullptr;
    double parsed = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return std::nullopt;
    return parsed;
  }
  return std::nullopt;
}

template <typename T>
bool Test(Op op, const T& lhs, const T& rhs) {
  switch (op) {
    case Op::kEq:
      return lhs == rhs;
    case Op::kNe:
      return lhs != rhs;
    case Op::kLt:
      return lhs < rhs;
    case Op::kLe:
      return lhs <= rhs;
    case Op::kGt:
      return lhs > rhs;
    case Op::kGe:
      return lhs >= rhs;
  }
  return false;
}

int Rank(const google::protobuf::Value* v) {
  if (v == nullptr || v->kind_case() == google::protobuf::Value::kNullValue) return 0;
  switch (v->kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return 1;
    case google::protobuf::Value::kNumberValue:
      return 2;
    case google::protobuf::Value::kStringValue:
      return AsNumber(*v).has_value() ? 2 : 3;
    default:
      return 4;
  }
}

} // namespace

Predicate Eq(std::string field, FieldValue value) {
  return {std::move(field), Op::kEq, std::move(value)};
}
Predicate Ne(std::string field, FieldValue value) {
  return {std::move(field), Op::kNe, std::move(value)};
}
Predicate Lt(std::string field, FieldValue value) {
  return {std::move(field), Op::kLt, std::move(value)};
}
Predicate Le(std::string field, FieldValue value) {
  return {std::move(field), Op::kLe, std::move(value)};
}
Predicate Gt(std::string field, FieldValue value) {
  return {std::move(field), Op::kGt, std::move(value)};
}
Predicate Ge(std::string field, FieldValue value) {
  return {std::move(field), Op::kGe, std::move(value)};
}

const google::protobuf::Value* Lookup(const google::protobuf::Struct& doc, const std::string& path) {
  const google::protobuf::Struct* current = &doc;
  std::size_t                     start   = 0;

  for (;;) {
    const auto dot = path.find('.', start);
    const auto key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

    const auto it = current->fields().find(key);
    if (it == current->fields().end()) return nullptr;
    if (dot == std::string::npos) return &it->second;

    if (it->second.kind_case() != google::protobuf::Value::kStructValue) return nullptr;
    current = &it->second.struct_value();
    start   = dot + 1;
  }
}

bool Matches(const google::protobuf::Struct& doc, const Predicate& predicate) {
  const auto* v = Lookup(doc, predicate.field);
  if (v == nullptr || v->kind_case() == google::protobuf::Value::kNullValue) return false;

  if (const auto* number = std::get_if<double>(&predicate.value)) {
    const auto lhs = AsNumber(*v);
    return lhs.has_value() && Test(predicate.op, *lhs, *number);
  }
  if (const auto* text = std::get_if<std::string>(&predicate.value)) {
    if (v->kind_case() != google::protobuf::Value::kStringValue) return false;
    return Test(predicate.op, v->string_value(), *text);
  }
  const bool flag = std::get<bool>(predicate.value);
  if (v->kind_case() != google::protobuf::Value::kBoolValue) return false;
  return Test(predicate.op, v->bool_value(), flag);
}

int CompareField(const google::protobuf::Value* a, const google::protobuf::Value* b) {
  const int ra = Rank(a);
  const int rb = Rank(b);
  if (ra != rb) return ra < rb ? -1 : 1;

  switch (ra) {
    case 1:
      return static_cast<int>(a->bool_value()) - static_cast<int>(b->bool_value());
    case 2: {
      const double x = *AsNumber(*a);
      const double y = *AsNumber(*b);
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    case 3:
      return a->string_value().compare(b->string_value());
    default:
      return 0;
  }
}

} // namespace chronicle::documents
