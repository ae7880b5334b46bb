#include "value.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fortrec {

size_t Collection::size() const {
  size_t per_item = type.values_per_item();
  return per_item == 0 ? 0 : values.size() / per_item;
}

static size_t field_start(const RecordType& type, size_t field) {
  size_t start = 0;
  for (size_t i = 0; i < field; ++i) start += type.fields[i].count;
  return start;
}

const Scalar& Collection::field(size_t item, size_t field, size_t sub) const {
  if (field >= type.fields.size() || sub >= type.fields[field].count)
    throw std::out_of_range("field " + std::to_string(field) + " element " + std::to_string(sub) + " out of range");
  size_t per_item = type.values_per_item();
  return values.at(item * per_item + field_start(type, field) + sub);
}

const Scalar* Collection::find(size_t item, const std::string& name, size_t sub) const {
  for (size_t i = 0; i < type.fields.size(); ++i) {
    if (type.fields[i].name != name) continue;
    if (sub >= type.fields[i].count || item >= size()) return nullptr;
    return &field(item, i, sub);
  }
  return nullptr;
}

CollectionResult make_array(const TypeSpec& spec, std::vector<Scalar> values) {
  CollectionResult r;
  ResolveResult resolved = resolve(spec);
  if (!resolved.ok()) {
    r.error = resolved.error;
    return r;
  }
  size_t per_item = resolved.type.values_per_item();
  if (per_item == 0) {
    r.error = make_error(ErrorKind::UnresolvedType, "type has no elements");
    return r;
  }
  if (values.size() % per_item != 0) {
    r.error = make_error(ErrorKind::LengthMismatch,
                         std::to_string(values.size()) + " values do not fill items of " +
                             std::to_string(per_item) + " values");
    return r;
  }
  r.collection.type = std::move(resolved.type);
  r.collection.values = std::move(values);
  return r;
}

Collection make_array(const ElementDescriptor& type, std::vector<Scalar> values) {
  Collection c;
  c.type = homogeneous_type(type);
  c.values = std::move(values);
  return c;
}

std::string format_scalar(const Scalar& value) {
  std::ostringstream out;
  if (auto* i = std::get_if<int64_t>(&value)) out << *i;
  else if (auto* u = std::get_if<uint64_t>(&value)) out << *u;
  else if (auto* d = std::get_if<double>(&value)) out << std::setprecision(17) << *d;
  else if (auto* b = std::get_if<bool>(&value)) out << (*b ? "true" : "false");
  else if (auto* s = std::get_if<std::string>(&value)) out << std::quoted(*s);
  return out.str();
}

std::string format_collection(const Collection& collection) {
  std::string out = "[";
  size_t per_item = collection.type.values_per_item();
  for (size_t item = 0; item < collection.size(); ++item) {
    if (item > 0) out += ", ";
    if (!collection.structured()) {
      out += format_scalar(collection.at(item));
      continue;
    }
    out += "(";
    size_t k = item * per_item;
    for (size_t f = 0; f < collection.type.fields.size(); ++f) {
      if (f > 0) out += ", ";
      size_t count = collection.type.fields[f].count;
      if (count > 1) out += "[";
      for (size_t j = 0; j < count; ++j) {
        if (j > 0) out += ", ";
        out += format_scalar(collection.values[k++]);
      }
      if (count > 1) out += "]";
    }
    out += ")";
  }
  out += "]";
  return out;
}

std::string format_record(const RecordValue& value) {
  if (auto* s = std::get_if<Scalar>(&value)) return format_scalar(*s);
  return format_collection(std::get<Collection>(value));
}

}  // namespace fortrec
