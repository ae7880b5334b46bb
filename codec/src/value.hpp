#ifndef FORTREC_VALUE_HPP
#define FORTREC_VALUE_HPP

#include "error.hpp"
#include "resolver.hpp"
#include "type_spec.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace fortrec {

/* One element value. Signed kinds read back as int64_t, unsigned as
 * uint64_t, floats as double, bools as bool, byte strings as std::string
 * (trailing NUL padding stripped). */
using Scalar = std::variant<int64_t, uint64_t, double, bool, std::string>;

/* Array of items of a resolved record type. Homogeneous arrays have a single
 * unnamed field; structured arrays have named fields, each possibly holding
 * several elements. `values` is item-major: item 0's fields in declaration
 * order (each field's elements consecutively), then item 1, ... */
struct Collection {
  RecordType type;
  std::vector<Scalar> values;

  bool structured() const { return type.structured; }
  /* Number of items. */
  size_t size() const;
  bool empty() const { return values.empty(); }

  /* Homogeneous element i. */
  const Scalar& at(size_t i) const { return values.at(i); }

  /* Element `sub` of field `field` in item `item`; std::out_of_range when any
   * index is past the end, like at(). */
  const Scalar& field(size_t item, size_t field, size_t sub = 0) const;

  /* Same, by field name; nullptr when no such field or index is out of range. */
  const Scalar* find(size_t item, const std::string& name, size_t sub = 0) const;

  bool operator==(const Collection& o) const { return type == o.type && values == o.values; }
};

/* Result of reading one record: a bare scalar when the record held exactly
 * one element of one field, otherwise a collection. */
using RecordValue = std::variant<Scalar, Collection>;

struct CollectionResult {
  Collection collection;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

/* Build an array from a type spec and item-major values. For structured specs
 * values.size() must be a multiple of the values per item. */
CollectionResult make_array(const TypeSpec& spec, std::vector<Scalar> values);

/* Build a homogeneous array of an already resolved element type. */
Collection make_array(const ElementDescriptor& type, std::vector<Scalar> values);

std::string format_scalar(const Scalar& value);
std::string format_collection(const Collection& collection);
std::string format_record(const RecordValue& value);

}  // namespace fortrec

#endif
