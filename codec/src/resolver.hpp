#ifndef FORTREC_RESOLVER_HPP
#define FORTREC_RESOLVER_HPP

#include "error.hpp"
#include "type_spec.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fortrec {

/* Width of an unqualified integer spec (TypeCategory::Integer, "int").
 * Fortran's default INTEGER is 4 bytes on every mainstream compiler. */
constexpr size_t kDefaultIntegerWidth = 4;

/* Width of an unqualified float spec (TypeCategory::Float, "float"). */
constexpr size_t kDefaultFloatWidth = 8;

/* Concrete element type: kind, byte width, byte order. Immutable; only the
 * resolver creates them. */
class ElementDescriptor {
 public:
  ElementKind kind() const { return kind_; }
  size_t width() const { return width_; }
  ByteOrder order() const { return order_; }

  /* Canonical code, e.g. "i4", "<f8", ">u2", "S5". */
  std::string code() const;

  bool operator==(const ElementDescriptor& o) const {
    return kind_ == o.kind_ && width_ == o.width_ && order_ == o.order_;
  }
  bool operator!=(const ElementDescriptor& o) const { return !(*this == o); }

 private:
  friend struct DescriptorFactory;
  ElementDescriptor(ElementKind kind, size_t width, ByteOrder order)
      : kind_(kind), width_(width), order_(order) {}

  ElementKind kind_;
  size_t width_;
  ByteOrder order_;
};

/* One field of a resolved record type: `count` consecutive elements. */
struct FieldType {
  std::string name;
  ElementDescriptor type;
  size_t count = 1;
};

/* Resolved form of any TypeSpec. A single-element spec resolves to one
 * unnamed field and structured == false. */
struct RecordType {
  std::vector<FieldType> fields;
  bool structured = false;

  /* Packed byte size of one item (no padding). */
  size_t item_size() const;
  /* Number of scalars in one item (sum of field counts). */
  size_t values_per_item() const;
  bool operator==(const RecordType& o) const;
};

struct ElementResult {
  std::optional<ElementDescriptor> descriptor;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None && descriptor.has_value(); }
};

struct ResolveResult {
  RecordType type;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

/* Resolve a single-element spec. Compound specs fail with UnresolvedType. */
ElementResult resolve_element(const TypeSpec& spec);

/* Resolve any spec, preserving input order for sequences and records. */
ResolveResult resolve(const TypeSpec& spec);

/* Resolve one spec per value position (heterogeneous record). */
ResolveResult resolve_sequence(const std::vector<TypeSpec>& specs);

/* Record type of a homogeneous array of `descriptor`. */
RecordType homogeneous_type(const ElementDescriptor& descriptor);

}  // namespace fortrec

#endif
