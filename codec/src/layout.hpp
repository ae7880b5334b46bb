#ifndef FORTREC_LAYOUT_HPP
#define FORTREC_LAYOUT_HPP

#include "error.hpp"
#include "resolver.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fortrec {

/* Width of the record length markers; fixed for the lifetime of a handle. */
enum class MarkerWidth {
  Four = 4,
  Eight = 8,
};

inline size_t marker_bytes(MarkerWidth w) {
  return static_cast<size_t>(w);
}

/* Largest body length a marker can encode (signed range). */
uint64_t max_record_length(MarkerWidth w);

/* Packed layout: no alignment, no padding. */
struct FieldLayout {
  std::string name;
  ElementDescriptor type;
  size_t count = 1;
  size_t offset = 0;  // within one item

  size_t nbytes() const { return type.width() * count; }
};

/* Full record body: `items` repetitions of one item laid out as `fields`.
 * offset[i+1] == offset[i] + nbytes(i) and item_size == sum of nbytes. */
struct RecordLayout {
  std::vector<FieldLayout> fields;
  size_t item_size = 0;
  size_t items = 0;
  bool structured = false;

  size_t body_length() const { return item_size * items; }
  size_t values_per_item() const;
  /* One field, one element, one item: unpacks to a bare scalar. */
  bool is_scalar() const;
  /* Resolved record type this layout was planned from. */
  RecordType record_type() const;
};

struct LayoutResult {
  RecordLayout layout;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

/* One descriptor, `count` values: one field, offset 0. */
LayoutResult plan_homogeneous(const ElementDescriptor& type, size_t count, MarkerWidth marker);

/* One value per descriptor, offsets by cumulative packed sum. */
LayoutResult plan_heterogeneous(const std::vector<ElementDescriptor>& types, MarkerWidth marker);

/* Named fields repeated `items` times. */
LayoutResult plan_structured(const RecordType& type, size_t items, MarkerWidth marker);

/* Dispatches on the record type: homogeneous types plan `items` elements of
 * their single field, structured types plan `items` repetitions. */
LayoutResult plan_layout(const RecordType& type, size_t items, MarkerWidth marker);

/* Read side: the number of items is derived from a body length. Fails with
 * MalformedRecord when the body is not a whole number of items. */
LayoutResult plan_for_body(const RecordType& type, size_t body_length, MarkerWidth marker);

}  // namespace fortrec

#endif
