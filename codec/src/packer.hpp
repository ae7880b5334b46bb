#ifndef FORTREC_PACKER_HPP
#define FORTREC_PACKER_HPP

#include "error.hpp"
#include "layout.hpp"
#include "value.hpp"
#include <cstdint>
#include <vector>

namespace fortrec {

using Bytes = std::vector<uint8_t>;

struct PackResult {
  Bytes body;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

struct UnpackResult {
  RecordValue value;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

/* Serialize item-major `values` per `layout`. Elements whose descriptor says
 * ByteOrder::Native use `file_order`. The body is exactly
 * layout.body_length() bytes. Fails with LengthMismatch when the number of
 * values does not match the layout and with TypeMismatch when a value is not
 * representable by its descriptor. */
PackResult pack(const std::vector<Scalar>& values, const RecordLayout& layout, ByteOrder file_order);

/* Inverse of pack(). A layout of one field, one element, one item yields a
 * bare Scalar; anything else yields a Collection. */
UnpackResult unpack(const uint8_t* body, size_t size, const RecordLayout& layout, ByteOrder file_order);

inline UnpackResult unpack(const Bytes& body, const RecordLayout& layout, ByteOrder file_order) {
  return unpack(body.data(), body.size(), layout, file_order);
}

}  // namespace fortrec

#endif
