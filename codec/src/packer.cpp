#include "packer.hpp"
#include "endian.hpp"
#include <cfloat>
#include <cmath>
#include <cstring>
#include <limits>
#include <utility>
#include <llvm/Support/MathExtras.h>

namespace fortrec {

static CodecError mismatch(const ElementDescriptor& type, const Scalar& value, const std::string& why) {
  return make_error(ErrorKind::TypeMismatch,
                    "value " + format_scalar(value) + " " + why + " for type " + type.code());
}

/* Integral value of a scalar, as int64 (signed targets). */
static bool to_signed(const Scalar& value, int64_t* out) {
  if (auto* i = std::get_if<int64_t>(&value)) {
    *out = *i;
    return true;
  }
  if (auto* u = std::get_if<uint64_t>(&value)) {
    if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
    *out = static_cast<int64_t>(*u);
    return true;
  }
  if (auto* b = std::get_if<bool>(&value)) {
    *out = *b ? 1 : 0;
    return true;
  }
  if (auto* d = std::get_if<double>(&value)) {
    // Only whole numbers inside the int64 range; 2^63 itself is out.
    if (!std::isfinite(*d) || std::trunc(*d) != *d) return false;
    if (*d < -9223372036854775808.0 || *d >= 9223372036854775808.0) return false;
    *out = static_cast<int64_t>(*d);
    return true;
  }
  return false;
}

static bool to_unsigned(const Scalar& value, uint64_t* out) {
  if (auto* u = std::get_if<uint64_t>(&value)) {
    *out = *u;
    return true;
  }
  if (auto* d = std::get_if<double>(&value)) {
    if (!std::isfinite(*d) || std::trunc(*d) != *d) return false;
    if (*d < 0.0 || *d >= 18446744073709551616.0) return false;
    *out = static_cast<uint64_t>(*d);
    return true;
  }
  int64_t v = 0;
  if (!to_signed(value, &v) || v < 0) return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

static bool to_double(const Scalar& value, double* out) {
  if (auto* d = std::get_if<double>(&value)) *out = *d;
  else if (auto* i = std::get_if<int64_t>(&value)) *out = static_cast<double>(*i);
  else if (auto* u = std::get_if<uint64_t>(&value)) *out = static_cast<double>(*u);
  else if (auto* b = std::get_if<bool>(&value)) *out = *b ? 1.0 : 0.0;
  else return false;
  return true;
}

/* An integer written to a float field must read back unchanged. */
static bool integer_is_exact(const Scalar& value, double stored) {
  if (auto* i = std::get_if<int64_t>(&value))
    return stored >= -9223372036854775808.0 && stored < 9223372036854775808.0 &&
           static_cast<int64_t>(stored) == *i;
  if (auto* u = std::get_if<uint64_t>(&value))
    return stored >= 0.0 && stored < 18446744073709551616.0 && static_cast<uint64_t>(stored) == *u;
  return true;
}

static CodecError pack_element(const Scalar& value, const ElementDescriptor& type,
                               llvm::support::endianness e, uint8_t* dst) {
  size_t width = type.width();
  unsigned bits = static_cast<unsigned>(width * 8);
  switch (type.kind()) {
    case ElementKind::SignedInt: {
      int64_t v = 0;
      if (!to_signed(value, &v)) return mismatch(type, value, "is not an integer");
      if (!llvm::isIntN(bits, v)) return mismatch(type, value, "is out of range");
      write_uint(dst, width, static_cast<uint64_t>(v), e);
      return CodecError();
    }
    case ElementKind::UnsignedInt: {
      uint64_t v = 0;
      if (!to_unsigned(value, &v)) return mismatch(type, value, "is not a non-negative integer");
      if (!llvm::isUIntN(bits, v)) return mismatch(type, value, "is out of range");
      write_uint(dst, width, v, e);
      return CodecError();
    }
    case ElementKind::Float: {
      double d = 0.0;
      if (!to_double(value, &d)) return mismatch(type, value, "is not a number");
      if (width == 4) {
        if (std::isfinite(d) && std::fabs(d) > FLT_MAX) return mismatch(type, value, "overflows");
        float f = static_cast<float>(d);
        if (!integer_is_exact(value, static_cast<double>(f)))
          return mismatch(type, value, "is not exactly representable");
        uint32_t raw;
        std::memcpy(&raw, &f, sizeof raw);
        write_uint(dst, 4, raw, e);
      } else {
        if (!integer_is_exact(value, d)) return mismatch(type, value, "is not exactly representable");
        uint64_t raw;
        std::memcpy(&raw, &d, sizeof raw);
        write_uint(dst, 8, raw, e);
      }
      return CodecError();
    }
    case ElementKind::Bool: {
      if (auto* b = std::get_if<bool>(&value)) {
        dst[0] = *b ? 1 : 0;
        return CodecError();
      }
      int64_t v = 0;
      if (!to_signed(value, &v) || (v != 0 && v != 1)) return mismatch(type, value, "is not a bool");
      dst[0] = static_cast<uint8_t>(v);
      return CodecError();
    }
    case ElementKind::FixedBytes: {
      auto* s = std::get_if<std::string>(&value);
      if (!s) return mismatch(type, value, "is not a byte string");
      if (s->size() > width) return mismatch(type, value, "is longer than " + std::to_string(width) + " bytes");
      std::memcpy(dst, s->data(), s->size());
      std::memset(dst + s->size(), 0, width - s->size());
      return CodecError();
    }
  }
  return make_error(ErrorKind::UnresolvedType, "unknown element kind");
}

static Scalar unpack_element(const uint8_t* src, const ElementDescriptor& type, llvm::support::endianness e) {
  size_t width = type.width();
  switch (type.kind()) {
    case ElementKind::SignedInt:
      return llvm::SignExtend64(read_uint(src, width, e), static_cast<unsigned>(width * 8));
    case ElementKind::UnsignedInt:
      return read_uint(src, width, e);
    case ElementKind::Float:
      if (width == 4) {
        uint32_t raw = static_cast<uint32_t>(read_uint(src, 4, e));
        float f;
        std::memcpy(&f, &raw, sizeof f);
        return static_cast<double>(f);
      } else {
        uint64_t raw = read_uint(src, 8, e);
        double d;
        std::memcpy(&d, &raw, sizeof d);
        return d;
      }
    case ElementKind::Bool:
      return src[0] != 0;
    case ElementKind::FixedBytes: {
      std::string s(reinterpret_cast<const char*>(src), width);
      size_t end = s.find_last_not_of('\0');
      s.resize(end == std::string::npos ? 0 : end + 1);
      return s;
    }
  }
  return Scalar();
}

PackResult pack(const std::vector<Scalar>& values, const RecordLayout& layout, ByteOrder file_order) {
  PackResult r;
  size_t per_item = layout.values_per_item();
  if (values.size() != per_item * layout.items) {
    r.error = make_error(ErrorKind::LengthMismatch,
                         "layout holds " + std::to_string(per_item * layout.items) + " values, got " +
                             std::to_string(values.size()));
    return r;
  }
  r.body.assign(layout.body_length(), 0);
  size_t k = 0;
  for (size_t item = 0; item < layout.items; ++item) {
    uint8_t* base = r.body.data() + item * layout.item_size;
    for (const FieldLayout& f : layout.fields) {
      llvm::support::endianness e = effective_endianness(f.type.order(), file_order);
      for (size_t j = 0; j < f.count; ++j) {
        CodecError err = pack_element(values[k++], f.type, e, base + f.offset + j * f.type.width());
        if (err.kind != ErrorKind::None) {
          r.body.clear();
          r.error = std::move(err);
          return r;
        }
      }
    }
  }
  return r;
}

UnpackResult unpack(const uint8_t* body, size_t size, const RecordLayout& layout, ByteOrder file_order) {
  UnpackResult r;
  if (size != layout.body_length()) {
    r.error = make_error(ErrorKind::MalformedRecord,
                         "body of " + std::to_string(size) + " bytes does not match layout of " +
                             std::to_string(layout.body_length()) + " bytes");
    return r;
  }
  std::vector<Scalar> values;
  values.reserve(layout.values_per_item() * layout.items);
  for (size_t item = 0; item < layout.items; ++item) {
    const uint8_t* base = body + item * layout.item_size;
    for (const FieldLayout& f : layout.fields) {
      llvm::support::endianness e = effective_endianness(f.type.order(), file_order);
      for (size_t j = 0; j < f.count; ++j)
        values.push_back(unpack_element(base + f.offset + j * f.type.width(), f.type, e));
    }
  }
  if (layout.is_scalar()) {
    r.value = std::move(values[0]);
    return r;
  }
  Collection c;
  c.type = layout.record_type();
  c.values = std::move(values);
  r.value = std::move(c);
  return r;
}

}  // namespace fortrec
