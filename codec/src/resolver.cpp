#include "resolver.hpp"
#include <cctype>
#include <cstdint>
#include <utility>
#include <llvm/Support/MathExtras.h>

namespace fortrec {

struct DescriptorFactory {
  static ElementDescriptor make(ElementKind kind, size_t width, ByteOrder order) {
    return ElementDescriptor(kind, width, order);
  }
};

std::string ElementDescriptor::code() const {
  std::string out;
  if (order_ == ByteOrder::Little) out += '<';
  else if (order_ == ByteOrder::Big) out += '>';
  switch (kind_) {
    case ElementKind::SignedInt: out += 'i'; break;
    case ElementKind::UnsignedInt: out += 'u'; break;
    case ElementKind::Float: out += 'f'; break;
    case ElementKind::Bool: out += 'b'; break;
    case ElementKind::FixedBytes: out += 'S'; break;
  }
  out += std::to_string(width_);
  return out;
}

size_t RecordType::item_size() const {
  size_t total = 0;
  for (const FieldType& f : fields) total += f.type.width() * f.count;
  return total;
}

size_t RecordType::values_per_item() const {
  size_t total = 0;
  for (const FieldType& f : fields) total += f.count;
  return total;
}

bool RecordType::operator==(const RecordType& o) const {
  if (structured != o.structured || fields.size() != o.fields.size()) return false;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].name != o.fields[i].name || fields[i].type != o.fields[i].type ||
        fields[i].count != o.fields[i].count)
      return false;
  }
  return true;
}

RecordType homogeneous_type(const ElementDescriptor& descriptor) {
  RecordType t;
  t.fields.push_back(FieldType{"", descriptor, 1});
  return t;
}

static ElementResult fail(const std::string& msg) {
  ElementResult r;
  r.error = make_error(ErrorKind::UnresolvedType, msg);
  return r;
}

static ElementResult element_ok(ElementKind kind, size_t width, ByteOrder order) {
  ElementResult r;
  r.descriptor = DescriptorFactory::make(kind, width, order);
  return r;
}

static const char* kind_label(ElementKind kind) {
  switch (kind) {
    case ElementKind::SignedInt: return "signed integer";
    case ElementKind::UnsignedInt: return "unsigned integer";
    case ElementKind::Float: return "float";
    case ElementKind::Bool: return "bool";
    case ElementKind::FixedBytes: return "byte string";
  }
  return "unknown";
}

static bool width_allowed(ElementKind kind, size_t width) {
  switch (kind) {
    case ElementKind::SignedInt:
    case ElementKind::UnsignedInt:
      return width == 1 || width == 2 || width == 4 || width == 8;
    case ElementKind::Float: return width == 4 || width == 8;
    case ElementKind::Bool: return width == 1;
    case ElementKind::FixedBytes: return width >= 1;
  }
  return false;
}

static ElementResult checked(ElementKind kind, size_t width, ByteOrder order) {
  if (!width_allowed(kind, width))
    return fail("invalid width " + std::to_string(width) + " for " + kind_label(kind));
  return element_ok(kind, width, order);
}

static bool kind_from_letter(char c, ElementKind* out) {
  switch (c) {
    case 'i': *out = ElementKind::SignedInt; return true;
    case 'u': *out = ElementKind::UnsignedInt; return true;
    case 'f': *out = ElementKind::Float; return true;
    case 'b': *out = ElementKind::Bool; return true;
    case 'S': *out = ElementKind::FixedBytes; return true;
    default: return false;
  }
}

/* Named aliases; the byte order prefix is handled by the caller. */
static bool named_type(const std::string& name, ElementKind* kind, size_t* width) {
  struct Alias { const char* name; ElementKind kind; size_t width; };
  static const Alias aliases[] = {
      {"int", ElementKind::SignedInt, kDefaultIntegerWidth},
      {"float", ElementKind::Float, kDefaultFloatWidth},
      {"double", ElementKind::Float, 8},
      {"single", ElementKind::Float, 4},
      {"bool", ElementKind::Bool, 1},
      {"int8", ElementKind::SignedInt, 1},
      {"int16", ElementKind::SignedInt, 2},
      {"int32", ElementKind::SignedInt, 4},
      {"int64", ElementKind::SignedInt, 8},
      {"uint8", ElementKind::UnsignedInt, 1},
      {"uint16", ElementKind::UnsignedInt, 2},
      {"uint32", ElementKind::UnsignedInt, 4},
      {"uint64", ElementKind::UnsignedInt, 8},
      {"float32", ElementKind::Float, 4},
      {"float64", ElementKind::Float, 8},
  };
  for (const Alias& a : aliases) {
    if (name == a.name) {
      *kind = a.kind;
      *width = a.width;
      return true;
    }
  }
  return false;
}

/* code := order? (name | letter digits?) */
static ElementResult resolve_code(const std::string& code) {
  if (code.empty()) return fail("empty type code");
  size_t i = 0;
  ByteOrder order = ByteOrder::Native;
  if (code[0] == '<') order = ByteOrder::Little;
  else if (code[0] == '>') order = ByteOrder::Big;
  if (code[0] == '<' || code[0] == '>' || code[0] == '=' || code[0] == '|') i = 1;
  if (i >= code.size()) return fail("type code '" + code + "' has no kind");

  std::string body = code.substr(i);
  ElementKind kind = ElementKind::SignedInt;
  size_t width = 0;
  if (named_type(body, &kind, &width)) return element_ok(kind, width, order);

  if (!kind_from_letter(body[0], &kind))
    return fail("unknown kind '" + std::string(1, body[0]) + "' in type code '" + code + "'");

  if (body.size() == 1) {
    if (kind == ElementKind::FixedBytes || kind == ElementKind::Bool) return element_ok(kind, 1, order);
    return fail("type code '" + code + "' has no width");
  }
  for (size_t j = 1; j < body.size(); ++j) {
    if (!std::isdigit(static_cast<unsigned char>(body[j])))
      return fail("non-integer width in type code '" + code + "'");
    width = width * 10 + static_cast<size_t>(body[j] - '0');
    if (width > (static_cast<size_t>(1) << 40))
      return fail("width too large in type code '" + code + "'");
  }
  if (width == 0) return fail("non-positive width in type code '" + code + "'");
  return checked(kind, width, order);
}

ElementResult resolve_element(const TypeSpec& spec) {
  switch (spec.form) {
    case TypeSpec::Form::Category:
      if (spec.category == TypeCategory::Integer)
        return element_ok(ElementKind::SignedInt, kDefaultIntegerWidth, ByteOrder::Native);
      return element_ok(ElementKind::Float, kDefaultFloatWidth, ByteOrder::Native);
    case TypeSpec::Form::Code:
      if (spec.code.find(',') != std::string::npos)
        return fail("type code '" + spec.code + "' describes more than one element");
      return resolve_code(spec.code);
    case TypeSpec::Form::Explicit:
      return checked(spec.kind, spec.width, spec.order);
    case TypeSpec::Form::Sequence:
    case TypeSpec::Form::Record:
      return fail("compound type where a single element type is required");
  }
  return fail("unknown type spec form");
}

static ResolveResult resolve_fail(CodecError err) {
  ResolveResult r;
  r.error = std::move(err);
  return r;
}

/* Element count and byte size of one item must not wrap, and one item must
 * fit the widest (8-byte) marker. */
static CodecError check_item_totals(const RecordType& type) {
  bool overflow = false;
  uint64_t values = 0;
  uint64_t bytes = 0;
  for (const FieldType& f : type.fields) {
    values = llvm::SaturatingAdd<uint64_t>(values, f.count, &overflow);
    if (overflow) break;
    uint64_t n = llvm::SaturatingMultiply<uint64_t>(f.type.width(), f.count, &overflow);
    if (overflow) break;
    bytes = llvm::SaturatingAdd<uint64_t>(bytes, n, &overflow);
    if (overflow) break;
  }
  if (overflow || bytes > static_cast<uint64_t>(llvm::maxIntN(64)))
    return make_error(ErrorKind::UnresolvedType, "record item is too large to encode");
  return CodecError();
}

static std::vector<TypeSpec> split_codes(const std::string& code) {
  std::vector<TypeSpec> out;
  size_t start = 0;
  while (true) {
    size_t comma = code.find(',', start);
    std::string part = code.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    size_t b = part.find_first_not_of(' ');
    size_t e = part.find_last_not_of(' ');
    out.push_back(TypeSpec(b == std::string::npos ? std::string() : part.substr(b, e - b + 1)));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

ResolveResult resolve_sequence(const std::vector<TypeSpec>& specs) {
  ResolveResult r;
  r.type.structured = true;
  if (specs.empty()) return resolve_fail(make_error(ErrorKind::UnresolvedType, "empty type sequence"));
  for (size_t i = 0; i < specs.size(); ++i) {
    ElementResult e = resolve_element(specs[i]);
    if (!e.ok()) return resolve_fail(e.error);
    r.type.fields.push_back(FieldType{"f" + std::to_string(i), *e.descriptor, 1});
  }
  CodecError totals = check_item_totals(r.type);
  if (totals.kind != ErrorKind::None) return resolve_fail(std::move(totals));
  return r;
}

ResolveResult resolve(const TypeSpec& spec) {
  if (spec.form == TypeSpec::Form::Sequence) return resolve_sequence(spec.elements);

  if (spec.form == TypeSpec::Form::Code && spec.code.find(',') != std::string::npos)
    return resolve_sequence(split_codes(spec.code));

  if (spec.form == TypeSpec::Form::Record) {
    if (spec.elements.empty())
      return resolve_fail(make_error(ErrorKind::UnresolvedType, "record type has no fields"));
    if (spec.names.size() != spec.elements.size() || spec.counts.size() != spec.elements.size())
      return resolve_fail(make_error(ErrorKind::UnresolvedType, "record field names/counts out of step"));
    ResolveResult r;
    r.type.structured = true;
    for (size_t i = 0; i < spec.elements.size(); ++i) {
      if (spec.elements[i].is_compound())
        return resolve_fail(make_error(ErrorKind::UnresolvedType,
                                       "nested record in field '" + spec.names[i] + "' is not supported"));
      if (spec.counts[i] == 0)
        return resolve_fail(make_error(ErrorKind::UnresolvedType,
                                       "field '" + spec.names[i] + "' has zero elements"));
      for (size_t j = 0; j < i; ++j) {
        if (!spec.names[i].empty() && spec.names[j] == spec.names[i])
          return resolve_fail(make_error(ErrorKind::UnresolvedType, "duplicate field name '" + spec.names[i] + "'"));
      }
      ElementResult e = resolve_element(spec.elements[i]);
      if (!e.ok()) return resolve_fail(e.error);
      std::string name = spec.names[i].empty() ? "f" + std::to_string(i) : spec.names[i];
      r.type.fields.push_back(FieldType{std::move(name), *e.descriptor, spec.counts[i]});
    }
    CodecError totals = check_item_totals(r.type);
    if (totals.kind != ErrorKind::None) return resolve_fail(std::move(totals));
    return r;
  }

  ElementResult e = resolve_element(spec);
  if (!e.ok()) return resolve_fail(e.error);
  ResolveResult r;
  r.type = homogeneous_type(*e.descriptor);
  return r;
}

}  // namespace fortrec
