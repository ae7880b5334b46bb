#include "layout.hpp"
#include <llvm/Support/MathExtras.h>

namespace fortrec {

uint64_t max_record_length(MarkerWidth w) {
  return static_cast<uint64_t>(llvm::maxIntN(static_cast<int64_t>(marker_bytes(w) * 8)));
}

size_t RecordLayout::values_per_item() const {
  size_t total = 0;
  for (const FieldLayout& f : fields) total += f.count;
  return total;
}

bool RecordLayout::is_scalar() const {
  return fields.size() == 1 && fields[0].count == 1 && items == 1;
}

RecordType RecordLayout::record_type() const {
  RecordType t;
  t.structured = structured;
  if (!structured) {
    if (!fields.empty()) t = homogeneous_type(fields[0].type);
    return t;
  }
  for (const FieldLayout& f : fields) t.fields.push_back(FieldType{f.name, f.type, f.count});
  return t;
}

static LayoutResult fail(ErrorKind kind, const std::string& msg) {
  LayoutResult r;
  r.error = make_error(kind, msg);
  return r;
}

static LayoutResult too_large(uint64_t requested, MarkerWidth marker) {
  return fail(ErrorKind::RecordTooLarge,
              "record of " + std::to_string(requested) + " bytes exceeds the " +
                  std::to_string(marker_bytes(marker)) + "-byte marker maximum of " +
                  std::to_string(max_record_length(marker)));
}

/* Lays fields end to end, then checks items * item_size against the marker. */
static LayoutResult finish(RecordLayout layout, MarkerWidth marker) {
  bool overflow = false;
  uint64_t offset = 0;
  for (FieldLayout& f : layout.fields) {
    f.offset = static_cast<size_t>(offset);
    uint64_t n = llvm::SaturatingMultiply<uint64_t>(f.type.width(), f.count, &overflow);
    if (overflow) return too_large(n, marker);
    offset = llvm::SaturatingAdd<uint64_t>(offset, n, &overflow);
    if (overflow) return too_large(offset, marker);
  }
  layout.item_size = static_cast<size_t>(offset);
  uint64_t total = llvm::SaturatingMultiply<uint64_t>(offset, layout.items, &overflow);
  if (overflow || total > max_record_length(marker)) return too_large(total, marker);

  LayoutResult r;
  r.layout = std::move(layout);
  return r;
}

LayoutResult plan_homogeneous(const ElementDescriptor& type, size_t count, MarkerWidth marker) {
  RecordLayout layout;
  layout.fields.push_back(FieldLayout{"", type, count, 0});
  layout.items = 1;
  return finish(std::move(layout), marker);
}

LayoutResult plan_heterogeneous(const std::vector<ElementDescriptor>& types, MarkerWidth marker) {
  if (types.empty()) return fail(ErrorKind::UnresolvedType, "heterogeneous record needs at least one type");
  RecordLayout layout;
  layout.structured = true;
  layout.items = 1;
  for (size_t i = 0; i < types.size(); ++i)
    layout.fields.push_back(FieldLayout{"f" + std::to_string(i), types[i], 1, 0});
  return finish(std::move(layout), marker);
}

LayoutResult plan_structured(const RecordType& type, size_t items, MarkerWidth marker) {
  if (type.fields.empty()) return fail(ErrorKind::UnresolvedType, "structured record needs at least one field");
  RecordLayout layout;
  layout.structured = true;
  layout.items = items;
  for (const FieldType& f : type.fields) layout.fields.push_back(FieldLayout{f.name, f.type, f.count, 0});
  return finish(std::move(layout), marker);
}

LayoutResult plan_layout(const RecordType& type, size_t items, MarkerWidth marker) {
  if (type.fields.empty()) return fail(ErrorKind::UnresolvedType, "record type has no fields");
  if (type.structured) return plan_structured(type, items, marker);
  return plan_homogeneous(type.fields[0].type, items * type.fields[0].count, marker);
}

LayoutResult plan_for_body(const RecordType& type, size_t body_length, MarkerWidth marker) {
  size_t item_size = type.item_size();
  if (item_size == 0) return fail(ErrorKind::UnresolvedType, "record type has no fields");
  if (body_length % item_size != 0)
    return fail(ErrorKind::MalformedRecord,
                "record size " + std::to_string(body_length) + " not valid for data type of " +
                    std::to_string(item_size) + " bytes");
  return plan_layout(type, body_length / item_size, marker);
}

}  // namespace fortrec
