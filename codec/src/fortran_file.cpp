#include "fortran_file.hpp"
#include "trace.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace fortrec {

OpenOptionsResult parse_open_options(const std::string& mode, const std::string& control_bytes) {
  OpenOptionsResult r;
  if (mode == "r" || mode == "rb") {
    r.options.mode = OpenMode::Read;
  } else if (mode == "w" || mode == "wb") {
    r.options.mode = OpenMode::Write;
  } else {
    r.error = make_error(ErrorKind::Open, "invalid mode '" + mode + "'");
    return r;
  }
  if (control_bytes == "4") {
    r.options.marker_width = MarkerWidth::Four;
  } else if (control_bytes == "8") {
    r.options.marker_width = MarkerWidth::Eight;
  } else {
    r.error = make_error(ErrorKind::Open, "invalid control byte size '" + control_bytes + "'");
  }
  return r;
}

FortranFile::~FortranFile() {
  Status s = close();
  if (!s.ok()) std::cerr << "fortrec: closing '" << path_ << "': " << s.error.message << "\n";
}

FortranFile::FortranFile(FortranFile&& other) noexcept
    : file_(other.file_), path_(std::move(other.path_)), options_(other.options_) {
  other.file_ = nullptr;
}

FortranFile& FortranFile::operator=(FortranFile&& other) noexcept {
  if (this != &other) {
    release();
    file_ = other.file_;
    path_ = std::move(other.path_);
    options_ = other.options_;
    other.file_ = nullptr;
  }
  return *this;
}

void FortranFile::release() {
  Status s = close();
  if (!s.ok()) std::cerr << "fortrec: closing '" << path_ << "': " << s.error.message << "\n";
}

Status FortranFile::open(const std::string& path, const OpenOptions& options) {
  if (file_) return fail_status(ErrorKind::State, "file already open: '" + path_ + "'");
  const char* mode = options.mode == OpenMode::Read ? "rb" : "wb";
  errno = 0;
  std::FILE* f = std::fopen(path.c_str(), mode);
  if (!f) {
    std::string msg = "cannot open '" + path + "'";
    if (errno != 0) msg += std::string(": ") + std::strerror(errno);
    return fail_status(ErrorKind::Open, msg);
  }
  file_ = f;
  path_ = path;
  options_ = options;
  debug_log("opened '" + path + "' (" + mode + ", " + std::to_string(marker_bytes(options.marker_width)) +
            "-byte markers)");
  return Status();
}

Status FortranFile::close() {
  if (!file_) return Status();
  std::FILE* f = file_;
  file_ = nullptr;
  errno = 0;
  bool flushed = std::fflush(f) == 0;
  bool closed = std::fclose(f) == 0;
  if (!flushed || !closed) {
    std::string msg = flushed ? "close failed" : "flush failed";
    if (errno != 0) msg += std::string(": ") + std::strerror(errno);
    return fail_status(ErrorKind::Io, msg);
  }
  debug_log("closed '" + path_ + "'");
  return Status();
}

TellResult FortranFile::tell() const {
  TellResult r;
  if (!file_) {
    r.error = make_error(ErrorKind::State, "no file is open");
    return r;
  }
  long pos = std::ftell(file_);
  if (pos < 0) {
    r.error = make_error(ErrorKind::Io, std::string("tell failed: ") + std::strerror(errno));
    return r;
  }
  r.position = pos;
  return r;
}

Status FortranFile::require_mode(OpenMode mode) const {
  if (!file_) return fail_status(ErrorKind::State, "no file is open");
  if (options_.mode != mode)
    return fail_status(ErrorKind::State, mode == OpenMode::Read ? "not in read mode" : "not in write mode");
  return Status();
}

FrameConfig FortranFile::frame_config() const {
  FrameConfig config;
  config.marker_width = options_.marker_width;
  config.byte_order = options_.byte_order;
  return config;
}

RecordResult FortranFile::read_bytes() {
  Status s = require_mode(OpenMode::Read);
  if (!s.ok()) {
    RecordResult r;
    r.error = s.error;
    return r;
  }
  return fortrec::read_record(file_, frame_config());
}

ReadResult FortranFile::read_record(const TypeSpec& spec) {
  ReadResult r;
  Status s = require_mode(OpenMode::Read);
  if (!s.ok()) {
    r.error = s.error;
    return r;
  }
  ResolveResult resolved = resolve(spec);
  if (!resolved.ok()) {
    r.error = resolved.error;
    return r;
  }
  RecordResult record = fortrec::read_record(file_, frame_config());
  if (!record.ok()) {
    r.error = record.error;
    return r;
  }
  LayoutResult planned = plan_for_body(resolved.type, record.body.size(), options_.marker_width);
  if (!planned.ok()) {
    r.error = planned.error;
    return r;
  }
  UnpackResult unpacked = unpack(record.body, planned.layout, options_.byte_order);
  if (!unpacked.ok()) {
    r.error = unpacked.error;
    return r;
  }
  r.value = std::move(unpacked.value);
  return r;
}

Status FortranFile::write_packed(const std::vector<Scalar>& values, const RecordLayout& layout) {
  PackResult packed = pack(values, layout, options_.byte_order);
  if (!packed.ok()) return Status{packed.error};
  return write_record(file_, packed.body, frame_config());
}

Status FortranFile::write_value(const Scalar& value, const TypeSpec& spec) {
  Status s = require_mode(OpenMode::Write);
  if (!s.ok()) return s;
  ResolveResult resolved = resolve(spec);
  if (!resolved.ok()) return Status{resolved.error};
  if (resolved.type.values_per_item() != 1)
    return fail_status(ErrorKind::LengthMismatch,
                       "one value for a type of " + std::to_string(resolved.type.values_per_item()) + " elements");
  LayoutResult planned = plan_layout(resolved.type, 1, options_.marker_width);
  if (!planned.ok()) return Status{planned.error};
  return write_packed({value}, planned.layout);
}

Status FortranFile::write_values(const std::vector<Scalar>& values, const TypeSpec& spec) {
  Status s = require_mode(OpenMode::Write);
  if (!s.ok()) return s;
  ResolveResult resolved = resolve(spec);
  if (!resolved.ok()) return Status{resolved.error};
  LayoutResult planned;
  if (resolved.type.structured) {
    if (values.size() != resolved.type.values_per_item())
      return fail_status(ErrorKind::LengthMismatch,
                         std::to_string(values.size()) + " values for " +
                             std::to_string(resolved.type.values_per_item()) + " field elements");
    planned = plan_structured(resolved.type, 1, options_.marker_width);
  } else {
    planned = plan_homogeneous(resolved.type.fields[0].type, values.size(), options_.marker_width);
  }
  if (!planned.ok()) return Status{planned.error};
  return write_packed(values, planned.layout);
}

Status FortranFile::write_values(const std::vector<Scalar>& values, const std::vector<TypeSpec>& specs) {
  Status s = require_mode(OpenMode::Write);
  if (!s.ok()) return s;
  if (values.size() != specs.size())
    return fail_status(ErrorKind::LengthMismatch, std::to_string(values.size()) + " values for " +
                                                      std::to_string(specs.size()) + " type specs");
  ResolveResult resolved = resolve_sequence(specs);
  if (!resolved.ok()) return Status{resolved.error};
  std::vector<ElementDescriptor> types;
  for (const FieldType& f : resolved.type.fields) types.push_back(f.type);
  LayoutResult planned = plan_heterogeneous(types, options_.marker_width);
  if (!planned.ok()) return Status{planned.error};
  return write_packed(values, planned.layout);
}

static LayoutResult plan_array(const Collection& array, MarkerWidth marker) {
  size_t per_item = array.type.values_per_item();
  if (array.type.fields.empty() || per_item == 0) {
    LayoutResult r;
    r.error = make_error(ErrorKind::UnresolvedType, "array has no element type");
    return r;
  }
  if (array.values.size() % per_item != 0) {
    LayoutResult r;
    r.error = make_error(ErrorKind::LengthMismatch,
                         std::to_string(array.values.size()) + " values do not fill items of " +
                             std::to_string(per_item) + " values");
    return r;
  }
  return plan_layout(array.type, array.values.size() / per_item, marker);
}

Status FortranFile::write_array(const Collection& array) {
  Status s = require_mode(OpenMode::Write);
  if (!s.ok()) return s;
  LayoutResult planned = plan_array(array, options_.marker_width);
  if (!planned.ok()) return Status{planned.error};
  return write_packed(array.values, planned.layout);
}

static Status zip_arrays(const std::vector<Collection>& arrays, MarkerWidth marker, RecordLayout* layout,
                         std::vector<Scalar>* values) {
  if (arrays.empty()) return fail_status(ErrorKind::LengthMismatch, "no arrays to pack");
  RecordType type;
  type.structured = true;
  size_t items = arrays[0].values.size();
  for (size_t i = 0; i < arrays.size(); ++i) {
    const Collection& a = arrays[i];
    if (a.structured() || a.type.fields.size() != 1 || a.type.fields[0].count != 1)
      return fail_status(ErrorKind::UnresolvedType, "array " + std::to_string(i) + " is not homogeneous");
    if (a.values.size() != items)
      return fail_status(ErrorKind::LengthMismatch, "array " + std::to_string(i) + " has " +
                                                        std::to_string(a.values.size()) + " elements, expected " +
                                                        std::to_string(items));
    type.fields.push_back(FieldType{"f" + std::to_string(i), a.type.fields[0].type, 1});
  }
  LayoutResult planned = plan_structured(type, items, marker);
  if (!planned.ok()) return Status{planned.error};
  values->reserve(items * arrays.size());
  for (size_t item = 0; item < items; ++item)
    for (const Collection& a : arrays) values->push_back(a.values[item]);
  *layout = std::move(planned.layout);
  return Status();
}

Status FortranFile::write_arrays(const std::vector<Collection>& arrays, ArrayPacking packing) {
  Status s = require_mode(OpenMode::Write);
  if (!s.ok()) return s;

  if (packing == ArrayPacking::Structured) {
    RecordLayout layout;
    std::vector<Scalar> values;
    Status zipped = zip_arrays(arrays, options_.marker_width, &layout, &values);
    if (!zipped.ok()) return zipped;
    return write_packed(values, layout);
  }

  Bytes body;
  for (const Collection& a : arrays) {
    LayoutResult planned = plan_array(a, options_.marker_width);
    if (!planned.ok()) return Status{planned.error};
    PackResult packed = pack(a.values, planned.layout, options_.byte_order);
    if (!packed.ok()) return Status{packed.error};
    if (body.size() + packed.body.size() > max_record_length(options_.marker_width))
      return fail_status(ErrorKind::RecordTooLarge,
                         "concatenated record exceeds the " + std::to_string(marker_bytes(options_.marker_width)) +
                             "-byte marker maximum");
    body.insert(body.end(), packed.body.begin(), packed.body.end());
  }
  return write_record(file_, body, frame_config());
}

}  // namespace fortrec
