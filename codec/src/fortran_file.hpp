#ifndef FORTREC_FORTRAN_FILE_HPP
#define FORTREC_FORTRAN_FILE_HPP

#include "error.hpp"
#include "framer.hpp"
#include "layout.hpp"
#include "packer.hpp"
#include "type_spec.hpp"
#include "value.hpp"
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace fortrec {

enum class OpenMode { Read, Write };

/* Fixed for the lifetime of an open handle. */
struct OpenOptions {
  OpenMode mode = OpenMode::Read;
  MarkerWidth marker_width = MarkerWidth::Four;
  ByteOrder byte_order = ByteOrder::Native;
};

struct OpenOptionsResult {
  OpenOptions options;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

/* mode: "r", "rb", "w", "wb"; control_bytes: "4" or "8". */
OpenOptionsResult parse_open_options(const std::string& mode, const std::string& control_bytes = "4");

/* How write_arrays combines several arrays into one record. */
enum class ArrayPacking {
  Concatenate,  // bodies back to back
  Structured,   // zip equal-length homogeneous arrays into one structured record
};

struct ReadResult {
  RecordValue value;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
  bool at_eof() const { return error.kind == ErrorKind::EndOfFile; }
};

struct TellResult {
  int64_t position = 0;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

/* A file of Fortran unformatted sequential records, opened for either reading
 * or writing. Single owner; not safe for concurrent use. The stream is
 * flushed and closed by close() or on destruction. */
class FortranFile {
 public:
  FortranFile() = default;
  ~FortranFile();

  FortranFile(const FortranFile&) = delete;
  FortranFile& operator=(const FortranFile&) = delete;
  FortranFile(FortranFile&& other) noexcept;
  FortranFile& operator=(FortranFile&& other) noexcept;

  /* OpenError when the path cannot be opened; State when already open. */
  Status open(const std::string& path, const OpenOptions& options = OpenOptions());

  /* Flush and release. Closing a closed handle succeeds. */
  Status close();

  bool is_open() const { return file_ != nullptr; }
  const std::string& path() const { return path_; }
  const OpenOptions& options() const { return options_; }
  TellResult tell() const;

  /* Next record interpreted as `spec`; defaults to one-byte bools. */
  ReadResult read_record(const TypeSpec& spec = TypeSpec("b1"));

  /* Next record body, uninterpreted. */
  RecordResult read_bytes();

  Status write_value(const Scalar& value, const TypeSpec& spec);

  /* With a single-element spec: a homogeneous record of values.size() elements.
   * With a compound spec: one structured item, one value per field element. */
  Status write_values(const std::vector<Scalar>& values, const TypeSpec& spec);

  /* One spec per value; LengthMismatch when the sizes differ. */
  Status write_values(const std::vector<Scalar>& values, const std::vector<TypeSpec>& specs);

  Status write_array(const Collection& array);
  Status write_arrays(const std::vector<Collection>& arrays, ArrayPacking packing = ArrayPacking::Concatenate);

 private:
  Status require_mode(OpenMode mode) const;
  FrameConfig frame_config() const;
  Status write_packed(const std::vector<Scalar>& values, const RecordLayout& layout);
  void release();

  std::FILE* file_ = nullptr;
  std::string path_;
  OpenOptions options_;
};

}  // namespace fortrec

#endif
