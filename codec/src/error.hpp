#ifndef FORTREC_ERROR_HPP
#define FORTREC_ERROR_HPP

#include <string>
#include <utility>

namespace fortrec {

enum class ErrorKind {
  None,
  Open,            // handle acquisition
  UnresolvedType,  // bad type spec
  RecordTooLarge,  // body length exceeds the marker range
  LengthMismatch,  // values/specs count mismatch
  MalformedRecord, // negative or impossible leading marker, truncated record
  RecordFraming,   // leading marker != trailing marker
  EndOfFile,       // clean end of stream at a record boundary
  TypeMismatch,    // value not representable by its descriptor
  State,           // wrong mode, closed handle, double open
  Io,              // host stream failure
};

struct CodecError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
};

/* Stable name for a kind, e.g. "RecordFramingError". */
const char* error_kind_name(ErrorKind kind);

/* Result of an operation that has no payload. */
struct Status {
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
};

inline CodecError make_error(ErrorKind kind, std::string message) {
  CodecError e;
  e.kind = kind;
  e.message = std::move(message);
  return e;
}

inline Status fail_status(ErrorKind kind, std::string message) {
  Status s;
  s.error = make_error(kind, std::move(message));
  return s;
}

}  // namespace fortrec

#endif
