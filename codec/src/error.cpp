#include "error.hpp"

namespace fortrec {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "Ok";
    case ErrorKind::Open: return "OpenError";
    case ErrorKind::UnresolvedType: return "UnresolvedTypeError";
    case ErrorKind::RecordTooLarge: return "RecordTooLargeError";
    case ErrorKind::LengthMismatch: return "LengthMismatchError";
    case ErrorKind::MalformedRecord: return "MalformedRecordError";
    case ErrorKind::RecordFraming: return "RecordFramingError";
    case ErrorKind::EndOfFile: return "EndOfFileError";
    case ErrorKind::TypeMismatch: return "TypeMismatchError";
    case ErrorKind::State: return "StateError";
    case ErrorKind::Io: return "IoError";
  }
  return "UnknownError";
}

}  // namespace fortrec
