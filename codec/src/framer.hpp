#ifndef FORTREC_FRAMER_HPP
#define FORTREC_FRAMER_HPP

#include "error.hpp"
#include "layout.hpp"
#include "packer.hpp"
#include "type_spec.hpp"
#include <cstdint>
#include <cstdio>

namespace fortrec {

/* Marker convention of one open stream. */
struct FrameConfig {
  MarkerWidth marker_width = MarkerWidth::Four;
  ByteOrder byte_order = ByteOrder::Native;
};

struct RecordResult {
  Bytes body;
  CodecError error;
  bool ok() const { return error.kind == ErrorKind::None; }
  /* Clean end of stream where a leading marker was expected. */
  bool at_eof() const { return error.kind == ErrorKind::EndOfFile; }
};

/* Marker encoding of `length` (signed, config byte order). */
Bytes encode_marker(uint64_t length, const FrameConfig& config);

/* Signed value of the marker at `p` (marker_width bytes). */
int64_t decode_marker(const uint8_t* p, const FrameConfig& config);

/* marker, body, marker. Advances the stream by 2 * marker + body.size().
 * Fails with RecordTooLarge (nothing written) or Io. */
Status write_record(std::FILE* out, const uint8_t* body, size_t size, const FrameConfig& config);

inline Status write_record(std::FILE* out, const Bytes& body, const FrameConfig& config) {
  return write_record(out, body.data(), body.size(), config);
}

/* Reads one record body. EndOfFile when no byte is left before the leading
 * marker; MalformedRecord for a negative marker or a record cut short;
 * RecordFraming when the trailing marker differs from the leading one. */
RecordResult read_record(std::FILE* in, const FrameConfig& config);

}  // namespace fortrec

#endif
