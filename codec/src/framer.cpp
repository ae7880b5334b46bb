#include "framer.hpp"
#include "endian.hpp"
#include "trace.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <llvm/Support/MathExtras.h>

namespace fortrec {

/* Bodies are read in pieces so a corrupt length cannot force a huge allocation. */
static constexpr size_t kReadChunk = 1 << 16;

static llvm::support::endianness marker_endianness(const FrameConfig& config) {
  return effective_endianness(ByteOrder::Native, config.byte_order);
}

Bytes encode_marker(uint64_t length, const FrameConfig& config) {
  Bytes out(marker_bytes(config.marker_width));
  write_uint(out.data(), out.size(), length, marker_endianness(config));
  return out;
}

int64_t decode_marker(const uint8_t* p, const FrameConfig& config) {
  size_t width = marker_bytes(config.marker_width);
  uint64_t raw = read_uint(p, width, marker_endianness(config));
  return llvm::SignExtend64(raw, static_cast<unsigned>(width * 8));
}

static std::string io_message(const char* what) {
  std::string msg = what;
  if (errno != 0) {
    msg += ": ";
    msg += std::strerror(errno);
  }
  return msg;
}

static RecordResult read_fail(ErrorKind kind, std::string msg) {
  RecordResult r;
  r.error = make_error(kind, std::move(msg));
  return r;
}

Status write_record(std::FILE* out, const uint8_t* body, size_t size, const FrameConfig& config) {
  if (!out) return fail_status(ErrorKind::State, "no stream to write to");
  if (static_cast<uint64_t>(size) > max_record_length(config.marker_width))
    return fail_status(ErrorKind::RecordTooLarge,
                       "record of " + std::to_string(size) + " bytes exceeds the " +
                           std::to_string(marker_bytes(config.marker_width)) + "-byte marker maximum");

  Bytes marker = encode_marker(size, config);
  errno = 0;
  if (std::fwrite(marker.data(), 1, marker.size(), out) != marker.size())
    return fail_status(ErrorKind::Io, io_message("failed to write leading marker"));
  if (size > 0 && std::fwrite(body, 1, size, out) != size)
    return fail_status(ErrorKind::Io, io_message("failed to write record body"));
  if (std::fwrite(marker.data(), 1, marker.size(), out) != marker.size())
    return fail_status(ErrorKind::Io, io_message("failed to write trailing marker"));
  debug_log("wrote record of " + std::to_string(size) + " bytes");
  return Status();
}

RecordResult read_record(std::FILE* in, const FrameConfig& config) {
  if (!in) return read_fail(ErrorKind::State, "no stream to read from");
  size_t width = marker_bytes(config.marker_width);
  uint8_t head[8];
  uint8_t tail[8];

  errno = 0;
  size_t n = std::fread(head, 1, width, in);
  if (n == 0) {
    if (std::ferror(in)) return read_fail(ErrorKind::Io, io_message("failed to read leading marker"));
    return read_fail(ErrorKind::EndOfFile, "end of file");
  }
  if (n < width)
    return read_fail(ErrorKind::MalformedRecord,
                     "truncated leading marker (" + std::to_string(n) + " of " + std::to_string(width) + " bytes)");

  int64_t length = decode_marker(head, config);
  if (length < 0)
    return read_fail(ErrorKind::MalformedRecord, "negative record length " + std::to_string(length));

  RecordResult r;
  uint64_t remaining = static_cast<uint64_t>(length);
  while (remaining > 0) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, kReadChunk));
    size_t old_size = r.body.size();
    r.body.resize(old_size + want);
    size_t got = std::fread(r.body.data() + old_size, 1, want, in);
    if (got < want) {
      if (std::ferror(in)) return read_fail(ErrorKind::Io, io_message("failed to read record body"));
      return read_fail(ErrorKind::MalformedRecord,
                       "record body truncated: marker says " + std::to_string(length) + " bytes, only " +
                           std::to_string(old_size + got) + " available");
    }
    remaining -= want;
  }

  n = std::fread(tail, 1, width, in);
  if (n < width) {
    if (std::ferror(in)) return read_fail(ErrorKind::Io, io_message("failed to read trailing marker"));
    return read_fail(ErrorKind::MalformedRecord, "missing trailing marker after " + std::to_string(length) + " bytes");
  }
  int64_t trailing = decode_marker(tail, config);
  if (trailing != length)
    return read_fail(ErrorKind::RecordFraming,
                     "record head and tail mismatch (" + std::to_string(length) + " vs " +
                         std::to_string(trailing) + ")");
  debug_log("read record of " + std::to_string(length) + " bytes");
  return r;
}

}  // namespace fortrec
