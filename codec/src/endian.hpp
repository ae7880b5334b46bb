#ifndef FORTREC_ENDIAN_HPP
#define FORTREC_ENDIAN_HPP

#include "type_spec.hpp"
#include <cstddef>
#include <cstdint>
#include <llvm/Support/Endian.h>

namespace fortrec {

/* Element order falls back to the file order; a Native file order is the host's. */
inline llvm::support::endianness effective_endianness(ByteOrder element, ByteOrder file) {
  ByteOrder o = element == ByteOrder::Native ? file : element;
  if (o == ByteOrder::Little) return llvm::support::little;
  if (o == ByteOrder::Big) return llvm::support::big;
  return llvm::support::native;
}

/* Unsigned integer of `width` bytes (1, 2, 4 or 8) at `p`. */
inline uint64_t read_uint(const uint8_t* p, size_t width, llvm::support::endianness e) {
  switch (width) {
    case 1: return p[0];
    case 2: return llvm::support::endian::read16(p, e);
    case 4: return llvm::support::endian::read32(p, e);
    default: return llvm::support::endian::read64(p, e);
  }
}

/* Low `width` bytes of `v` at `p`. */
inline void write_uint(uint8_t* p, size_t width, uint64_t v, llvm::support::endianness e) {
  switch (width) {
    case 1: p[0] = static_cast<uint8_t>(v); break;
    case 2: llvm::support::endian::write16(p, static_cast<uint16_t>(v), e); break;
    case 4: llvm::support::endian::write32(p, static_cast<uint32_t>(v), e); break;
    default: llvm::support::endian::write64(p, v, e); break;
  }
}

}  // namespace fortrec

#endif
