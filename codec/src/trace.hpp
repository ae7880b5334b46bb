#ifndef FORTREC_TRACE_HPP
#define FORTREC_TRACE_HPP

#include <cstdlib>
#include <iostream>
#include <string>

namespace fortrec {

/* Framing trace on stderr, enabled by setting FORTREC_DEBUG. */
inline bool debug_enabled() {
  return std::getenv("FORTREC_DEBUG") != nullptr;
}

inline void debug_log(const std::string& msg) {
  if (debug_enabled()) std::cerr << "fortrec: " << msg << "\n";
}

}  // namespace fortrec

#endif
