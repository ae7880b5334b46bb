#ifndef FORTREC_TEST_UTILS_H
#define FORTREC_TEST_UTILS_H

#include <cstdint>
#include <string>
#include <vector>

namespace fortrec {
namespace test {

/** Fresh path under TMPDIR (or /tmp) unique to this process; the file is not created. */
std::string temp_path(const std::string& name);

/** Whole file contents; empty when the file cannot be read. */
std::vector<uint8_t> read_file(const std::string& path);

/** Replace the file with `bytes`. Returns false on failure. */
bool write_file(const std::string& path, const std::vector<uint8_t>& bytes);

}  // namespace test
}  // namespace fortrec

#endif
