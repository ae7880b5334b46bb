#include "fortran_file.hpp"
#include "resolver.hpp"
#include "test_utils.h"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

static int failed = 0;

#define ASSERT(cond, msg) do { \
  if (!(cond)) { std::cerr << "FAIL: " << (msg) << "\n"; failed = 1; } \
  else { std::cout << "PASS: " << (msg) << "\n"; } \
} while(0)

static fortrec::OpenOptions options(fortrec::OpenMode mode) {
  fortrec::OpenOptions o;
  o.mode = mode;
  o.byte_order = fortrec::ByteOrder::Little;
  return o;
}

static void test_int32_scalar() {
  std::string path = fortrec::test::temp_path("smoke_int32");
  {
    fortrec::FortranFile out;
    ASSERT(out.open(path, options(fortrec::OpenMode::Write)).ok(), "open for write");
    ASSERT(out.write_value(int64_t{1}, "int32").ok(), "write int32 1");
  }
  auto bytes = fortrec::test::read_file(path);
  ASSERT(bytes == (std::vector<uint8_t>{4, 0, 0, 0, 1, 0, 0, 0, 4, 0, 0, 0}), "int32 record framed by 4-byte markers");

  fortrec::FortranFile in;
  ASSERT(in.open(path, options(fortrec::OpenMode::Read)).ok(), "open for read");
  auto r = in.read_record("int32");
  ASSERT(r.ok(), "read int32");
  if (r.ok()) {
    const auto* s = std::get_if<fortrec::Scalar>(&r.value);
    ASSERT(s && std::get_if<int64_t>(s) && *std::get_if<int64_t>(s) == 1, "int32 reads back as scalar 1");
  }
  ASSERT(in.read_record("int32").at_eof(), "end of file after one record");
  ASSERT(in.close().ok(), "close after read");
  std::remove(path.c_str());
}

static void test_float_array() {
  std::string path = fortrec::test::temp_path("smoke_f4");
  {
    fortrec::FortranFile out;
    ASSERT(out.open(path, options(fortrec::OpenMode::Write)).ok(), "open f4 file");
    ASSERT(out.write_values({1.0, 2.0}, "f4").ok(), "write f4 [1, 2]");
  }
  auto bytes = fortrec::test::read_file(path);
  ASSERT(bytes.size() == 16 && bytes[0] == 8 && bytes[12] == 8, "f4 record has 8-byte body");

  fortrec::FortranFile in;
  ASSERT(in.open(path, options(fortrec::OpenMode::Read)).ok(), "reopen f4 file");
  auto r = in.read_record("f4");
  const auto* c = std::get_if<fortrec::Collection>(&r.value);
  ASSERT(r.ok() && c && c->size() == 2, "f4 reads back as two elements");
  if (c && c->size() == 2) {
    ASSERT(fortrec::format_collection(*c) == "[1, 2]", "f4 values are 1 and 2");
  }
  ASSERT(in.close().ok(), "close after read");
  std::remove(path.c_str());
}

static void test_mixed_record() {
  std::string path = fortrec::test::temp_path("smoke_mixed");
  {
    fortrec::FortranFile out;
    ASSERT(out.open(path, options(fortrec::OpenMode::Write)).ok(), "open mixed file");
    auto s = out.write_values({1.5, std::string("x")}, std::vector<fortrec::TypeSpec>{"f8", "S1"});
    ASSERT(s.ok(), "write (1.5, \"x\")");
  }
  ASSERT(fortrec::test::read_file(path).size() == 17, "mixed record body is 9 bytes");

  fortrec::FortranFile in;
  ASSERT(in.open(path, options(fortrec::OpenMode::Read)).ok(), "reopen mixed file");
  auto r = in.read_record("f8,S1");
  ASSERT(r.ok(), "read f8,S1");
  if (r.ok()) ASSERT(fortrec::format_record(r.value) == "[(1.5, \"x\")]", "mixed record formats as one item");
  ASSERT(in.close().ok(), "close after read");
  std::remove(path.c_str());
}

static void test_framing_error() {
  std::string path = fortrec::test::temp_path("smoke_framing");
  ASSERT(fortrec::test::write_file(path, {4, 0, 0, 0, 1, 0, 0, 0, 5, 0, 0, 0}), "write corrupt file");
  fortrec::FortranFile in;
  ASSERT(in.open(path, options(fortrec::OpenMode::Read)).ok(), "open corrupt file");
  auto r = in.read_record("i4");
  ASSERT(r.error.kind == fortrec::ErrorKind::RecordFraming, "mismatched markers are a framing error");
  ASSERT(in.close().ok(), "close after read");
  std::remove(path.c_str());
}

static void test_unresolved_type() {
  auto r = fortrec::resolve_element("x4");
  ASSERT(!r.ok() && r.error.kind == fortrec::ErrorKind::UnresolvedType, "unknown kind letter is rejected");
}

int main() {
  test_int32_scalar();
  test_float_array();
  test_mixed_record();
  test_framing_error();
  test_unresolved_type();
  if (failed) {
    std::cerr << "Some tests failed.\n";
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed.\n";
  return EXIT_SUCCESS;
}
