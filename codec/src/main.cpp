#include <cstdlib>
#include <iostream>
#include <string>

#include <llvm/Config/llvm-config.h>

#include "error.hpp"
#include "fortran_file.hpp"
#include "type_spec.hpp"
#include "value.hpp"

struct DumpArgs {
  std::string path;
  std::string dtype = "b1";
  std::string control_bytes = "4";
  fortrec::ByteOrder byte_order = fortrec::ByteOrder::Native;
};

static void print_usage() {
  std::cout << "fortrec - Fortran unformatted record files\n";
  std::cout << "usage: fortrec [options] <command> <file>\n";
  std::cout << "  --help, -h                Show this help\n";
  std::cout << "  --version, -v             Show tool and LLVM version\n";
  std::cout << "  dump <file>               Print every record\n";
  std::cout << "  count <file>              Print the number of records\n";
  std::cout << "  --dtype SPEC              Element type for dump (default b1), e.g. f8, <i4, f8,S1\n";
  std::cout << "  --control-bytes 4|8       Record marker width (default 4)\n";
  std::cout << "  --big-endian, --little-endian\n";
}

static int report(const fortrec::CodecError& err) {
  std::cerr << "fortrec: " << fortrec::error_kind_name(err.kind) << ": " << err.message << "\n";
  return 1;
}

static int open_for_read(const DumpArgs& args, fortrec::FortranFile& file) {
  auto parsed = fortrec::parse_open_options("rb", args.control_bytes);
  if (!parsed.ok()) return report(parsed.error);
  parsed.options.byte_order = args.byte_order;
  fortrec::Status s = file.open(args.path, parsed.options);
  if (!s.ok()) return report(s.error);
  return 0;
}

static int run_dump(const DumpArgs& args) {
  fortrec::FortranFile file;
  if (int rc = open_for_read(args, file)) return rc;
  fortrec::TypeSpec spec(args.dtype);
  for (size_t n = 0;; ++n) {
    auto pos = file.tell();
    auto result = file.read_record(spec);
    if (result.at_eof()) break;
    if (!result.ok()) return report(result.error);
    auto end = file.tell();
    if (!pos.ok()) return report(pos.error);
    if (!end.ok()) return report(end.error);
    size_t marker = fortrec::marker_bytes(file.options().marker_width);
    int64_t body = end.position - pos.position - static_cast<int64_t>(2 * marker);
    std::cout << "record " << n << ": " << body << " bytes: " << fortrec::format_record(result.value) << "\n";
  }
  fortrec::Status s = file.close();
  if (!s.ok()) return report(s.error);
  return 0;
}

static int run_count(const DumpArgs& args) {
  fortrec::FortranFile file;
  if (int rc = open_for_read(args, file)) return rc;
  size_t count = 0;
  while (true) {
    auto record = file.read_bytes();
    if (record.at_eof()) break;
    if (!record.ok()) return report(record.error);
    ++count;
  }
  std::cout << count << "\n";
  fortrec::Status s = file.close();
  if (!s.ok()) return report(s.error);
  return 0;
}

int main(int argc, char* argv[]) {
  DumpArgs args;
  std::string command;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--version" || arg == "-v") {
      std::cout << "fortrec (LLVM " << LLVM_VERSION_STRING << ")\n";
      return 0;
    }
    if (arg == "--dtype" && i + 1 < argc) {
      args.dtype = argv[++i];
    } else if (arg == "--control-bytes" && i + 1 < argc) {
      args.control_bytes = argv[++i];
    } else if (arg == "--big-endian") {
      args.byte_order = fortrec::ByteOrder::Big;
    } else if (arg == "--little-endian") {
      args.byte_order = fortrec::ByteOrder::Little;
    } else if ((arg == "dump" || arg == "count") && command.empty() && i + 1 < argc) {
      command = arg;
      args.path = argv[++i];
    } else {
      std::cerr << "fortrec: unexpected argument '" << arg << "'\n";
      print_usage();
      return 1;
    }
  }
  if (command == "dump") return run_dump(args);
  if (command == "count") return run_count(args);
  print_usage();
  return 0;
}
