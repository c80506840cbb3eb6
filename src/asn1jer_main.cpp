//===- asn1jer_main.cpp - asn1jer: compile descriptors, transcode JER -----===//
//
// Command-line front end. Reads a descriptor specification (JSON, or msgpack
// with --input-msgpack), compiles it, and then either dumps the compiled
// types or transcodes a JER document read from stdin.
//
//===----------------------------------------------------------------------===//

#include "asn1jer/codec.h"
#include "asn1jer/descriptor_reader.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

namespace {

enum class Mode { Dump, Decode, Normalize };

struct Options {
  std::string spec_file;
  std::string type_name; // Module.Type
  Mode mode = Mode::Dump;
  bool input_msgpack = false;
  bool keep_going = false;
  bool verbose = false;
  asn1jer::CodecOptions codec;
};

void printUsage() {
  std::cerr << "Usage: asn1jer [options] <spec-file>\n"
            << "\n"
            << "Options:\n"
            << "  --input-msgpack     Read the specification as msgpack (default: JSON)\n"
            << "  --type=<Mod.Type>   Type to operate on (required for --decode/--normalize)\n"
            << "  --dump              Print the compiled type tree(s) (default)\n"
            << "  --decode            Decode JER from stdin and print the value\n"
            << "  --normalize         Decode JER from stdin and re-encode it canonically\n"
            << "  --strict            Reject missing required members on decode\n"
            << "  --emit-defaults     Encode members equal to their DEFAULT\n"
            << "  --max-depth=<n>     Value nesting limit (default: 256)\n"
            << "  --keep-going        Skip types that fail to compile\n"
            << "  --verbose           Log progress to stderr\n"
            << "  --help              Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> Options {
  Options opts;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      printUsage();
      std::exit(0);
    } else if (args[i] == "--input-msgpack") {
      opts.input_msgpack = true;
    } else if (args[i].starts_with("--type=")) {
      opts.type_name = args[i].substr(std::string("--type=").size());
    } else if (args[i] == "--dump") {
      opts.mode = Mode::Dump;
    } else if (args[i] == "--decode") {
      opts.mode = Mode::Decode;
    } else if (args[i] == "--normalize") {
      opts.mode = Mode::Normalize;
    } else if (args[i] == "--strict") {
      opts.codec.missing_fields = asn1jer::MissingFieldDecoding::Reject;
    } else if (args[i] == "--emit-defaults") {
      opts.codec.defaults = asn1jer::DefaultEncoding::Emit;
    } else if (args[i].starts_with("--max-depth=")) {
      auto text = args[i].substr(std::string("--max-depth=").size());
      char *end = nullptr;
      errno = 0;
      unsigned long depth = std::strtoul(text.c_str(), &end, 10);
      if (text.empty() || text[0] < '0' || text[0] > '9' || *end != '\0' || errno == ERANGE ||
          depth > std::numeric_limits<unsigned>::max()) {
        std::cerr << "Invalid --max-depth value: " << text << "\n";
        std::exit(1);
      }
      opts.codec.max_depth = static_cast<unsigned>(depth);
    } else if (args[i] == "--keep-going") {
      opts.keep_going = true;
    } else if (args[i] == "--verbose") {
      opts.verbose = true;
    } else if (args[i][0] != '-') {
      opts.spec_file = args[i];
    } else {
      std::cerr << "Unknown option: " << args[i] << "\n";
      printUsage();
      std::exit(1);
    }
  }

  if (opts.spec_file.empty()) {
    printUsage();
    std::exit(1);
  }
  return opts;
}

/// Split "Module.Type" at the first dot.
bool splitTypeName(const std::string &qualified, std::string &module, std::string &type) {
  auto dot = qualified.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == qualified.size())
    return false;
  module = qualified.substr(0, dot);
  type = qualified.substr(dot + 1);
  return true;
}

int run(const Options &opts) {
  std::ifstream f(opts.spec_file, std::ios::binary);
  if (!f) {
    std::cerr << "Error: could not open file: " << opts.spec_file << "\n";
    return 1;
  }
  std::vector<uint8_t> specData(std::istreambuf_iterator<char>(f), {});

  auto spec = opts.input_msgpack
                  ? asn1jer::parseMsgpackSpecification(specData.data(), specData.size())
                  : asn1jer::parseJsonSpecification(specData.data(), specData.size());
  if (opts.verbose)
    std::cerr << "asn1jer: read " << spec.size() << " module(s) from " << opts.spec_file << "\n";

  asn1jer::CompileOptions compileOpts;
  compileOpts.quarantine_failures = opts.keep_going;
  auto compiled = asn1jer::compileSpecification(spec, compileOpts);

  for (const auto &failure : compiled.failures())
    std::cerr << "Warning: skipped " << failure.module << "." << failure.type << ": "
              << failure.error.what() << "\n";
  if (opts.verbose) {
    size_t count = 0;
    for (const auto &[module, types] : compiled.modules())
      count += types.size();
    std::cerr << "asn1jer: compiled " << count << " type(s) into " << compiled.schema().size()
              << " node(s)\n";
  }

  if (opts.mode == Mode::Dump && opts.type_name.empty()) {
    for (const auto &[module, types] : compiled.modules())
      for (const auto &[name, type] : types)
        std::cout << module << "." << name << " ::= " << type.describe() << "\n";
    return 0;
  }

  std::string moduleName, typeName;
  if (!splitTypeName(opts.type_name, moduleName, typeName)) {
    std::cerr << "Error: expected --type=<Module.Type>, got '" << opts.type_name << "'\n";
    return 1;
  }
  const auto &type = compiled.type(moduleName, typeName);

  if (opts.mode == Mode::Dump) {
    std::cout << opts.type_name << " ::= " << type.describe() << "\n";
    return 0;
  }

  std::vector<uint8_t> input(std::istreambuf_iterator<char>(std::cin), {});
  if (opts.verbose)
    std::cerr << "asn1jer: decoding " << input.size() << " byte(s) as " << opts.type_name << "\n";
  auto value = type.decode(input, opts.codec);

  if (opts.mode == Mode::Decode) {
    std::cout << asn1jer::formatValue(value) << "\n";
    return 0;
  }

  auto wire = type.encode(value, opts.codec);
  std::cout.write(reinterpret_cast<const char *>(wire.data()),
                  static_cast<std::streamsize>(wire.size()));
  std::cout << "\n";
  return 0;
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  auto opts = parse_args(argc, argv);
  try {
    return run(opts);
  } catch (const asn1jer::Error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Internal error: " << e.what() << "\n";
    return 1;
  }
}
