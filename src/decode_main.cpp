//===- decode_main.cpp - polyrec-decode: feed document → JSON -------------===//
//
// Reads a msgpack (or JSON) feed document from stdin or a file, decodes it
// into Post records and prints the decoded records as JSON. A top-level
// sequence decodes as a list of posts.
//
//===----------------------------------------------------------------------===//

#include "polyrec/codec.h"
#include "polyrec/decoder.h"
#include "polyrec/feed.h"

#include "llvm/Support/raw_ostream.h"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

namespace {

struct Options {
  std::string input_file;
  std::string tag_namespace;
  bool input_json = false;
  bool strict = false;
  bool trace = false;
  unsigned max_depth = 64;
};

void printUsage() {
  llvm::errs() << "Usage: polyrec-decode [options] [input.msgpack]\n"
               << "  (no input file = read msgpack document from stdin)\n"
               << "\n"
               << "Options:\n"
               << "  --input-json        Read JSON input instead of msgpack\n"
               << "  --namespace=<ns>    Field tag namespace (default: msgpack,\n"
               << "                      or json with --input-json)\n"
               << "  --strict            Disable weak typing\n"
               << "  --max-depth=<n>     Nested record limit (default: 64)\n"
               << "  --trace             Trace decoding to stderr\n"
               << "  --help              Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> Options {
  Options opts;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      printUsage();
      std::exit(0);
    } else if (args[i] == "--input-json") {
      opts.input_json = true;
    } else if (args[i] == "--strict") {
      opts.strict = true;
    } else if (args[i] == "--trace") {
      opts.trace = true;
    } else if (args[i].starts_with("--namespace=")) {
      opts.tag_namespace = args[i].substr(std::string("--namespace=").size());
    } else if (args[i].starts_with("--max-depth=")) {
      std::string value = args[i].substr(std::string("--max-depth=").size());
      auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), opts.max_depth);
      if (ec != std::errc() || end != value.data() + value.size()) {
        llvm::errs() << "Error: invalid --max-depth value: " << value << "\n";
        std::exit(1);
      }
    } else if (!args[i].empty() && args[i][0] != '-') {
      opts.input_file = args[i];
    } else {
      llvm::errs() << "Unknown option: " << args[i] << "\n";
      printUsage();
      std::exit(1);
    }
  }

  if (opts.tag_namespace.empty())
    opts.tag_namespace = opts.input_json ? "json" : "msgpack";
  return opts;
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  auto opts = parse_args(argc, argv);

  // Read input from stdin or file
  std::vector<uint8_t> inputData;
  if (!opts.input_file.empty()) {
    std::ifstream f(opts.input_file, std::ios::binary);
    if (!f) {
      llvm::errs() << "Error: could not open file: " << opts.input_file << "\n";
      return 1;
    }
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(f), {});
  } else {
#ifdef _WIN32
    _setmode(_fileno(stdin), _O_BINARY);
#endif
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(std::cin), {});
  }

  if (inputData.empty()) {
    llvm::errs() << "Error: no input data\n";
    return 1;
  }

  polyrec::DecodeOptions options;
  options.tag_namespace = opts.tag_namespace;
  options.weak_typing = !opts.strict;
  options.max_depth = opts.max_depth;
  if (opts.trace)
    options.trace = &llvm::errs();

  polyrec::Decoder decoder(polyrec::feed::feedHooks(), polyrec::feed::feedPreprocessors(),
                           options);
  nlohmann::json out;
  try {
    auto format = opts.input_json ? polyrec::Format::Json : polyrec::Format::Msgpack;
    polyrec::Value doc = polyrec::parseDocument(format, inputData.data(), inputData.size());
    if (doc.isSequence()) {
      out = nlohmann::json::array();
      for (const auto &post : decoder.decode<std::vector<polyrec::feed::Post>>(doc))
        out.push_back(polyrec::feed::toJson(post));
    } else {
      out = polyrec::feed::toJson(decoder.decode<polyrec::feed::Post>(doc));
    }
  } catch (const std::exception &e) {
    llvm::errs() << "Error: " << e.what() << "\n";
    return 1;
  }

  llvm::outs() << out.dump(2) << "\n";
  return 0;
}
