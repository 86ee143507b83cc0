#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <ump/ump.hpp>

#include "log.hpp"

using namespace ump;

// Usage: ump-dump <file> [chunk-size] [--lenient] [--contiguous] [--verbose]
// Decodes a captured UMP response body, feeding it in chunks of chunk-size bytes (default 65536).
int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <file> [chunk-size] [--lenient] [--contiguous] [--verbose]\n";
    return EXIT_FAILURE;
  }

  std::size_t chunkSize = 65536;
  DecoderConfig config;
  log::set_level(log::level::warn);
  for (int argPos = 2; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "--lenient") {
      config.withLenientMismatch();
    } else if (arg == "--contiguous") {
      config.withContinuationFraming(DecoderConfig::ContinuationFraming::Contiguous);
    } else if (arg == "--verbose") {
      log::set_level(log::level::debug);
    } else {
      const auto [ptr, errc] = std::from_chars(arg.data(), arg.data() + arg.size(), chunkSize);
      if (errc != std::errc{} || ptr != arg.data() + arg.size() || chunkSize == 0) {
        std::cerr << "Invalid chunk size: " << arg << "\n";
        return EXIT_FAILURE;
      }
    }
  }

  std::ifstream file(argv[1], std::ios::binary);
  if (!file) {
    std::cerr << "Cannot open " << argv[1] << ": " << std::strerror(errno) << '\n';
    return EXIT_FAILURE;
  }
  const std::string body{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

  try {
    PartDecoder decoder(config);
    decoder.setDiagnosticCallback([](const Diagnostic &diag) {
      std::cout << "diagnostic " << DiagnosticKindName(diag.kind) << " at offset " << diag.streamOffset
                << " (expected type " << diag.expectedType << ", got " << diag.actualType << ")\n";
    });

    vector<Part> parts;
    DecodeResult res;
    for (std::size_t pos = 0; pos < body.size() && res.isSuccess(); pos += chunkSize) {
      res = decoder.feed(std::string_view(body).substr(pos, chunkSize), parts);
    }
    if (res.isSuccess()) {
      res = decoder.finish();
    }

    for (const Part &part : parts) {
      std::cout << part.type << ' ' << PartTypeName(part.type).value_or("UNKNOWN") << ' ' << part.size() << '\n';
    }

    const auto &stats = decoder.stats();
    stats.for_each_field([](std::string_view name, auto value) { std::cout << "# " << name << ' ' << value << '\n'; });

    if (!res.isSuccess()) {
      std::cerr << "Decoding failed: " << DecodeStatusName(res.status) << ": " << res.errorMessage << '\n';
      return EXIT_FAILURE;
    }
  } catch (const std::exception &e) {
    std::cerr << "Decoder encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
