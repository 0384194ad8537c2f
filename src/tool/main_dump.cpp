#include "byte_source.hpp"
#include "logging.hpp"
#include "stream_decoder.hpp"
#include "util.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace sendstream;

namespace {

struct DumpConfig {
  std::string input; // empty for stdin
  DecoderConfig decoder;
  bool single = false;
  bool quiet = false;
  LogLevel log_level = LogLevel::WARN;
};

void usage(const char *prog) {
  std::cerr << "usage: " << prog << " [options] [file]\n"
            << "  --strict             reject unknown attribute kinds\n"
            << "  --max-frame <size>   largest command payload accepted "
               "(default 16M)\n"
            << "  --single             stop after the first stream\n"
            << "  --quiet              verify only, print nothing\n"
            << "  --log-level <level>  trace|debug|info|warn|error|off\n";
}

} // namespace

int main(int argc, char **argv) {
  DumpConfig cfg;
  if (const char *env = std::getenv("SENDSTREAM_LOG")) {
    if (!parse_log_level(env, cfg.log_level))
      std::cerr << "ignoring bad SENDSTREAM_LOG=" << env << "\n";
  }

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(2);
    };
    if (a == "--strict")
      cfg.decoder.strict_attributes = true;
    else if (a == "--single")
      cfg.single = true;
    else if (a == "--quiet")
      cfg.quiet = true;
    else if (a == "--max-frame") {
      uint64_t v;
      std::string s = next(i);
      if (!parse_size(s, v) || v > UINT32_MAX) {
        std::cerr << "bad --max-frame " << s << "\n";
        return 2;
      }
      cfg.decoder.max_payload_len = (uint32_t)v;
    } else if (a == "--log-level") {
      std::string s = next(i);
      if (!parse_log_level(s.c_str(), cfg.log_level)) {
        std::cerr << "bad --log-level " << s << "\n";
        return 2;
      }
    } else if (a == "-h" || a == "--help") {
      usage(argv[0]);
      return 0;
    } else if (!a.empty() && a[0] == '-' && a != "-") {
      std::cerr << "unknown option " << a << "\n";
      usage(argv[0]);
      return 2;
    } else if (cfg.input.empty()) {
      cfg.input = a == "-" ? std::string() : a;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  Logger::instance().set_level(cfg.log_level);

  std::unique_ptr<DescriptorSource> src;
  if (cfg.input.empty()) {
    src.reset(new DescriptorSource(STDIN_FILENO, false));
  } else {
    int fd = ::open(cfg.input.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      Logger::instance().log(LogLevel::ERROR, "cannot open %s: %s",
                             cfg.input.c_str(), std::strerror(errno));
      return 1;
    }
    src.reset(new DescriptorSource(fd, true));
  }

  auto r = decode_streams(
      *src, cfg.decoder, cfg.single,
      [&](size_t stream, const StreamHeader &hdr, const Command &c) {
        if (cfg.quiet)
          return;
        if (std::holds_alternative<cmd::Subvol>(c) ||
            std::holds_alternative<cmd::Snapshot>(c))
          std::cout << "# stream " << stream << " version " << hdr.version
                    << "\n";
        std::cout << describe(c) << "\n";
      });
  std::cout.flush();

  if (auto *e = std::get_if<DecodeError>(&r)) {
    Logger::instance().log(LogLevel::ERROR, "%s", e->message().c_str());
    return 1;
  }
  Logger::instance().log(LogLevel::INFO, "decoded %zu stream(s)",
                         std::get<size_t>(r));
  return 0;
}
