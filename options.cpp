#include "options.hh"

#include "memory.hh"

#include <getopt.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace zerobench {

namespace {

enum {
  OPT_JSON = 256,
  OPT_NO_SUBSTITUTE,
  OPT_SMALL_THRESHOLD,
  OPT_LARGE_THRESHOLD,
};

const struct option long_options[] = {
    {"size", required_argument, nullptr, 's'},
    {"dirty-fraction", required_argument, nullptr, 'd'},
    {"threads", required_argument, nullptr, 't'},
    {"processes", required_argument, nullptr, 'p'},
    {"iterations", required_argument, nullptr, 'i'},
    {"strategies", required_argument, nullptr, 'S'},
    {"scan-window", required_argument, nullptr, 'w'},
    {"force-resident", no_argument, nullptr, 'r'},
    {"huge-pages", no_argument, nullptr, 'H'},
    {"pin", no_argument, nullptr, 'a'},
    {"help", no_argument, nullptr, 'h'},
    {"json", no_argument, nullptr, OPT_JSON},
    {"no-substitute", no_argument, nullptr, OPT_NO_SUBSTITUTE},
    {"small-threshold", required_argument, nullptr, OPT_SMALL_THRESHOLD},
    {"large-threshold", required_argument, nullptr, OPT_LARGE_THRESHOLD},
    {nullptr, 0, nullptr, 0},
};

uint64_t parse_unsigned(const std::string& raw, const char *what) {
  if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) {
    throw std::invalid_argument(std::string("invalid ") + what + " '" + raw + "'");
  }
  errno = 0;
  char *end = nullptr;
  unsigned long long value = std::strtoull(raw.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0') {
    throw std::invalid_argument(std::string("invalid ") + what + " '" + raw + "'");
  }
  return value;
}

double parse_fraction(const std::string& raw) {
  char *end = nullptr;
  double value = std::strtod(raw.c_str(), &end);
  if (raw.empty() || *end != '\0') {
    throw std::invalid_argument("invalid dirty fraction '" + raw + "'");
  }
  return value;
}

Strategy parse_strategy(const std::string& raw_strategy) {
  if (raw_strategy == "full") {
    return Strategy::FullZero;
  } else if (raw_strategy == "discard") {
    return Strategy::DiscardAdvise;
  } else if (raw_strategy == "scan") {
    return Strategy::ScanAndZero;
  } else if (raw_strategy == "heuristic") {
    return Strategy::Heuristic;
  } else {
    throw std::invalid_argument("unknown '" + raw_strategy + "' strategy");
  }
}

}  // namespace

size_t parse_size(const std::string& raw_size) {
  if (raw_size.empty()) {
    throw std::invalid_argument("empty size");
  }
  uint64_t multiplier = 1;
  std::string digits = raw_size;
  switch (std::toupper(static_cast<unsigned char>(raw_size.back()))) {
    case 'K':
      multiplier = 1024;
      break;
    case 'M':
      multiplier = 1024 * 1024;
      break;
    case 'G':
      multiplier = 1024 * 1024 * 1024;
      break;
    default:
      break;
  }
  if (multiplier != 1) {
    digits.pop_back();
  }
  uint64_t value = parse_unsigned(digits, "size");
  if (value > std::numeric_limits<size_t>::max() / multiplier) {
    throw std::invalid_argument("size '" + raw_size + "' is too large");
  }
  return size_t(value * multiplier);
}

std::vector<Strategy> parse_strategies(const std::string& raw_strategies) {
  std::vector<Strategy> strategies;
  std::istringstream in{raw_strategies};
  std::string name;
  while (std::getline(in, name, ',')) {
    strategies.push_back(parse_strategy(name));
  }
  if (strategies.empty()) {
    throw std::invalid_argument("no strategies selected");
  }
  return strategies;
}

void validate(const Config& cfg) {
  if (cfg.total_size == 0) {
    throw std::invalid_argument("size must be positive");
  }
  if (!(cfg.dirty_fraction >= 0.0 && cfg.dirty_fraction <= 1.0)) {
    throw std::invalid_argument("dirty fraction must be between 0.0 and 1.0");
  }
  if (cfg.threads == 0) {
    throw std::invalid_argument("thread count must be positive");
  }
  if (cfg.processes == 0) {
    throw std::invalid_argument("process count must be positive");
  }
  if (cfg.iterations == 0) {
    throw std::invalid_argument("iteration count must be positive");
  }
  if (cfg.strategies.empty()) {
    throw std::invalid_argument("no strategies selected");
  }
  if (cfg.thresholds.small_max >= cfg.thresholds.large_min) {
    throw std::invalid_argument("small threshold must be below large threshold");
  }
  bool scanning = false;
  for (Strategy strategy : cfg.strategies) {
    scanning |= needs_scanner(strategy);
  }
  if (!scanning) {
    return;
  }
  if (!memory::is_page_aligned(cfg.total_size)) {
    throw std::invalid_argument("size must be a multiple of the page size (" +
                                std::to_string(memory::page_size()) + ") for scanning strategies");
  }
  if (cfg.scan_window > cfg.total_size) {
    throw std::invalid_argument("scan window is larger than the region");
  }
  if (!memory::is_page_aligned(cfg.scan_window)) {
    throw std::invalid_argument("scan window must be a multiple of the page size");
  }
}

Options parse_options(int argc, char *argv[]) {
  Options opts;
  /* Reinitialize getopt so that the parser can be used more than once.  */
  optind = 0;
  opterr = 0;
  int c;
  while ((c = getopt_long(argc, argv, "s:d:t:p:i:S:w:rHah", long_options, nullptr)) != -1) {
    switch (c) {
      case 's':
        opts.cfg.total_size = parse_size(optarg);
        break;
      case 'd':
        opts.cfg.dirty_fraction = parse_fraction(optarg);
        break;
      case 't':
        opts.cfg.threads = parse_unsigned(optarg, "thread count");
        break;
      case 'p':
        opts.cfg.processes = parse_unsigned(optarg, "process count");
        break;
      case 'i':
        opts.cfg.iterations = parse_unsigned(optarg, "iteration count");
        break;
      case 'S':
        opts.cfg.strategies = parse_strategies(optarg);
        break;
      case 'w':
        opts.cfg.scan_window = parse_size(optarg);
        break;
      case 'r':
        opts.cfg.force_resident = true;
        break;
      case 'H':
        opts.cfg.huge_pages = true;
        break;
      case 'a':
        opts.cfg.pin_threads = true;
        break;
      case 'h':
        opts.help = true;
        return opts;
      case OPT_JSON:
        opts.json = true;
        break;
      case OPT_NO_SUBSTITUTE:
        opts.cfg.substitute_discard = false;
        break;
      case OPT_SMALL_THRESHOLD:
        opts.cfg.thresholds.small_max = parse_size(optarg);
        break;
      case OPT_LARGE_THRESHOLD:
        opts.cfg.thresholds.large_min = parse_size(optarg);
        break;
      default:
        throw std::invalid_argument(std::string("unknown or incomplete option '") +
                                    argv[optind - 1] + "'");
    }
  }
  if (optind < argc) {
    throw std::invalid_argument(std::string("unexpected argument '") + argv[optind] + "'");
  }
  validate(opts.cfg);
  return opts;
}

void usage(const std::string& program) {
  std::cout << "usage: " << program << " [options]\n"
            << "  -s, --size SIZE             region size, e.g. 64K, 1M, 1G (default 1G)\n"
            << "  -d, --dirty-fraction F      fraction of each region to dirty, 0.0-1.0 (default 0.1)\n"
            << "  -t, --threads N             worker threads (default 1)\n"
            << "  -p, --processes N           parallel processes, recorded only (default 1)\n"
            << "  -i, --iterations N          iterations per thread (default 1)\n"
            << "  -S, --strategies LIST       any of full,discard,scan,heuristic (default all)\n"
            << "  -w, --scan-window SIZE      bytes per scan (default whole region)\n"
            << "  -r, --force-resident        fault in regions before dirtying them\n"
            << "  -H, --huge-pages            allow transparent huge pages\n"
            << "  -a, --pin                   bind worker threads to CPUs\n"
            << "      --no-substitute         never discard the rest of a fully dirty scan\n"
            << "      --small-threshold SIZE  heuristic memset ceiling (default 128K)\n"
            << "      --large-threshold SIZE  heuristic madvise floor (default 1M)\n"
            << "      --json                  print results as JSON\n"
            << "  -h, --help                  show this help" << std::endl;
}

}  // namespace zerobench
