#pragma once

#include "benchmark.h"

#include <cstddef>
#include <string>
#include <vector>

namespace zerobench {

struct Options {
  Config cfg;
  /// Print the results as JSON instead of text.
  bool json = false;
  bool help = false;
};

/// Parses a size such as "4096", "64K", "512M" or "1G" (binary units).
size_t parse_size(const std::string& raw_size);

/// Parses a comma-separated list of "full", "discard", "scan" and "heuristic".
std::vector<Strategy> parse_strategies(const std::string& raw_strategies);

/// Parses the command line. Throws std::invalid_argument on malformed or
/// invalid options; the returned configuration has passed validate().
Options parse_options(int argc, char *argv[]);

/// Checks a configuration before any region is mapped. Throws
/// std::invalid_argument.
void validate(const Config& cfg);

void usage(const std::string& program);

}  // namespace zerobench
