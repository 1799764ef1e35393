/* Dirty page reclamation benchmark.

   Maps anonymous regions, dirties a prefix of each and measures how long it
   takes to get them back to a clean state with memset(), with
   madvise(MADV_DONTNEED), with a PAGEMAP_SCAN guided memset() of only the
   written pages, and with a size-based mix of the three.  */

#include "benchmark.h"
#include "options.hh"
#include "pagemap.hh"
#include "report.hh"

#include <libgen.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char *argv[]) {
  using namespace zerobench;

  std::string program = ::basename(argv[0]);
  Options opts;
  try {
    opts = parse_options(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << std::endl;
    usage(program);
    return 1;
  }
  if (opts.help) {
    usage(program);
    return 0;
  }
  const auto& strategies = opts.cfg.strategies;
  if (std::any_of(strategies.begin(), strategies.end(), needs_scanner) && !pagemap::supported()) {
    std::cerr << "warning: PAGEMAP_SCAN is not supported by this kernel, "
                 "scanning strategies fall back to madvise(MADV_DONTNEED)"
              << std::endl;
  }
  if (!opts.json) {
    print_banner(opts.cfg, std::cout);
  }
  try {
    BenchmarkHarness harness{opts.cfg};
    RunResults run = harness.run();
    for (const auto& failure : run.failures) {
      std::cerr << "warning: " << to_string(failure.strategy) << ": " << failure.message << std::endl;
    }
    if (opts.json) {
      report_json(run.results, std::cout);
    } else {
      report_text(run.results, std::cout);
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
