#include "benchmark.h"

#include "error.hh"
#include "memory.hh"
#include "pagemap.hh"

#include <hwloc.h>

#include <algorithm>
#include <cerrno>
#include <exception>
#include <system_error>

namespace zerobench {

/// Loaded hwloc topology used to pin workers to processing units.
class Topology {
  hwloc_topology_t _topology;
  unsigned _nr_pus = 0;

 public:
  Topology() {
    if (hwloc_topology_init(&_topology) < 0) {
      throw std::system_error(errno, std::system_category(), "hwloc_topology_init");
    }
    if (hwloc_topology_load(_topology) < 0) {
      int err = errno;
      hwloc_topology_destroy(_topology);
      throw std::system_error(err, std::system_category(), "hwloc_topology_load");
    }
    int nr_pus = hwloc_get_nbobjs_by_type(_topology, HWLOC_OBJ_PU);
    _nr_pus = nr_pus > 0 ? unsigned(nr_pus) : 0;
  }

  ~Topology() { hwloc_topology_destroy(_topology); }

  Topology(const Topology&) = delete;
  Topology& operator=(const Topology&) = delete;

  /// Binds the calling thread to PU @tid modulo the number of PUs.
  void bind_thread(size_t tid) const {
    if (_nr_pus == 0) {
      throw std::system_error(ENODEV, std::system_category(), "hwloc: no processing units");
    }
    hwloc_obj_t pu = hwloc_get_obj_by_type(_topology, HWLOC_OBJ_PU, unsigned(tid % _nr_pus));
    if (!pu || hwloc_set_cpubind(_topology, pu->cpuset, HWLOC_CPUBIND_THREAD) < 0) {
      throw std::system_error(errno, std::system_category(), "hwloc_set_cpubind");
    }
  }
};

BenchmarkHarness::BenchmarkHarness(const Config& cfg) : _cfg{cfg} {
  if (cfg.substitute_discard) {
    _policy = std::make_unique<DiscardWhenSaturated>();
  } else {
    _policy = std::make_unique<NeverDiscard>();
  }
}

BenchmarkHarness::~BenchmarkHarness() = default;

RunResults BenchmarkHarness::run() {
  std::unique_ptr<Topology> topology;
  if (_cfg.pin_threads) {
    topology = std::make_unique<Topology>();
  }
  /* Check for PAGEMAP_SCAN now so that the first scan is not charged for
     it.  */
  if (std::any_of(_cfg.strategies.begin(), _cfg.strategies.end(), needs_scanner)) {
    pagemap::supported();
  }

  ResultCollector collector;
  std::vector<std::exception_ptr> errors(_cfg.threads);
  ThreadVector workers;
  workers.reserve(_cfg.threads);
  try {
    for (size_t tid = 0; tid < _cfg.threads; tid++) {
      workers.emplace_back([this, tid, &collector, &errors, &topology]() {
        try {
          worker(tid, collector, topology.get());
        } catch (...) {
          errors[tid] = std::current_exception();
        }
      });
    }
  } catch (...) {
    for (std::thread &t : workers) {
      t.join();
    }
    throw;
  }
  for (std::thread &t : workers) {
    t.join();
  }
  for (auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
  return collector.take();
}

void BenchmarkHarness::worker(size_t tid, ResultCollector& collector, const Topology *topology) {
  if (topology) {
    topology->bind_thread(tid);
  }
  StrategyExecutor executor{_cfg.effective_scan_window(), _cfg.thresholds, *_policy,
                            StrategyExecutor::Labels{_cfg.threads, _cfg.processes}};
  for (uint64_t iteration = 0; iteration < _cfg.iterations; iteration++) {
    for (Strategy strategy : _cfg.strategies) {
      auto region = memory::MappedRegion::create(_cfg.total_size, _cfg.dirty_fraction,
                                                 _cfg.force_resident, _cfg.huge_pages);
      region.dirty();
      try {
        collector.append(executor.run(strategy, region));
      } catch (const SyscallError& e) {
        collector.fail(Failure{strategy, e.what()});
      }
    }
  }
}

}  // namespace zerobench
