#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace zerobench {

/// Mapping or unmapping failed. Fatal to the run.
struct MapError : std::system_error {
  MapError(int err, const std::string& what)
      : std::system_error{err, std::system_category(), what} {}
};

/// A scan window was not page aligned.
struct UnalignedRegion : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

/// The running kernel cannot answer PAGEMAP_SCAN. Callers degrade to
/// discarding instead of scanning.
struct UnsupportedCapability : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Any other failing system call. Aborts one strategy invocation only.
struct SyscallError : std::system_error {
  SyscallError(int err, const std::string& what)
      : std::system_error{err, std::system_category(), what} {}
};

}  // namespace zerobench
