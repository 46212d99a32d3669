#pragma once

#include <filesystem>
#include <string>

namespace strata::runtime {

/*
  ScopedRunLock

  Host-local advisory lock (flock on <directory>/<name>.lock) held for the
  lifetime of the object. Acquisition never blocks: a lock already held by
  another process (or another open of the same file in this process) throws
  util::LockConflict. Released by the destructor on every exit path.

  No cross-host guarantee; coordinating runs across machines is left to the
  orchestrator.
*/
class ScopedRunLock {
 public:
  // Throws std::invalid_argument for an empty name or one containing '/',
  // std::runtime_error if the lock file can't be opened.
  ScopedRunLock(const std::filesystem::path& directory, const std::string& name);
  ~ScopedRunLock();

  ScopedRunLock(const ScopedRunLock&)            = delete;
  ScopedRunLock& operator=(const ScopedRunLock&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  int                   fd_ = -1;
};

} // namespace strata::runtime
