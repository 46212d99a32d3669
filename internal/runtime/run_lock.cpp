#include "internal/runtime/run_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace strata::runtime {

ScopedRunLock::ScopedRunLock(const std::filesystem::path& directory, const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos) {
    throw std::invalid_argument("invalid run lock name: '" + name + "'");
  }

  path_ = directory / (name + ".lock");

  fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw std::runtime_error("failed to open lock file " + path_.string() + ": " + std::strerror(errno));
  }

  if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;

    if (err == EWOULDBLOCK) {
      throw util::LockConflict("migrations are already running (lock held on " + path_.string() + ")");
    }
    throw std::runtime_error("failed to lock " + path_.string() + ": " + std::strerror(err));
  }
}

ScopedRunLock::~ScopedRunLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace strata::runtime
