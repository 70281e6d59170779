#include "ewsc/utils.hpp"

#include <fcntl.h>
#include <sys/random.h>
#include <unistd.h>

#include <cerrno>

namespace ewsc {

bool random_bytes(uint8_t* out, size_t len) {
  size_t filled = 0;
  while (filled < len) {
    ssize_t n = ::getrandom(out + filled, len - filled, 0);
    if (n > 0) {
      filled += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  if (filled == len) return true;

  // getrandom() unavailable (old kernel, seccomp): fall back to the device.
  int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) return false;
  while (filled < len) {
    ssize_t n = ::read(fd, out + filled, len - filled);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      ::close(fd);
      return false;
    }
    filled += static_cast<size_t>(n);
  }
  ::close(fd);
  return true;
}

}  // namespace ewsc
