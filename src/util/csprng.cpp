#include "util/csprng.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif

#include "util/log.hpp"

namespace wrapfwd::util {

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  if (out.empty()) {
    return true;
  }
  std::size_t filled = 0;
#if defined(__linux__)
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  if (filled == out.size()) {
    return true;
  }
#endif

  const int fd = ::open("/dev/urandom", O_RDONLY);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(fd);
      if (error) {
        *error = std::string("read(/dev/urandom) failed: ") + std::strerror(errno);
      }
      return false;
    }
    if (n == 0) {
      ::close(fd);
      if (error) {
        *error = "read(/dev/urandom) returned EOF";
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

void FillSecureRandomBytesOrAbort(std::span<std::uint8_t> out) {
  std::string err;
  if (!FillSecureRandomBytes(out, &err)) {
    LogError("csprng", "secure randomness unavailable: " + err);
    std::abort();
  }
}

}  // namespace wrapfwd::util
