#pragma once

#include <cstddef>
#include <errno.h>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace io {

// Writes the whole iovec batch, retrying on EINTR/EAGAIN. Returns false on
// any other error.
inline bool WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::yield();
        continue;
      }
      return false;
    }
    ssize_t consumed = n;
    while (consumed > 0 && cnt > 0) {
      if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
        consumed -= static_cast<ssize_t>(iov[0].iov_len);
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= static_cast<size_t>(consumed);
        consumed = 0;
      }
    }
    // skip empty entries left at the front
    while (cnt > 0 && iov[0].iov_len == 0) {
      ++iov;
      --cnt;
    }
  }
  return true;
}

} // namespace io
