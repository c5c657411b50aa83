#include "lb/network/Buffer.h"

#include <errno.h>
#include <unistd.h>

namespace lb {
namespace network {

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    EnsureWritableBytes(kMinReadSpace);
    const ssize_t n = ::read(fd, BeginWrite(), WritableBytes());
    if (n < 0) {
        *savedErrno = errno;
    } else {
        HasWritten(static_cast<size_t>(n));
    }
    return n;
}

} // namespace network
} // namespace lb
