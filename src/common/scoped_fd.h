// RAII wrapper for file descriptors (listening and client sockets, epoll fd).
#ifndef CHOPSTICKS_SRC_COMMON_SCOPED_FD_H_
#define CHOPSTICKS_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Chopsticks {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void Reset(int f = -1) {
		if (fd >= 0) ::close(fd);
		fd = f;
	}
};

} // namespace Chopsticks

#endif  // CHOPSTICKS_SRC_COMMON_SCOPED_FD_H_
