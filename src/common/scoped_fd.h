// RAII wrapper for file descriptors (source files, destination files).
// Ensures fd is closed on scope exit; prevents leaks on early return or exception.
#ifndef BRAID_SRC_COMMON_SCOPED_FD_H_
#define BRAID_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Braid {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	// Closes the descriptor now. Returns the result of close(2), 0 if nothing was open.
	int reset() {
		int rc = 0;
		if (fd >= 0) {
			rc = ::close(fd);
			fd = -1;
		}
		return rc;
	}
};

}  // namespace Braid

#endif  // BRAID_SRC_COMMON_SCOPED_FD_H_
