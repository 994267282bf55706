// RAII owner of a file descriptor opened on the data file.
// Early returns and exceptions cannot leak it.
#ifndef RENDEZVOUS_SRC_COMMON_SCOPED_FD_H_
#define RENDEZVOUS_SRC_COMMON_SCOPED_FD_H_

#include <cerrno>
#include <unistd.h>

namespace Rendezvous {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}
	~ScopedFd() { Close(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& other) noexcept : fd_(other.Release()) {}
	ScopedFd& operator=(ScopedFd&& other) noexcept {
		if (this != &other) {
			Close();
			fd_ = other.Release();
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	// Gives up ownership without closing
	int Release() {
		int fd = fd_;
		fd_ = -1;
		return fd;
	}

	// Written data can still fail to reach the file at close time.
	// Returns 0 or the errno of close().
	int Close() {
		if (fd_ < 0) return 0;
		int rc = ::close(Release());
		return rc == 0 ? 0 : errno;
	}

private:
	int fd_ = -1;
};

}  // namespace Rendezvous

#endif  // RENDEZVOUS_SRC_COMMON_SCOPED_FD_H_
