// RAII wrapper for file descriptors (queue log, partition files).
// Closes on scope exit so early returns and exceptions do not leak.
#ifndef PAGESTREAM_SRC_COMMON_SCOPED_FD_H_
#define PAGESTREAM_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace Pagestream {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			if (fd >= 0) ::close(fd);
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	// Release ownership; caller must close.
	int release() {
		int f = fd;
		fd = -1;
		return f;
	}

	// Close now and report the error close(2) returned, which for NFS and
	// some local filesystems is the first sign of a failed write-back.
	void CloseOrThrow(const std::string& what) {
		if (fd < 0) return;
		int f = release();
		if (::close(f) != 0) {
			throw std::system_error(errno, std::generic_category(), "close failed for " + what);
		}
	}
};

// Opens |path| with |flags|, throwing std::system_error on failure.
inline ScopedFd OpenOrThrow(const std::string& path, int flags, mode_t mode = 0644) {
	int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
	if (fd < 0) {
		throw std::system_error(errno, std::generic_category(), "open failed for " + path);
	}
	return ScopedFd(fd);
}

// Writes all of |size| bytes, retrying on short writes and EINTR.
inline void WriteAllOrThrow(int fd, const char* data, size_t size, const std::string& what) {
	while (size > 0) {
		ssize_t n = ::write(fd, data, size);
		if (n < 0) {
			if (errno == EINTR) continue;
			throw std::system_error(errno, std::generic_category(), "write failed for " + what);
		}
		data += n;
		size -= static_cast<size_t>(n);
	}
}

inline void FsyncOrThrow(int fd, const std::string& what) {
	if (::fsync(fd) != 0) {
		throw std::system_error(errno, std::generic_category(), "fsync failed for " + what);
	}
}

} // namespace Pagestream

#endif  // PAGESTREAM_SRC_COMMON_SCOPED_FD_H_
