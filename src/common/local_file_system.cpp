#include "dbase/common/local_file_system.hpp"

#include "dbase/logging/log_manager.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace dbase {

#define DBASE_LOG_FILE_SYSTEM(HANDLE, ...)                                                                             \
	{                                                                                                                  \
		auto logger_ptr = (HANDLE).GetLogger();                                                                        \
		if (logger_ptr) {                                                                                              \
			DBASE_LOG(*logger_ptr, FileSystemLogType, HANDLE, __VA_ARGS__);                                            \
		}                                                                                                              \
	}

struct UnixFileHandle : public FileHandle {
public:
	UnixFileHandle(FileSystem &file_system, string path, int fd, uint8_t flags, shared_ptr<LogManager> log_manager)
	    : FileHandle(file_system, std::move(path), flags, std::move(log_manager)), fd(fd), current_pos(0) {
	}
	~UnixFileHandle() override {
		UnixFileHandle::Close();
	}

	int fd;
	idx_t current_pos;

public:
	void Close() override {
		if (fd != -1) {
			close(fd);
			fd = -1;
			DBASE_LOG_FILE_SYSTEM(*this, "CLOSE");
		}
	};
};

unique_ptr<FileHandle> LocalFileSystem::OpenFile(const string &path, uint8_t flags,
                                                 shared_ptr<LogManager> log_manager) {
	if (!(flags & FileFlags::FILE_FLAGS_READ)) {
		throw InternalException("Files can only be opened for reading");
	}
	int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd == -1) {
		if ((flags & FileFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS) && errno == ENOENT) {
			return nullptr;
		}
		throw IOException("Cannot open file \"%s\": %s", path, strerror(errno));
	}
	struct stat st;
	if (fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
		close(fd);
		throw IOException("Cannot open file \"%s\": it is a directory", path);
	}
	auto handle = make_uniq<UnixFileHandle>(*this, path, fd, flags, std::move(log_manager));
	DBASE_LOG_FILE_SYSTEM(*handle, "OPEN");
	return std::move(handle);
}

int64_t LocalFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	auto &unix_handle = handle.Cast<UnixFileHandle>();
	int fd = unix_handle.fd;
	int64_t bytes_read;
	do {
		bytes_read = read(fd, buffer, static_cast<size_t>(nr_bytes));
	} while (bytes_read == -1 && errno == EINTR);
	if (bytes_read == -1) {
		throw IOException("Could not read from file \"%s\": %s", handle.path, strerror(errno));
	}

	DBASE_LOG_FILE_SYSTEM(handle, "READ", bytes_read, unix_handle.current_pos);
	unix_handle.current_pos += static_cast<idx_t>(bytes_read);

	return bytes_read;
}

int64_t LocalFileSystem::GetFileSize(FileHandle &handle) {
	int fd = handle.Cast<UnixFileHandle>().fd;
	struct stat s;
	if (fstat(fd, &s) == -1) {
		throw IOException("Failed to get file size for file \"%s\": %s", handle.path, strerror(errno));
	}
	return s.st_size;
}

bool LocalFileSystem::FileExists(const string &filename) {
	if (filename.empty()) {
		return false;
	}
	struct stat status;
	if (stat(filename.c_str(), &status) != 0) {
		return false;
	}
	return S_ISREG(status.st_mode);
}

} // namespace dbase
