//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/file_system.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/common/exception.hpp"

namespace dbase {

class FileSystem;
class LogManager;
class Logger;

struct FileFlags {
	//! Open file with read access
	static constexpr uint8_t FILE_FLAGS_READ = uint8_t(1 << 0);
	//! Return a null handle instead of throwing when the file does not exist
	static constexpr uint8_t FILE_FLAGS_NULL_IF_NOT_EXISTS = uint8_t(1 << 1);
};

struct FileHandle {
public:
	FileHandle(FileSystem &file_system, string path, uint8_t flags, shared_ptr<LogManager> log_manager);
	FileHandle(const FileHandle &) = delete;
	virtual ~FileHandle();

	// Read at most nr_bytes bytes into the buffer; returns the number of bytes read (0 at the end of the file)
	int64_t Read(void *buffer, idx_t nr_bytes);
	idx_t GetFileSize();
	//! Closes the file handle
	virtual void Close() = 0;

	string GetPath() const {
		return path;
	}

	//! The logger file system operations on this handle are reported to, if any
	Logger *GetLogger() const;

	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}
	template <class TARGET>
	const TARGET &Cast() const {
		return reinterpret_cast<const TARGET &>(*this);
	}

public:
	FileSystem &file_system;
	string path;
	uint8_t flags;
	shared_ptr<LogManager> log_manager;
};

class FileSystem {
public:
	virtual ~FileSystem();

public:
	//! Opens a file; logs file system operations to the given log manager (if any)
	virtual unique_ptr<FileHandle> OpenFile(const string &path, uint8_t flags,
	                                        shared_ptr<LogManager> log_manager = nullptr) = 0;
	//! Read at most nr_bytes bytes from the current position of the handle
	virtual int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes) = 0;
	//! Returns the file size of a file handle, returns -1 on error
	virtual int64_t GetFileSize(FileHandle &handle) = 0;
	//! Check if a file exists
	virtual bool FileExists(const string &filename) = 0;
	//! Returns the name of the file system
	virtual string GetName() const = 0;

	//! Create a LocalFileSystem.
	static unique_ptr<FileSystem> CreateLocal();
	//! Extract the base name of a file (e.g. if the input is lib/example.dbf the base name is 'example')
	static string ExtractBaseName(const string &path);
	//! Extract the name of a file (e.g if the input is lib/example.dbf the name is 'example.dbf')
	static string ExtractName(const string &path);
};

} // namespace dbase
