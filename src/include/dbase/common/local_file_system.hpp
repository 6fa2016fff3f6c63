//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/local_file_system.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/file_system.hpp"

namespace dbase {

class LocalFileSystem : public FileSystem {
public:
	unique_ptr<FileHandle> OpenFile(const string &path, uint8_t flags,
	                                shared_ptr<LogManager> log_manager = nullptr) override;
	int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes) override;
	int64_t GetFileSize(FileHandle &handle) override;
	bool FileExists(const string &filename) override;

	string GetName() const override {
		return "LocalFileSystem";
	}
};

} // namespace dbase
