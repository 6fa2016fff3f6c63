//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/serializer/buffered_file_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/file_system.hpp"
#include "dbase/common/serializer/read_stream.hpp"

namespace dbase {

#define FILE_BUFFER_SIZE 4096

class BufferedFileReader : public ReadStream {
public:
	BufferedFileReader(FileSystem &fs, const char *path, shared_ptr<LogManager> log_manager = nullptr);
	BufferedFileReader(FileSystem &fs, unique_ptr<FileHandle> handle);

	FileSystem &fs;
	unique_ptr<data_t[]> data;
	idx_t offset;
	idx_t read_data;
	unique_ptr<FileHandle> handle;

public:
	void ReadData(data_ptr_t buffer, idx_t read_size) override;
	//! Returns true if the reader has finished reading the entire file
	bool Finished();

	idx_t FileSize() {
		return file_size;
	}

	idx_t CurrentOffset();

private:
	idx_t file_size;
	idx_t total_read;
};

} // namespace dbase
