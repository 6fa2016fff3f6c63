#include "dbase/common/serializer/buffered_file_reader.hpp"

#include "dbase/common/exception.hpp"

#include <cstring>

namespace dbase {

BufferedFileReader::BufferedFileReader(FileSystem &fs, const char *path, shared_ptr<LogManager> log_manager)
    : fs(fs), data(make_uniq_array<data_t>(FILE_BUFFER_SIZE)), offset(0), read_data(0), total_read(0) {
	handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ, std::move(log_manager));
	file_size = handle->GetFileSize();
}

BufferedFileReader::BufferedFileReader(FileSystem &fs, unique_ptr<FileHandle> handle_p)
    : fs(fs), data(make_uniq_array<data_t>(FILE_BUFFER_SIZE)), offset(0), read_data(0), handle(std::move(handle_p)),
      total_read(0) {
	if (!handle) {
		throw InternalException("BufferedFileReader requires an open file handle");
	}
	file_size = handle->GetFileSize();
}

void BufferedFileReader::ReadData(data_ptr_t target_buffer, idx_t read_size) {
	// first copy anything we can from the buffer
	data_ptr_t end_ptr = target_buffer + read_size;
	while (true) {
		idx_t to_read = MinValue<idx_t>(idx_t(end_ptr - target_buffer), read_data - offset);
		if (to_read > 0) {
			memcpy(target_buffer, data.get() + offset, to_read);
			offset += to_read;
			target_buffer += to_read;
		}
		if (target_buffer < end_ptr) {
			D_ASSERT(offset == read_data);
			total_read += read_data;
			// did not finish reading yet but exhausted buffer
			// read data into buffer
			offset = 0;
			read_data = idx_t(fs.Read(*handle, data.get(), FILE_BUFFER_SIZE));
			if (read_data == 0) {
				throw IOException("Unexpected end of file \"%s\" at offset %llu: %llu more bytes were requested",
				                  handle->path, total_read, idx_t(end_ptr - target_buffer));
			}
		} else {
			return;
		}
	}
}

bool BufferedFileReader::Finished() {
	return total_read + offset == file_size;
}

idx_t BufferedFileReader::CurrentOffset() {
	return total_read + offset;
}

} // namespace dbase
