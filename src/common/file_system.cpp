#include "dbase/common/file_system.hpp"

#include "dbase/common/local_file_system.hpp"
#include "dbase/logging/log_manager.hpp"

namespace dbase {

constexpr uint8_t FileFlags::FILE_FLAGS_READ;
constexpr uint8_t FileFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS;

FileHandle::FileHandle(FileSystem &file_system, string path_p, uint8_t flags, shared_ptr<LogManager> log_manager_p)
    : file_system(file_system), path(std::move(path_p)), flags(flags), log_manager(std::move(log_manager_p)) {
}

FileHandle::~FileHandle() {
}

int64_t FileHandle::Read(void *buffer, idx_t nr_bytes) {
	return file_system.Read(*this, buffer, static_cast<int64_t>(nr_bytes));
}

idx_t FileHandle::GetFileSize() {
	auto file_size = file_system.GetFileSize(*this);
	if (file_size < 0) {
		throw IOException("Could not determine the size of file \"%s\"", path);
	}
	return static_cast<idx_t>(file_size);
}

Logger *FileHandle::GetLogger() const {
	if (!log_manager) {
		return nullptr;
	}
	return &log_manager->GlobalLogger();
}

FileSystem::~FileSystem() {
}

unique_ptr<FileSystem> FileSystem::CreateLocal() {
	return make_uniq<LocalFileSystem>();
}

string FileSystem::ExtractName(const string &path) {
	if (path.empty()) {
		return string();
	}
	auto normalized_path = path;
	for (auto &c : normalized_path) {
		if (c == '\\') {
			c = '/';
		}
	}
	auto pos = normalized_path.find_last_of('/');
	if (pos == string::npos) {
		return normalized_path;
	}
	return normalized_path.substr(pos + 1);
}

string FileSystem::ExtractBaseName(const string &path) {
	auto name = ExtractName(path);
	auto pos = name.find_last_of('.');
	if (pos == string::npos || pos == 0) {
		return name;
	}
	return name.substr(0, pos);
}

} // namespace dbase
