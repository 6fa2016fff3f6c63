#include "dbase/logging/log_type.hpp"

#include "dbase/common/file_system.hpp"
#include "dbase/common/string_util.hpp"
#include "dbase/dbf/dbf_header.hpp"

namespace dbase {

constexpr const char *DefaultLogType::NAME;
constexpr LogLevel DefaultLogType::LEVEL;
constexpr const char *FileSystemLogType::NAME;
constexpr LogLevel FileSystemLogType::LEVEL;
constexpr const char *DBFReaderLogType::NAME;
constexpr LogLevel DBFReaderLogType::LEVEL;

//===--------------------------------------------------------------------===//
// FileSystemLogType
//===--------------------------------------------------------------------===//
FileSystemLogType::FileSystemLogType() : LogType(NAME, LEVEL) {
}

// FIXME: Manual JSON strings are not winning any style points
string FileSystemLogType::ConstructLogMessage(const FileHandle &handle, const string &op, int64_t bytes, idx_t pos) {
	return StringUtil::Format("{\"fs\":\"%s\",\"path\":\"%s\",\"op\":\"%s\",\"bytes\":\"%lld\",\"pos\":\"%llu\"}",
	                          handle.file_system.GetName(), handle.path, op, bytes, pos);
}
string FileSystemLogType::ConstructLogMessage(const FileHandle &handle, const string &op) {
	return StringUtil::Format("{\"fs\":\"%s\",\"path\":\"%s\",\"op\":\"%s\"}", handle.file_system.GetName(),
	                          handle.path, op);
}

//===--------------------------------------------------------------------===//
// DBFReaderLogType
//===--------------------------------------------------------------------===//
DBFReaderLogType::DBFReaderLogType() : LogType(NAME, LEVEL) {
}

string DBFReaderLogType::ConstructLogMessage(const DBFHeader &header) {
	return StringUtil::Format("{\"event\":\"header\",\"version\":\"%s\",\"records\":\"%llu\",\"header_size\":\"%llu\","
	                          "\"record_size\":\"%llu\"}",
	                          DBFHeader::VersionToString(header.version), header.record_count,
	                          header.offset_to_first_record, header.record_size);
}

string DBFReaderLogType::ConstructLogMessage(const string &event, idx_t records_read, idx_t record_count) {
	return StringUtil::Format("{\"event\":\"%s\",\"records_read\":\"%llu\",\"record_count\":\"%llu\"}", event,
	                          records_read, record_count);
}

} // namespace dbase
