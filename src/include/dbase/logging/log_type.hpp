//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/logging/log_type.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/logging/logging.hpp"

namespace dbase {

struct FileHandle;
struct DBFHeader;

//! Log types provide some structure to the formats that the different log messages can have
//! For now, this holds a type that the VARCHAR message will be parsed into in the log reader
class LogType {
public:
	LogType(const string &name_p, const LogLevel &level_p) : name(name_p), level(level_p) {
	}

	string name;
	LogLevel level;
};

class DefaultLogType : public LogType {
public:
	static constexpr const char *NAME = "";
	static constexpr LogLevel LEVEL = LogLevel::LOG_INFO;
};

class FileSystemLogType : public LogType {
public:
	static constexpr const char *NAME = "FileSystem";
	static constexpr LogLevel LEVEL = LogLevel::LOG_TRACE;

	//! Construct the log type
	FileSystemLogType();

	static string ConstructLogMessage(const FileHandle &handle, const string &op, int64_t bytes, idx_t pos);
	static string ConstructLogMessage(const FileHandle &handle, const string &op);
};

class DBFReaderLogType : public LogType {
public:
	static constexpr const char *NAME = "DBFReader";
	static constexpr LogLevel LEVEL = LogLevel::LOG_DEBUG;

	//! Construct the log type
	DBFReaderLogType();

	//! Logged once the header has been decoded
	static string ConstructLogMessage(const DBFHeader &header);
	//! Logged for reader lifecycle events (table built, finished, failed)
	static string ConstructLogMessage(const string &event, idx_t records_read, idx_t record_count);
};

} // namespace dbase
