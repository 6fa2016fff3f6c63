//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/logging/logging.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"

namespace dbase {

//! Logging levels, can be used to filter logs
enum class LogLevel : uint8_t {
	LOG_TRACE = 10,
	LOG_DEBUG = 20,
	LOG_INFO = 30,
	LOG_WARN = 40,
	LOG_ERROR = 50,
	LOG_FATAL = 60
};

//! Logging mode
//! LEVEL_ONLY       = all logs are written, as long as their level is >= the configured level
//! DISABLE_SELECTED = all logs are written except the types in disabled_log_types
//! ENABLE_SELECTED  = only the types in enabled_log_types are written
enum class LogMode : uint8_t {
	LEVEL_ONLY = 0,
	DISABLE_SELECTED = 1,
	ENABLE_SELECTED = 2,
};

struct LogConfig {
	constexpr static const char *IN_MEMORY_STORAGE_NAME = "memory";
	constexpr static const char *STDOUT_STORAGE_NAME = "stdout";

	constexpr static LogLevel DEFAULT_LOG_LEVEL = LogLevel::LOG_INFO;
	constexpr static const char *DEFAULT_LOG_STORAGE = STDOUT_STORAGE_NAME;

	LogConfig();

	static LogConfig Create(bool enabled, LogLevel level);
	static LogConfig CreateFromEnabled(bool enabled, LogLevel level, unordered_set<string> &enabled_log_types);
	static LogConfig CreateFromDisabled(bool enabled, LogLevel level, unordered_set<string> &disabled_log_types);

	bool IsConsistent() const;

	bool enabled;
	LogMode mode;
	LogLevel level;
	string storage;

	unordered_set<string> enabled_log_types;
	unordered_set<string> disabled_log_types;

protected:
	LogConfig(bool enabled, LogLevel level, LogMode mode, const unordered_set<string> *enabled_log_types,
	          const unordered_set<string> *disabled_log_types);
};

struct LogEntry {
	LogEntry(int64_t timestamp_p, string log_type_p, LogLevel log_level_p, string message_p)
	    : timestamp(timestamp_p), log_type(std::move(log_type_p)), log_level(log_level_p),
	      message(std::move(message_p)) {
	}

	//! Microseconds since epoch
	int64_t timestamp;
	string log_type;
	LogLevel log_level;
	string message;
};

struct LogLevelUtil {
	static const char *ToString(LogLevel level);
	//! Parses TRACE/DEBUG/INFO/WARN/WARNING/ERROR/FATAL (case insensitive), throws on anything else
	static LogLevel FromString(const string &level);
};

} // namespace dbase
