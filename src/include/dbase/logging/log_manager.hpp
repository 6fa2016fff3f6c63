//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/types/timestamp.hpp"
#include "dbase/logging/log_storage.hpp"
#include "dbase/logging/logger.hpp"

namespace dbase {

// The LogManager holds the global logger and the log storage that every logger writes into
class LogManager {
	friend class MutableLogger;

public:
	explicit LogManager(LogConfig config = LogConfig());
	~LogManager();

	// Main Logger API
	Logger &GlobalLogger();
	//! Create a new logger sharing this manager's storage; the caller owns it
	unique_ptr<Logger> CreateLogger(bool mutable_settings = false);

	//! Registers a custom log storage under the given name, so that it can be selected with SetLogStorage
	bool RegisterLogStorage(const string &name, shared_ptr<LogStorage> &storage);

	void Flush();

	shared_ptr<LogStorage> GetLogStorage();

	void SetEnableLogging(bool enable);
	void SetLogMode(LogMode mode);
	void SetLogLevel(LogLevel level);
	void SetEnabledLogTypes(unordered_set<string> &enabled_log_types);
	void SetDisabledLogTypes(unordered_set<string> &disabled_log_types);
	void SetLogStorage(const string &storage_name);
	//! Replace the complete configuration (including the storage)
	void SetConfig(const LogConfig &new_config);

	void TruncateLogStorage();

	LogConfig GetConfig();

protected:
	// This is to be called by the Loggers only, it does not verify log_level and log_type
	void WriteLogEntry(timestamp_t, const char *log_type, LogLevel log_level, const char *log_message);

	void SetLogStorageInternal(const string &storage_name);

	mutex lock;
	LogConfig config;

	unique_ptr<Logger> global_logger;

	shared_ptr<LogStorage> log_storage;

	// any additional log storages
	unordered_map<string, shared_ptr<LogStorage>> registered_log_storages;
};

} // namespace dbase
