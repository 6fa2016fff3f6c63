//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/string_util.hpp"
#include "dbase/logging/log_type.hpp"
#include "dbase/logging/logging.hpp"

#include <atomic>

namespace dbase {

class LogManager;

// Main logging interface
class Logger {
public:
	explicit Logger(LogManager &manager) : manager(manager) {
	}

	virtual ~Logger() = default;

	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	void WriteLog(const char *log_type, LogLevel log_level, const string &message);

	virtual void Flush() = 0;

	virtual bool IsThreadSafe() = 0;
	virtual bool IsMutable() {
		return false;
	};
	virtual void UpdateConfig(LogConfig &new_config) {
		throw InternalException("Cannot update the config of this logger!");
	}
	virtual const LogConfig &GetConfig() const = 0;

protected:
	LogManager &manager;
};

// Logger that can be reconfigured while in use, all settings are guarded by a lock
class MutableLogger : public Logger {
public:
	MutableLogger(LogConfig &config_p, LogManager &manager);

	// Main Logger API
	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;

	void Flush() override;
	bool IsThreadSafe() override {
		return true;
	}
	bool IsMutable() override {
		return true;
	}
	const LogConfig &GetConfig() const override {
		return config;
	}

	void UpdateConfig(LogConfig &new_config) override;

protected:
	// Atomics for lock-free log setting checks
	std::atomic<bool> enabled;
	std::atomic<LogMode> mode;
	std::atomic<LogLevel> level;

	mutex lock;
	LogConfig config;
};

// For when logging is disabled: NOPs everything
class NopLogger : public Logger {
public:
	explicit NopLogger(LogManager &manager) : Logger(manager) {
	}
	bool ShouldLog(const char *log_type, LogLevel log_level) override {
		return false;
	}
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override {};
	void Flush() override {
	}
	bool IsThreadSafe() override {
		return true;
	}
	const LogConfig &GetConfig() const override {
		return config;
	}

protected:
	LogConfig config;
};

} // namespace dbase

//===--------------------------------------------------------------------===//
// Logging macros
//===--------------------------------------------------------------------===//

// Main logging macro: the message is only constructed when the logger will write it
#define DBASE_LOG_INTERNAL(LOGGER, TYPE, LEVEL, ...)                                                                   \
	{                                                                                                                  \
		auto &logger_ref = (LOGGER);                                                                                   \
		if (logger_ref.ShouldLog(TYPE, LEVEL)) {                                                                       \
			logger_ref.WriteLog(TYPE, LEVEL, __VA_ARGS__);                                                             \
		}                                                                                                              \
	}

// Log a structured log type
#define DBASE_LOG(LOGGER, LOG_TYPE_CLASS, ...)                                                                         \
	DBASE_LOG_INTERNAL(LOGGER, LOG_TYPE_CLASS::NAME, LOG_TYPE_CLASS::LEVEL,                                            \
	                   LOG_TYPE_CLASS::ConstructLogMessage(__VA_ARGS__))

// Default log type with a printf-style message
#define DBASE_LOG_TRACE(LOGGER, ...)                                                                                   \
	DBASE_LOG_INTERNAL(LOGGER, ::dbase::DefaultLogType::NAME, ::dbase::LogLevel::LOG_TRACE,                            \
	                   ::dbase::StringUtil::Format(__VA_ARGS__))
#define DBASE_LOG_DEBUG(LOGGER, ...)                                                                                   \
	DBASE_LOG_INTERNAL(LOGGER, ::dbase::DefaultLogType::NAME, ::dbase::LogLevel::LOG_DEBUG,                            \
	                   ::dbase::StringUtil::Format(__VA_ARGS__))
#define DBASE_LOG_INFO(LOGGER, ...)                                                                                    \
	DBASE_LOG_INTERNAL(LOGGER, ::dbase::DefaultLogType::NAME, ::dbase::LogLevel::LOG_INFO,                             \
	                   ::dbase::StringUtil::Format(__VA_ARGS__))
#define DBASE_LOG_WARN(LOGGER, ...)                                                                                    \
	DBASE_LOG_INTERNAL(LOGGER, ::dbase::DefaultLogType::NAME, ::dbase::LogLevel::LOG_WARN,                             \
	                   ::dbase::StringUtil::Format(__VA_ARGS__))
#define DBASE_LOG_ERROR(LOGGER, ...)                                                                                   \
	DBASE_LOG_INTERNAL(LOGGER, ::dbase::DefaultLogType::NAME, ::dbase::LogLevel::LOG_ERROR,                            \
	                   ::dbase::StringUtil::Format(__VA_ARGS__))
#define DBASE_LOG_FATAL(LOGGER, ...)                                                                                   \
	DBASE_LOG_INTERNAL(LOGGER, ::dbase::DefaultLogType::NAME, ::dbase::LogLevel::LOG_FATAL,                            \
	                   ::dbase::StringUtil::Format(__VA_ARGS__))
