//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/types/timestamp.hpp"
#include "dbase/logging/logging.hpp"

namespace dbase {

//! Interface for writing log entries
class LogStorage {
public:
	LogStorage() {
	}
	virtual ~LogStorage() = default;

	//! WRITING
	virtual void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                           const string &log_message) = 0;
	virtual void Flush() = 0;

	//! Erase the contents of the LogStorage
	virtual void Truncate();

	virtual const string GetStorageName() = 0;
};

//! Writes every log entry as a tab separated line to stdout
class StdOutLogStorage : public LogStorage {
public:
	StdOutLogStorage();
	~StdOutLogStorage() override;

	//! LogStorage API: WRITING
	void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                   const string &log_message) override;
	void Flush() override;

	const string GetStorageName() override {
		return "StdOutLogStorage";
	}
};

//! Keeps every log entry in memory
class InMemoryLogStorage : public LogStorage {
public:
	InMemoryLogStorage();
	~InMemoryLogStorage() override;

	//! LogStorage API: WRITING
	void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                   const string &log_message) override;
	void Flush() override;
	void Truncate() override;

	const string GetStorageName() override {
		return "InMemoryLogStorage";
	}

	//! Returns a copy of the entries written so far
	vector<LogEntry> GetEntries();

protected:
	mutex lock;
	vector<LogEntry> entries;
};

} // namespace dbase
