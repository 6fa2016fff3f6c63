#include "dbase/logging/log_storage.hpp"

#include "dbase/common/printer.hpp"
#include "dbase/common/string_util.hpp"

namespace dbase {

void LogStorage::Truncate() {
	throw NotImplementedException("Truncate is not implemented for this log storage");
}

StdOutLogStorage::StdOutLogStorage() {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
                                     const string &log_message) {
	auto line = StringUtil::Format("%s\t%s\t%s\t%s", Timestamp::ToString(timestamp), LogLevelUtil::ToString(level),
	                               log_type, log_message);
	Printer::Print(OutputStream::STREAM_STDOUT, line);
}

void StdOutLogStorage::Flush() {
	Printer::Flush(OutputStream::STREAM_STDOUT);
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
                                       const string &log_message) {
	unique_lock<mutex> lck(lock);
	entries.emplace_back(timestamp.value, log_type, level, log_message);
}

void InMemoryLogStorage::Flush() {
	// NOP
}

void InMemoryLogStorage::Truncate() {
	unique_lock<mutex> lck(lock);
	entries.clear();
}

vector<LogEntry> InMemoryLogStorage::GetEntries() {
	unique_lock<mutex> lck(lock);
	return entries;
}

} // namespace dbase
