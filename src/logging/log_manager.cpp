#include "dbase/logging/log_manager.hpp"

#include "dbase/common/string_util.hpp"

namespace dbase {

LogManager::LogManager(LogConfig config_p) : config(std::move(config_p)) {
	auto storage_name = config.storage;
	// force the storage to be created
	config.storage = "";
	SetLogStorageInternal(storage_name);
	global_logger = make_uniq<MutableLogger>(config, *this);
}

LogManager::~LogManager() {
}

unique_ptr<Logger> LogManager::CreateLogger(bool mutable_settings) {
	unique_lock<mutex> lck(lock);
	if (mutable_settings || config.enabled) {
		return make_uniq<MutableLogger>(config, *this);
	}
	return make_uniq<NopLogger>(*this);
}

bool LogManager::RegisterLogStorage(const string &name, shared_ptr<LogStorage> &storage) {
	unique_lock<mutex> lck(lock);
	auto lname = StringUtil::Lower(name);
	if (registered_log_storages.find(lname) != registered_log_storages.end()) {
		return false;
	}
	registered_log_storages.insert(std::make_pair(lname, storage));
	return true;
}

Logger &LogManager::GlobalLogger() {
	return *global_logger;
}

void LogManager::Flush() {
	unique_lock<mutex> lck(lock);
	log_storage->Flush();
}

shared_ptr<LogStorage> LogManager::GetLogStorage() {
	unique_lock<mutex> lck(lock);
	return log_storage;
}

void LogManager::WriteLogEntry(timestamp_t timestamp, const char *log_type, LogLevel log_level,
                               const char *log_message) {
	unique_lock<mutex> lck(lock);
	log_storage->WriteLogEntry(timestamp, log_level, log_type, log_message);
}

void LogManager::SetEnableLogging(bool enable) {
	unique_lock<mutex> lck(lock);
	config.enabled = enable;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogMode(LogMode mode) {
	unique_lock<mutex> lck(lock);
	config.mode = mode;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogLevel(LogLevel level) {
	unique_lock<mutex> lck(lock);
	config.level = level;
	global_logger->UpdateConfig(config);
}

void LogManager::SetEnabledLogTypes(unordered_set<string> &enabled_log_types) {
	unique_lock<mutex> lck(lock);
	config.enabled_log_types = enabled_log_types;
	global_logger->UpdateConfig(config);
}

void LogManager::SetDisabledLogTypes(unordered_set<string> &disabled_log_types) {
	unique_lock<mutex> lck(lock);
	config.disabled_log_types = disabled_log_types;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogStorage(const string &storage_name) {
	unique_lock<mutex> lck(lock);
	SetLogStorageInternal(storage_name);
	global_logger->UpdateConfig(config);
}

void LogManager::SetConfig(const LogConfig &new_config) {
	unique_lock<mutex> lck(lock);
	auto storage_name = new_config.storage;
	auto old_storage = config.storage;
	config = new_config;
	config.storage = old_storage;
	SetLogStorageInternal(storage_name);
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogStorageInternal(const string &storage_name) {
	auto storage_name_to_lower = StringUtil::Lower(storage_name);

	if (config.storage == storage_name_to_lower) {
		return;
	}

	// Flush the old storage, we are going to replace it.
	if (log_storage) {
		log_storage->Flush();
	}

	if (storage_name_to_lower == LogConfig::IN_MEMORY_STORAGE_NAME) {
		log_storage = make_shared_ptr<InMemoryLogStorage>();
	} else if (storage_name_to_lower == LogConfig::STDOUT_STORAGE_NAME) {
		log_storage = make_shared_ptr<StdOutLogStorage>();
	} else if (registered_log_storages.find(storage_name_to_lower) != registered_log_storages.end()) {
		log_storage = registered_log_storages[storage_name_to_lower];
	} else {
		throw InvalidConfigurationException("Log storage '%s' is not yet registered", storage_name);
	}
	config.storage = storage_name_to_lower;
}

void LogManager::TruncateLogStorage() {
	unique_lock<mutex> lck(lock);
	log_storage->Truncate();
}

LogConfig LogManager::GetConfig() {
	unique_lock<mutex> lck(lock);
	return config;
}

} // namespace dbase
