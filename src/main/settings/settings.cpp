#include "dbase/main/settings.hpp"

#include "dbase/common/string_util.hpp"
#include "dbase/logging/log_manager.hpp"
#include "dbase/main/config.hpp"

#include <algorithm>

namespace dbase {

static bool ParseBooleanSetting(const char *name, const string &parameter) {
	bool result;
	if (!StringUtil::TryParseBoolean(parameter, result)) {
		throw InvalidConfigurationException("Option \"%s\" expects a BOOLEAN value, but got \"%s\"", name, parameter);
	}
	return result;
}

static string BooleanToString(bool value) {
	return value ? "true" : "false";
}

static unordered_set<string> ParseLogTypes(const string &parameter) {
	unordered_set<string> result;
	for (auto &entry : StringUtil::Split(parameter, ',')) {
		auto log_type = entry;
		StringUtil::Trim(log_type);
		if (!log_type.empty()) {
			result.insert(log_type);
		}
	}
	return result;
}

static string LogTypesToString(const unordered_set<string> &log_types) {
	vector<string> sorted(log_types.begin(), log_types.end());
	std::sort(sorted.begin(), sorted.end());
	return StringUtil::Join(sorted, ",");
}

//===----------------------------------------------------------------------===//
// Trim Character Fields
//===----------------------------------------------------------------------===//
void TrimCharacterFieldsSetting::Set(ReaderConfig &config, const string &parameter) {
	config.options.trim_character_fields = ParseBooleanSetting(Name, parameter);
}

void TrimCharacterFieldsSetting::Reset(ReaderConfig &config) {
	config.options.trim_character_fields = ReaderOptions().trim_character_fields;
}

string TrimCharacterFieldsSetting::GetSetting(const ReaderConfig &config) {
	return BooleanToString(config.options.trim_character_fields);
}

//===----------------------------------------------------------------------===//
// Strict Descriptor Table
//===----------------------------------------------------------------------===//
void StrictDescriptorTableSetting::Set(ReaderConfig &config, const string &parameter) {
	config.options.strict_descriptor_table = ParseBooleanSetting(Name, parameter);
}

void StrictDescriptorTableSetting::Reset(ReaderConfig &config) {
	config.options.strict_descriptor_table = ReaderOptions().strict_descriptor_table;
}

string StrictDescriptorTableSetting::GetSetting(const ReaderConfig &config) {
	return BooleanToString(config.options.strict_descriptor_table);
}

//===----------------------------------------------------------------------===//
// Verify Record Size
//===----------------------------------------------------------------------===//
void VerifyRecordSizeSetting::Set(ReaderConfig &config, const string &parameter) {
	config.options.verify_record_size = ParseBooleanSetting(Name, parameter);
}

void VerifyRecordSizeSetting::Reset(ReaderConfig &config) {
	config.options.verify_record_size = ReaderOptions().verify_record_size;
}

string VerifyRecordSizeSetting::GetSetting(const ReaderConfig &config) {
	return BooleanToString(config.options.verify_record_size);
}

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//
void EnableLogging::Set(ReaderConfig &config, const string &parameter) {
	config.GetLogManager().SetEnableLogging(ParseBooleanSetting(Name, parameter));
}

void EnableLogging::Reset(ReaderConfig &config) {
	config.GetLogManager().SetEnableLogging(false);
}

string EnableLogging::GetSetting(const ReaderConfig &config) {
	return BooleanToString(config.GetLogManager().GetConfig().enabled);
}

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//
void LoggingLevel::Set(ReaderConfig &config, const string &parameter) {
	config.GetLogManager().SetLogLevel(LogLevelUtil::FromString(parameter));
}

void LoggingLevel::Reset(ReaderConfig &config) {
	config.GetLogManager().SetLogLevel(LogConfig::DEFAULT_LOG_LEVEL);
}

string LoggingLevel::GetSetting(const ReaderConfig &config) {
	return LogLevelUtil::ToString(config.GetLogManager().GetConfig().level);
}

//===----------------------------------------------------------------------===//
// Logging Storage
//===----------------------------------------------------------------------===//
void LoggingStorage::Set(ReaderConfig &config, const string &parameter) {
	auto storage_name = parameter;
	StringUtil::Trim(storage_name);
	config.GetLogManager().SetLogStorage(storage_name);
}

void LoggingStorage::Reset(ReaderConfig &config) {
	config.GetLogManager().SetLogStorage(LogConfig::DEFAULT_LOG_STORAGE);
}

string LoggingStorage::GetSetting(const ReaderConfig &config) {
	return config.GetLogManager().GetConfig().storage;
}

//===----------------------------------------------------------------------===//
// Enabled Log Types
//===----------------------------------------------------------------------===//
void EnabledLogTypes::Set(ReaderConfig &config, const string &parameter) {
	auto &log_manager = config.GetLogManager();
	auto log_types = ParseLogTypes(parameter);
	log_manager.SetEnabledLogTypes(log_types);
	log_manager.SetLogMode(log_types.empty() ? LogMode::LEVEL_ONLY : LogMode::ENABLE_SELECTED);
}

void EnabledLogTypes::Reset(ReaderConfig &config) {
	auto &log_manager = config.GetLogManager();
	unordered_set<string> empty;
	log_manager.SetEnabledLogTypes(empty);
	log_manager.SetLogMode(LogMode::LEVEL_ONLY);
}

string EnabledLogTypes::GetSetting(const ReaderConfig &config) {
	return LogTypesToString(config.GetLogManager().GetConfig().enabled_log_types);
}

//===----------------------------------------------------------------------===//
// Disabled Log Types
//===----------------------------------------------------------------------===//
void DisabledLogTypes::Set(ReaderConfig &config, const string &parameter) {
	auto &log_manager = config.GetLogManager();
	auto log_types = ParseLogTypes(parameter);
	log_manager.SetDisabledLogTypes(log_types);
	log_manager.SetLogMode(log_types.empty() ? LogMode::LEVEL_ONLY : LogMode::DISABLE_SELECTED);
}

void DisabledLogTypes::Reset(ReaderConfig &config) {
	auto &log_manager = config.GetLogManager();
	unordered_set<string> empty;
	log_manager.SetDisabledLogTypes(empty);
	log_manager.SetLogMode(LogMode::LEVEL_ONLY);
}

string DisabledLogTypes::GetSetting(const ReaderConfig &config) {
	return LogTypesToString(config.GetLogManager().GetConfig().disabled_log_types);
}

} // namespace dbase
