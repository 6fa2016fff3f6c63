//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/main/settings.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"

namespace dbase {

class ReaderConfig;

//===----------------------------------------------------------------------===//
// Reader options
//===----------------------------------------------------------------------===//

struct TrimCharacterFieldsSetting {
	static constexpr const char *Name = "trim_character_fields";
	static constexpr const char *Description = "Remove trailing blanks from CHARACTER fields";
	static constexpr const char *InputType = "BOOLEAN";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

struct StrictDescriptorTableSetting {
	static constexpr const char *Name = "strict_descriptor_table";
	static constexpr const char *Description =
	    "Reject files whose header size does not describe a whole number of field descriptors";
	static constexpr const char *InputType = "BOOLEAN";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

struct VerifyRecordSizeSetting {
	static constexpr const char *Name = "verify_record_size";
	static constexpr const char *Description =
	    "Verify that the field lengths plus the deletion flag add up to the declared record size";
	static constexpr const char *InputType = "BOOLEAN";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

//===----------------------------------------------------------------------===//
// Logging
//===----------------------------------------------------------------------===//

struct EnableLogging {
	static constexpr const char *Name = "enable_logging";
	static constexpr const char *Description = "Enables the logger";
	static constexpr const char *InputType = "BOOLEAN";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

struct LoggingLevel {
	static constexpr const char *Name = "logging_level";
	static constexpr const char *Description = "The log level which will be recorded in the log";
	static constexpr const char *InputType = "VARCHAR";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

struct LoggingStorage {
	static constexpr const char *Name = "logging_storage";
	static constexpr const char *Description = "Set the logging storage (memory/stdout)";
	static constexpr const char *InputType = "VARCHAR";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

struct EnabledLogTypes {
	static constexpr const char *Name = "enabled_log_types";
	static constexpr const char *Description =
	    "Sets the list of enabled loggers; an empty list logs every type at or above the log level";
	static constexpr const char *InputType = "VARCHAR";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

struct DisabledLogTypes {
	static constexpr const char *Name = "disabled_log_types";
	static constexpr const char *Description = "Sets the list of disabled loggers";
	static constexpr const char *InputType = "VARCHAR";
	static void Set(ReaderConfig &config, const string &parameter);
	static void Reset(ReaderConfig &config);
	static string GetSetting(const ReaderConfig &config);
};

} // namespace dbase
