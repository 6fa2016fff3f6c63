//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/main/config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/logging/logging.hpp"

namespace dbase {

class LogManager;
class ReaderConfig;

typedef void (*set_option_function_t)(ReaderConfig &config, const string &parameter);
typedef void (*reset_option_function_t)(ReaderConfig &config);
typedef string (*get_setting_function_t)(const ReaderConfig &config);

struct ConfigurationOption {
	const char *name;
	const char *description;
	const char *parameter_type;
	set_option_function_t set;
	reset_option_function_t reset;
	get_setting_function_t get_setting;
};

//! The options that control how a .dbf file is decoded
struct ReaderOptions {
	//! Remove trailing blanks (and NUL bytes) from CHARACTER fields
	bool trim_character_fields = true;
	//! Reject headers whose descriptor table extent is not a whole number of descriptors
	bool strict_descriptor_table = true;
	//! Check that the field lengths add up to the declared record size
	bool verify_record_size = true;
};

//! The configuration of a reader: the decoding options plus the log manager the reader logs to.
//! Copies of a ReaderConfig share the same LogManager.
class ReaderConfig {
public:
	ReaderConfig();
	explicit ReaderConfig(const ReaderOptions &options);
	ReaderConfig(const ReaderOptions &options, const LogConfig &log_config);
	~ReaderConfig();

	ReaderOptions options;

public:
	LogManager &GetLogManager() const;
	shared_ptr<LogManager> GetLogManagerPointer() const;

	//! Returns the number of available configuration options
	static idx_t GetOptionCount();
	//! Returns a list of names of all available configuration options
	static vector<string> GetOptionNames();
	//! Returns the configuration option at the specified index, or nullptr if the index is out of range
	static const ConfigurationOption *GetOptionByIndex(idx_t index);
	//! Fetch an option by name (case-insensitive), or nullptr if none is found
	static const ConfigurationOption *GetOptionByName(const string &name);

	//! Set an option by name; throws an InvalidConfigurationException for unknown options or malformed values
	void SetOptionByName(const string &name, const string &value);
	void SetOption(const ConfigurationOption &option, const string &value);
	//! Parse a "name=value" pair and set the option
	void SetOptionFromString(const string &assignment);
	//! Reset an option to its default value
	void ResetOption(const string &name);
	//! Returns the current value of an option, rendered as a string
	string GetSetting(const string &name) const;

private:
	shared_ptr<LogManager> log_manager;
};

} // namespace dbase
