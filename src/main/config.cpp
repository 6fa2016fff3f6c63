#include "dbase/main/config.hpp"

#include "dbase/common/string_util.hpp"
#include "dbase/logging/log_manager.hpp"
#include "dbase/main/settings.hpp"

namespace dbase {

#define DBASE_OPTION(_PARAM)                                                                                           \
	{ _PARAM::Name, _PARAM::Description, _PARAM::InputType, _PARAM::Set, _PARAM::Reset, _PARAM::GetSetting }
#define FINAL_SETTING                                                                                                  \
	{ nullptr, nullptr, nullptr, nullptr, nullptr, nullptr }

static const ConfigurationOption internal_options[] = {
    DBASE_OPTION(DisabledLogTypes),
    DBASE_OPTION(EnableLogging),
    DBASE_OPTION(EnabledLogTypes),
    DBASE_OPTION(LoggingLevel),
    DBASE_OPTION(LoggingStorage),
    DBASE_OPTION(StrictDescriptorTableSetting),
    DBASE_OPTION(TrimCharacterFieldsSetting),
    DBASE_OPTION(VerifyRecordSizeSetting),
    FINAL_SETTING};

ReaderConfig::ReaderConfig() : ReaderConfig(ReaderOptions()) {
}

ReaderConfig::ReaderConfig(const ReaderOptions &options) : ReaderConfig(options, LogConfig()) {
}

ReaderConfig::ReaderConfig(const ReaderOptions &options, const LogConfig &log_config)
    : options(options), log_manager(make_shared_ptr<LogManager>(log_config)) {
}

ReaderConfig::~ReaderConfig() {
}

LogManager &ReaderConfig::GetLogManager() const {
	return *log_manager;
}

shared_ptr<LogManager> ReaderConfig::GetLogManagerPointer() const {
	return log_manager;
}

idx_t ReaderConfig::GetOptionCount() {
	idx_t count = 0;
	for (idx_t index = 0; internal_options[index].name; index++) {
		count++;
	}
	return count;
}

vector<string> ReaderConfig::GetOptionNames() {
	vector<string> names;
	for (idx_t i = 0, option_count = ReaderConfig::GetOptionCount(); i < option_count; i++) {
		names.emplace_back(ReaderConfig::GetOptionByIndex(i)->name);
	}
	return names;
}

const ConfigurationOption *ReaderConfig::GetOptionByIndex(idx_t target_index) {
	for (idx_t index = 0; internal_options[index].name; index++) {
		if (index == target_index) {
			return internal_options + index;
		}
	}
	return nullptr;
}

const ConfigurationOption *ReaderConfig::GetOptionByName(const string &name) {
	auto lname = StringUtil::Lower(name);
	StringUtil::Trim(lname);
	for (idx_t index = 0; internal_options[index].name; index++) {
		D_ASSERT(StringUtil::Lower(internal_options[index].name) == string(internal_options[index].name));
		if (internal_options[index].name == lname) {
			return internal_options + index;
		}
	}
	return nullptr;
}

void ReaderConfig::SetOptionByName(const string &name, const string &value) {
	auto option = ReaderConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidConfigurationException("Unrecognized configuration option \"%s\", valid options are: %s", name,
		                                    StringUtil::Join(GetOptionNames(), ", "));
	}
	SetOption(*option, value);
}

void ReaderConfig::SetOption(const ConfigurationOption &option, const string &value) {
	D_ASSERT(option.set);
	option.set(*this, value);
}

void ReaderConfig::SetOptionFromString(const string &assignment) {
	auto pos = assignment.find('=');
	if (pos == string::npos) {
		throw InvalidConfigurationException("Expected an option of the form name=value, but got \"%s\"", assignment);
	}
	auto name = assignment.substr(0, pos);
	auto value = assignment.substr(pos + 1);
	SetOptionByName(name, value);
}

void ReaderConfig::ResetOption(const string &name) {
	auto option = ReaderConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidConfigurationException("Unrecognized configuration option \"%s\"", name);
	}
	D_ASSERT(option->reset);
	option->reset(*this);
}

string ReaderConfig::GetSetting(const string &name) const {
	auto option = ReaderConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidConfigurationException("Unrecognized configuration option \"%s\"", name);
	}
	D_ASSERT(option->get_setting);
	return option->get_setting(*this);
}

} // namespace dbase
