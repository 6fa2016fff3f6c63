#include "catch.hpp"
#include "dbase/main/config.hpp"
#include "dbase/main/settings.hpp"
#include "test_helpers.hpp"

using namespace dbase;
using namespace std;

TEST_CASE("Test reader option defaults", "[config]") {
	ReaderConfig config;
	REQUIRE(config.options.trim_character_fields);
	REQUIRE(config.options.strict_descriptor_table);
	REQUIRE(config.options.verify_record_size);

	REQUIRE(config.GetSetting("trim_character_fields") == "true");
	REQUIRE(config.GetSetting("enable_logging") == "false");
	REQUIRE(config.GetSetting("logging_level") == "INFO");
	REQUIRE(config.GetSetting("logging_storage") == "stdout");
	REQUIRE(config.GetSetting("enabled_log_types") == "");
}

TEST_CASE("Test setting options by name", "[config]") {
	ReaderConfig config;
	config.SetOptionByName("TRIM_CHARACTER_FIELDS", "false");
	REQUIRE_FALSE(config.options.trim_character_fields);
	config.SetOptionByName("strict_descriptor_table", "off");
	REQUIRE_FALSE(config.options.strict_descriptor_table);
	config.SetOptionFromString("verify_record_size=0");
	REQUIRE_FALSE(config.options.verify_record_size);
	REQUIRE(config.GetSetting("verify_record_size") == "false");

	config.ResetOption("trim_character_fields");
	REQUIRE(config.options.trim_character_fields);
	config.ResetOption("verify_record_size");
	REQUIRE(config.GetSetting("verify_record_size") == "true");
}

TEST_CASE("Test invalid configuration", "[config]") {
	ReaderConfig config;
	REQUIRE_THROWS_AS(config.SetOptionByName("does_not_exist", "true"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("trim_character_fields", "maybe"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("logging_level", "loud"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("logging_storage", "somewhere"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionFromString("no_assignment"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.GetSetting("does_not_exist"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.ResetOption("does_not_exist"), InvalidConfigurationException);

	// failed assignments leave the option untouched
	REQUIRE(config.options.trim_character_fields);
	REQUIRE(config.GetSetting("logging_level") == "INFO");
}

TEST_CASE("Test option table", "[config]") {
	auto names = ReaderConfig::GetOptionNames();
	REQUIRE(names.size() == ReaderConfig::GetOptionCount());
	REQUIRE(names.size() == 8);
	for (auto &name : names) {
		auto option = ReaderConfig::GetOptionByName(name);
		REQUIRE(option);
		REQUIRE(option->description);
		REQUIRE(option->set);
		REQUIRE(option->reset);
		REQUIRE(option->get_setting);
	}
	REQUIRE(ReaderConfig::GetOptionByIndex(names.size()) == nullptr);
	REQUIRE(ReaderConfig::GetOptionByName("Enable_Logging") == ReaderConfig::GetOptionByName("enable_logging"));
	REQUIRE(string(ReaderConfig::GetOptionByName("logging_level")->parameter_type) == "VARCHAR");
}

TEST_CASE("Test logging settings", "[config]") {
	ReaderConfig config;
	config.SetOptionByName("logging_storage", "memory");
	config.SetOptionByName("enable_logging", "true");
	config.SetOptionByName("logging_level", "debug");
	REQUIRE(config.GetSetting("logging_level") == "DEBUG");
	REQUIRE(config.GetSetting("logging_storage") == "memory");

	config.SetOptionByName("enabled_log_types", "DBFReader, FileSystem");
	REQUIRE(config.GetSetting("enabled_log_types") == "DBFReader,FileSystem");
	auto log_config = config.GetLogManager().GetConfig();
	REQUIRE(log_config.mode == LogMode::ENABLE_SELECTED);
	REQUIRE(log_config.enabled_log_types.size() == 2);

	config.ResetOption("enabled_log_types");
	REQUIRE(config.GetLogManager().GetConfig().mode == LogMode::LEVEL_ONLY);

	config.SetOptionByName("disabled_log_types", "FileSystem");
	REQUIRE(config.GetLogManager().GetConfig().mode == LogMode::DISABLE_SELECTED);
	REQUIRE(config.GetSetting("disabled_log_types") == "FileSystem");

	config.ResetOption("enable_logging");
	REQUIRE(config.GetSetting("enable_logging") == "false");
}

TEST_CASE("Test copies of a config share the log manager", "[config]") {
	auto config = TestLoggingConfig("INFO");
	ReaderConfig copy = config;
	REQUIRE(&copy.GetLogManager() == &config.GetLogManager());
	copy.options.trim_character_fields = false;
	REQUIRE(config.options.trim_character_fields);
}
