#include "catch.hpp"
#include "dbase/logging/log_manager.hpp"
#include "dbase/logging/log_storage.hpp"
#include "dbase/logging/logger.hpp"
#include "test_helpers.hpp"

using namespace dbase;
using namespace std;

static LogConfig InMemoryConfig(bool enabled, LogLevel level) {
	auto config = LogConfig::Create(enabled, level);
	config.storage = LogConfig::IN_MEMORY_STORAGE_NAME;
	return config;
}

static vector<LogEntry> GetEntries(LogManager &manager) {
	auto storage = manager.GetLogStorage();
	return dynamic_cast<InMemoryLogStorage &>(*storage).GetEntries();
}

#define TEST_ALL_LOG_MACROS(LOGGER)                                                                                    \
	DBASE_LOG_TRACE(LOGGER, "log-a-lot: '%s'", "trace")                                                                \
	DBASE_LOG_DEBUG(LOGGER, "log-a-lot: '%s'", "debug")                                                                \
	DBASE_LOG_INFO(LOGGER, "log-a-lot: '%s'", "info")                                                                  \
	DBASE_LOG_WARN(LOGGER, "log-a-lot: '%s'", "warn")                                                                  \
	DBASE_LOG_ERROR(LOGGER, "log-a-lot: '%s'", "error")                                                                \
	DBASE_LOG_FATAL(LOGGER, "log-a-lot: '%s'", "fatal")

TEST_CASE("Test log levels", "[logging]") {
	vector<string> log_levels = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
	for (idx_t minimum = 0; minimum < log_levels.size(); minimum++) {
		LogManager manager(InMemoryConfig(true, LogLevelUtil::FromString(log_levels[minimum])));
		TEST_ALL_LOG_MACROS(manager.GlobalLogger());

		auto entries = GetEntries(manager);
		REQUIRE(entries.size() == log_levels.size() - minimum);
		for (idx_t i = 0; i < entries.size(); i++) {
			auto &expected_level = log_levels[minimum + i];
			REQUIRE(LogLevelUtil::ToString(entries[i].log_level) == expected_level);
			REQUIRE(entries[i].log_type == DefaultLogType::NAME);
			REQUIRE(entries[i].message == "log-a-lot: '" + StringUtil::Lower(expected_level) + "'");
		}
	}
}

TEST_CASE("Test disabled logging", "[logging]") {
	LogManager manager(InMemoryConfig(false, LogLevel::LOG_TRACE));
	TEST_ALL_LOG_MACROS(manager.GlobalLogger());
	REQUIRE(GetEntries(manager).empty());

	// loggers created while logging is disabled do nothing
	auto logger = manager.CreateLogger();
	REQUIRE_FALSE(logger->IsMutable());
	REQUIRE_FALSE(logger->ShouldLog(DefaultLogType::NAME, LogLevel::LOG_FATAL));

	// enabling logging at runtime reaches the global logger
	manager.SetEnableLogging(true);
	DBASE_LOG_INFO(manager.GlobalLogger(), "now enabled");
	auto entries = GetEntries(manager);
	REQUIRE(entries.size() == 1);
	REQUIRE(entries[0].message == "now enabled");

	manager.TruncateLogStorage();
	REQUIRE(GetEntries(manager).empty());
}

TEST_CASE("Test enabled and disabled log types", "[logging]") {
	unordered_set<string> selected = {DBFReaderLogType::NAME};
	{
		LogManager manager(InMemoryConfig(true, LogLevel::LOG_TRACE));
		manager.SetEnabledLogTypes(selected);
		manager.SetLogMode(LogMode::ENABLE_SELECTED);
		auto &logger = manager.GlobalLogger();
		REQUIRE(logger.ShouldLog(DBFReaderLogType::NAME, LogLevel::LOG_DEBUG));
		REQUIRE_FALSE(logger.ShouldLog(FileSystemLogType::NAME, LogLevel::LOG_DEBUG));
		REQUIRE_FALSE(logger.ShouldLog(DefaultLogType::NAME, LogLevel::LOG_FATAL));
	}
	{
		LogManager manager(InMemoryConfig(true, LogLevel::LOG_TRACE));
		manager.SetDisabledLogTypes(selected);
		manager.SetLogMode(LogMode::DISABLE_SELECTED);
		auto &logger = manager.GlobalLogger();
		REQUIRE_FALSE(logger.ShouldLog(DBFReaderLogType::NAME, LogLevel::LOG_DEBUG));
		REQUIRE(logger.ShouldLog(FileSystemLogType::NAME, LogLevel::LOG_TRACE));
	}
	REQUIRE(LogConfig::CreateFromEnabled(true, LogLevel::LOG_INFO, selected).IsConsistent());
	REQUIRE_FALSE(LogConfig::CreateFromDisabled(true, LogLevel::LOG_INFO, selected).enabled_log_types.size() > 0);
}

TEST_CASE("Test log storage selection", "[logging]") {
	LogManager manager(InMemoryConfig(true, LogLevel::LOG_INFO));
	REQUIRE(manager.GetLogStorage()->GetStorageName() == "InMemoryLogStorage");

	manager.SetLogStorage("STDOUT");
	REQUIRE(manager.GetConfig().storage == LogConfig::STDOUT_STORAGE_NAME);
	REQUIRE_THROWS_AS(manager.SetLogStorage("does_not_exist"), InvalidConfigurationException);

	shared_ptr<LogStorage> custom = make_shared_ptr<InMemoryLogStorage>();
	REQUIRE(manager.RegisterLogStorage("Custom", custom));
	REQUIRE_FALSE(manager.RegisterLogStorage("custom", custom));
	manager.SetLogStorage("custom");
	DBASE_LOG_WARN(manager.GlobalLogger(), "into the custom storage");
	REQUIRE(dynamic_cast<InMemoryLogStorage &>(*custom).GetEntries().size() == 1);
}

TEST_CASE("Test log level names", "[logging]") {
	REQUIRE(LogLevelUtil::FromString("debug") == LogLevel::LOG_DEBUG);
	REQUIRE(LogLevelUtil::FromString("Warning") == LogLevel::LOG_WARN);
	REQUIRE(string(LogLevelUtil::ToString(LogLevel::LOG_ERROR)) == "ERROR");
	REQUIRE_THROWS_AS(LogLevelUtil::FromString("verbose"), InvalidConfigurationException);
}

TEST_CASE("Test file system operations are logged", "[logging]") {
	auto path = TestCreatePath("logged_file.bin");
	vector<data_t> bytes(100, 0x42);
	WriteBinary(path, bytes);

	auto config = TestLoggingConfig("TRACE");
	auto fs = FileSystem::CreateLocal();
	{
		BufferedFileReader reader(*fs, path.c_str(), config.GetLogManagerPointer());
		data_t buffer[100];
		reader.ReadData(buffer, 100);
		REQUIRE(reader.Finished());
	}

	auto entries = TestGetLogEntries(config);
	REQUIRE(entries.size() >= 3);
	REQUIRE(entries.front().log_type == FileSystemLogType::NAME);
	REQUIRE(StringUtil::Contains(entries.front().message, "\"op\":\"OPEN\""));
	REQUIRE(StringUtil::Contains(entries[1].message, "\"op\":\"READ\""));
	REQUIRE(StringUtil::Contains(entries[1].message, "\"bytes\":\"100\""));
	REQUIRE(StringUtil::Contains(entries.back().message, "\"op\":\"CLOSE\""));
	TestDeleteFile(path);
}
