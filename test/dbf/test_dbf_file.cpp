#include "catch.hpp"
#include "test_helpers.hpp"

using namespace dbase;
using namespace std;

static DBFBuilder LargeTable(idx_t count) {
	DBFBuilder builder;
	builder.AddField("ID", 'N', 6).AddField("LABEL", 'C', 40).AddField("SEEN", 'D', 8);
	for (idx_t i = 0; i < count; i++) {
		builder.AddRecord({to_string(i), "label number " + to_string(i), "20240315"}, i % 10 == 0);
	}
	return builder;
}

TEST_CASE("Test reading a table from disk", "[dbf_file]") {
	auto path = TestCreatePath("large.dbf");
	// spans several read buffers
	auto bytes = LargeTable(500).Build();
	REQUIRE(bytes.size() > 4 * FILE_BUFFER_SIZE);
	WriteBinary(path, bytes);

	auto records = ReadDBF(path);
	REQUIRE(records.size() == 500);
	for (idx_t i = 0; i < records.size(); i++) {
		REQUIRE(records[i]["ID"].GetValue<double>() == double(i));
		REQUIRE(records[i]["LABEL"].GetValue<string>() == "label number " + to_string(i));
	}

	// a file and a memory stream holding the same bytes decode to the same records
	REQUIRE(records == ReadDBF(make_uniq<MemoryStream>(bytes)));

	auto fs = FileSystem::CreateLocal();
	DBFReader reader(*fs, path);
	idx_t deleted = 0;
	for (auto &record : reader) {
		REQUIRE(record.size() == 3);
		if (reader.LastRecordDeleted()) {
			deleted++;
		}
	}
	REQUIRE(deleted == 50);
	REQUIRE(reader.RecordsRead() == 500);

	TestDeleteFile(path);
}

TEST_CASE("Test opening missing files", "[dbf_file]") {
	auto path = TestCreatePath("missing.dbf");
	TestDeleteFile(path);

	auto fs = FileSystem::CreateLocal();
	REQUIRE_FALSE(fs->FileExists(path));
	REQUIRE_THROWS_AS(ReadDBF(path), IOException);
	REQUIRE_THROWS_AS(DBFReader(*fs, path), IOException);
	REQUIRE(fs->OpenFile(path, FileFlags::FILE_FLAGS_READ | FileFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS) == nullptr);

	// directories are not tables
	REQUIRE_THROWS_AS(ReadDBF(TestDirectoryPath()), IOException);
}

TEST_CASE("Test truncated files on disk", "[dbf_file]") {
	auto path = TestCreatePath("truncated.dbf");
	auto bytes = LargeTable(20).Build();
	bytes.resize(bytes.size() - 30);
	WriteBinary(path, bytes);

	auto fs = FileSystem::CreateLocal();
	DBFReader reader(*fs, path);
	idx_t read = 0;
	try {
		for (auto &record : reader) {
			(void)record;
			read++;
		}
		FAIL("Reading past the end of the file must fail");
	} catch (IOException &ex) {
		REQUIRE(StringUtil::Contains(ex.what(), "end of file"));
	}
	REQUIRE(read == 19);
	REQUIRE(reader.HasFailed());
	REQUIRE_THROWS_AS(reader.Next(), InvalidInputException);

	TestDeleteFile(path);
}

TEST_CASE("Test reading files with a configuration", "[dbf_file]") {
	auto path = TestCreatePath("configured.dbf");
	DBFBuilder builder;
	builder.AddField("CODE", 'C', 8).AddRecord({"ab"});
	WriteBinary(path, builder.Build());

	auto config = TestLoggingConfig("TRACE");
	config.SetOptionByName("trim_character_fields", "false");
	config.SetOptionByName("enabled_log_types", "FileSystem");
	auto fs = FileSystem::CreateLocal();
	auto records = ReadDBF(*fs, path, config);
	REQUIRE(records.size() == 1);
	REQUIRE(records[0]["CODE"].GetValue<string>() == "ab      ");

	auto entries = TestGetLogEntries(config);
	REQUIRE(!entries.empty());
	REQUIRE(StringUtil::Contains(entries.front().message, "\"op\":\"OPEN\""));
	REQUIRE(StringUtil::Contains(entries.back().message, "\"op\":\"CLOSE\""));

	TestDeleteFile(path);
}
