//===----------------------------------------------------------------------===//
//
//                         DBase
//
// test_helpers.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase.hpp"
#include "dbase/common/string_util.hpp"

namespace dbase {

void TestCreateDirectory(string path);
void TestDeleteFile(string path);
string TestDirectoryPath();
string TestCreatePath(string suffix);
void WriteBinary(string path, const uint8_t *data, uint64_t length);
void WriteBinary(string path, const vector<data_t> &data);

//! Returns the little-endian bytes of a value, for filling binary fields
template <class T>
string BinaryField(T value) {
	string result(sizeof(T), '\0');
	memcpy(&result[0], &value, sizeof(T));
	return result;
}

//! Assembles the bytes of a .dbf file
class DBFBuilder {
public:
	explicit DBFBuilder(data_t version = 0x03);

	DBFBuilder &AddField(const string &name, char type, uint8_t length, uint8_t decimal_count = 0);
	//! Add a record; values shorter than the field are padded with blanks (numbers are right-aligned)
	DBFBuilder &AddRecord(const vector<string> &values, bool deleted = false);
	//! Add the raw bytes of a record, including the deletion flag
	DBFBuilder &AddRawRecord(const string &bytes);

	DBFBuilder &SetLastUpdate(data_t year_since_1900, data_t month, data_t day);
	DBFBuilder &SetRecordCount(uint32_t count);
	DBFBuilder &SetHeaderSize(uint16_t size);
	DBFBuilder &SetRecordSize(uint16_t size);
	DBFBuilder &SetTerminator(data_t terminator);
	DBFBuilder &SetTableFlags(data_t flags);
	//! Overwrite a single byte of the descriptor of the given field (0-based, excluding the deletion flag)
	DBFBuilder &SetDescriptorByte(idx_t field_index, idx_t offset, data_t value);

	vector<data_t> Build() const;
	unique_ptr<ReadStream> BuildStream() const;

private:
	struct BuilderField {
		data_t descriptor[32];
		idx_t length;
		char type;
	};

	idx_t DefaultHeaderSize() const;
	idx_t DefaultRecordSize() const;

	data_t version;
	data_t last_update[3];
	data_t table_flags;
	data_t terminator;
	vector<BuilderField> fields;
	vector<string> records;
	bool has_record_count;
	uint32_t record_count;
	bool has_header_size;
	uint16_t header_size;
	bool has_record_size;
	uint16_t record_size;
};

//! A reader configuration that logs every entry into an in-memory storage
ReaderConfig TestLoggingConfig(const string &level = "TRACE");
vector<LogEntry> TestGetLogEntries(const ReaderConfig &config);

} // namespace dbase
