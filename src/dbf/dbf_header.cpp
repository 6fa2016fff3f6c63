#include "dbase/dbf/dbf_header.hpp"

#include "dbase/common/exception.hpp"
#include "dbase/common/serializer/read_stream.hpp"
#include "dbase/common/string_util.hpp"
#include "dbase/main/config.hpp"

namespace dbase {

constexpr const idx_t DBFHeader::HEADER_SIZE;
constexpr const idx_t DBFHeader::DESCRIPTOR_SIZE;
constexpr const data_t DBFHeader::TERMINATOR;
constexpr const idx_t DBFHeader::VFP_BACKLINK_SIZE;
constexpr const data_t DBFHeader::FLAG_HAS_STRUCTURAL_INDEX;
constexpr const data_t DBFHeader::FLAG_HAS_MEMO;
constexpr const data_t DBFHeader::FLAG_IS_DATABASE;

DBFHeader::DBFHeader()
    : version(0x03), last_update_year(1900), last_update_month(1), last_update_day(1), record_count(0),
      offset_to_first_record(uint16_t(HEADER_SIZE + 1)), record_size(1), incomplete_transaction(false),
      encrypted(false), table_flags(0), code_page_mark(0) {
}

DBFHeader DBFHeader::Read(ReadStream &source, const ReaderOptions &options) {
	data_t buffer[HEADER_SIZE];
	source.ReadData(buffer, HEADER_SIZE);

	DBFHeader result;
	result.version = buffer[0];
	result.last_update_year = 1900 + int32_t(buffer[1]);
	result.last_update_month = int32_t(buffer[2]);
	result.last_update_day = int32_t(buffer[3]);
	result.record_count = Load<uint32_t>(buffer + 4);
	result.offset_to_first_record = Load<uint16_t>(buffer + 8);
	result.record_size = Load<uint16_t>(buffer + 10);
	// bytes 12-13 are reserved
	result.incomplete_transaction = buffer[14] != 0;
	result.encrypted = buffer[15] != 0;
	// bytes 16-27 are reserved for multi-user processing
	result.table_flags = buffer[28];
	result.code_page_mark = buffer[29];

	auto minimum_offset = HEADER_SIZE + 1 + result.ReservedSize();
	if (result.offset_to_first_record < minimum_offset) {
		throw MalformedHeaderException("Header size %llu is too small, a %s file needs at least %llu bytes",
		                               idx_t(result.offset_to_first_record), VersionToString(result.version),
		                               minimum_offset);
	}
	if (result.record_size == 0) {
		throw MalformedHeaderException("Record size is 0, but every record holds at least the deletion flag");
	}
	if (options.strict_descriptor_table && result.DescriptorRemainder() != 0) {
		throw MalformedHeaderException(
		    "Header size %llu does not describe a whole number of field descriptors (%llu trailing bytes)",
		    idx_t(result.offset_to_first_record), result.DescriptorRemainder());
	}
	return result;
}

string DBFHeader::VersionToString(data_t version) {
	switch (version) {
	case 0x02:
		return "FoxBASE";
	case 0x03:
		return "dBASE III (no memo)";
	case 0x04:
		return "dBASE IV (no memo)";
	case 0x05:
		return "dBASE V (no memo)";
	case 0x07:
		return "Visual Objects (no memo)";
	case 0x30:
		return "Visual FoxPro";
	case 0x31:
		return "Visual FoxPro (autoincrement)";
	case 0x32:
		return "Visual FoxPro (varchar/varbinary)";
	case 0x43:
		return "dBASE IV SQL table (no memo)";
	case 0x63:
		return "dBASE IV SQL system (no memo)";
	case 0x83:
		return "dBASE III (memo)";
	case 0x87:
		return "Visual Objects (memo)";
	case 0x8B:
		return "dBASE IV (memo)";
	case 0x8E:
		return "dBASE IV SQL table (memo)";
	case 0xCB:
		return "dBASE IV SQL system (memo)";
	case 0xF5:
		return "FoxPro 2.x (memo)";
	case 0xFB:
		return "FoxBASE (memo)";
	default:
		return StringUtil::Format("Unknown (%s)", StringUtil::ByteToString(version));
	}
}

bool DBFHeader::IsVisualFoxPro(data_t version) {
	return version == 0x30 || version == 0x31 || version == 0x32;
}

bool DBFHeader::IsVisualFoxPro() const {
	return IsVisualFoxPro(version);
}

bool DBFHeader::HasMemo() const {
	switch (version) {
	case 0x83:
	case 0x87:
	case 0x8B:
	case 0x8E:
	case 0xCB:
	case 0xF5:
	case 0xFB:
		return true;
	default:
		return (table_flags & FLAG_HAS_MEMO) != 0;
	}
}

bool DBFHeader::HasValidLastUpdate() const {
	return Date::IsValid(last_update_year, last_update_month, last_update_day);
}

date_t DBFHeader::LastUpdate() const {
	return Date::FromDate(last_update_year, last_update_month, last_update_day);
}

idx_t DBFHeader::ReservedSize() const {
	return IsVisualFoxPro() ? VFP_BACKLINK_SIZE : 0;
}

idx_t DBFHeader::DescriptorTableExtent() const {
	D_ASSERT(offset_to_first_record >= HEADER_SIZE + 1 + ReservedSize());
	return idx_t(offset_to_first_record) - HEADER_SIZE - 1 - ReservedSize();
}

idx_t DBFHeader::FieldCount() const {
	return DescriptorTableExtent() / DESCRIPTOR_SIZE;
}

idx_t DBFHeader::DescriptorRemainder() const {
	return DescriptorTableExtent() % DESCRIPTOR_SIZE;
}

string DBFHeader::ToString() const {
	string last_update = HasValidLastUpdate() ? Date::ToString(LastUpdate()) : "invalid";
	return StringUtil::Format("version: %s\nlast update: %s\nrecords: %llu\nheader size: %llu\nrecord size: "
	                          "%llu\nfields: %llu\nmemo: %s\nencrypted: %s\ncode page mark: %s",
	                          VersionToString(version), last_update, idx_t(record_count),
	                          idx_t(offset_to_first_record), idx_t(record_size), FieldCount(),
	                          HasMemo() ? "yes" : "no", encrypted ? "yes" : "no",
	                          StringUtil::ByteToString(code_page_mark));
}

} // namespace dbase
