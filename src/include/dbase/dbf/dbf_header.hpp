//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/dbf/dbf_header.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/common/types/date.hpp"

namespace dbase {

class ReadStream;
struct ReaderOptions;

//! The fixed-size header at the start of every .dbf file
struct DBFHeader {
	//! Size of the fixed header in bytes
	static constexpr const idx_t HEADER_SIZE = 32;
	//! Size of a single field descriptor in bytes
	static constexpr const idx_t DESCRIPTOR_SIZE = 32;
	//! The byte that closes the field descriptor table
	static constexpr const data_t TERMINATOR = 0x0D;
	//! Visual FoxPro tables store the path of their database container after the terminator
	static constexpr const idx_t VFP_BACKLINK_SIZE = 263;

	//! Table flag bits (byte 28)
	static constexpr const data_t FLAG_HAS_STRUCTURAL_INDEX = 0x01;
	static constexpr const data_t FLAG_HAS_MEMO = 0x02;
	static constexpr const data_t FLAG_IS_DATABASE = 0x04;

	DBFHeader();

	//! The version / file type byte
	data_t version;
	//! Raw date of last update (year is stored as an offset from 1900)
	int32_t last_update_year;
	int32_t last_update_month;
	int32_t last_update_day;
	//! The number of records declared in the file
	uint32_t record_count;
	//! Offset of the first record, which is also the total size of the header section
	uint16_t offset_to_first_record;
	//! Size of every record in bytes, including the deletion flag
	uint16_t record_size;
	bool incomplete_transaction;
	bool encrypted;
	data_t table_flags;
	data_t code_page_mark;

public:
	//! Decode the header, consuming exactly HEADER_SIZE bytes of the source
	static DBFHeader Read(ReadStream &source, const ReaderOptions &options);

	//! A description of the version byte, e.g. "dBASE III (no memo)"
	static string VersionToString(data_t version);
	static bool IsVisualFoxPro(data_t version);

	bool IsVisualFoxPro() const;
	//! Whether the file refers to a companion memo file
	bool HasMemo() const;
	//! Whether the stored date of last update is a valid calendar date
	bool HasValidLastUpdate() const;
	//! The date of last update; throws an InvalidInputException if it is not a valid date
	date_t LastUpdate() const;

	//! Bytes between the fixed header and the first record that do not belong to the descriptor table
	idx_t ReservedSize() const;
	//! Number of bytes available to field descriptors (excludes the terminator and the backlink)
	idx_t DescriptorTableExtent() const;
	//! The number of on-disk field descriptors
	idx_t FieldCount() const;
	//! Trailing bytes of the extent that do not form a whole descriptor
	idx_t DescriptorRemainder() const;

	string ToString() const;
};

} // namespace dbase
