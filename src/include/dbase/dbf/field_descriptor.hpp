//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/dbf/field_descriptor.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/dbf/field_type.hpp"

namespace dbase {

class ReadStream;

//! Describes one column of the table: its name, type and width within a record
struct FieldDescriptor {
	//! Name of the synthetic descriptor that covers the deletion flag byte of every record
	static constexpr const char *DELETION_FLAG_NAME = "DeletionFlag";
	//! Field names occupy 11 bytes on disk (10 characters plus a NUL terminator)
	static constexpr const idx_t NAME_SIZE = 11;
	static constexpr const idx_t MAX_NAME_LENGTH = 10;

	//! Visual FoxPro column flags
	static constexpr const data_t FLAG_SYSTEM_COLUMN = 0x01;
	static constexpr const data_t FLAG_NULLABLE = 0x02;
	static constexpr const data_t FLAG_BINARY = 0x04;
	static constexpr const data_t FLAG_AUTOINCREMENT = 0x0C;

	FieldDescriptor(string name, FieldType type, uint8_t length, uint8_t decimal_count = 0);

	string name;
	FieldType type;
	//! Width of the field in bytes
	uint8_t length;
	uint8_t decimal_count;
	//! Displacement of the field within the record (only meaningful for some writers)
	uint32_t address;
	data_t flags;
	uint32_t autoincrement_next;
	uint8_t autoincrement_step;
	//! Whether the field is part of the production .mdx index
	bool indexed;
	//! Set only for the synthetic deletion flag descriptor
	bool is_deletion_flag;

public:
	//! Decode one descriptor, consuming exactly 32 bytes of the source
	static FieldDescriptor Read(ReadStream &source);
	//! The one-byte CHARACTER pseudo-field placed in front of the real fields
	static FieldDescriptor CreateDeletionFlag();

	//! Whether a field of the given type can have the given width
	static bool IsValidLength(FieldType type, idx_t length);
	//! Throws a MalformedFieldDescriptorException if the descriptor is not usable
	void Verify() const;

	bool IsNullable() const {
		return (flags & FLAG_NULLABLE) != 0;
	}
	bool IsSystemColumn() const {
		return (flags & FLAG_SYSTEM_COLUMN) != 0;
	}

	string ToString() const;

	bool operator==(const FieldDescriptor &rhs) const;
	bool operator!=(const FieldDescriptor &rhs) const {
		return !(*this == rhs);
	}
};

} // namespace dbase
