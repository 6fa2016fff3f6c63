//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/dbf/field_type.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"

namespace dbase {

//! The type tag of a column, stored as a single ASCII byte in the field descriptor
enum class FieldType : char {
	CHARACTER = 'C',
	NUMERIC = 'N',
	FLOAT = 'F',
	DATE = 'D',
	LOGICAL = 'L',
	MEMO = 'M',
	GENERAL = 'G',
	PICTURE = 'P',
	INTEGER = 'I',
	DOUBLE = 'B',
	CURRENCY = 'Y',
	DATETIME = 'T'
};

//! Converts a type byte to a FieldType, returns false if the byte is not a known type tag
bool TryFieldTypeFromByte(data_t byte, FieldType &result);
//! Converts a type byte to a FieldType, throws a MalformedFieldDescriptorException for unknown tags
FieldType FieldTypeFromByte(data_t byte);
string FieldTypeToString(FieldType type);

//! Whether or not values of this type hold a block index into a memo file
bool FieldTypeIsMemo(FieldType type);

} // namespace dbase
