#include "dbase/dbf/field_type.hpp"

#include "dbase/common/exception.hpp"
#include "dbase/common/string_util.hpp"

namespace dbase {

bool TryFieldTypeFromByte(data_t byte, FieldType &result) {
	switch (byte) {
	case 'C':
	case 'N':
	case 'F':
	case 'D':
	case 'L':
	case 'M':
	case 'G':
	case 'P':
	case 'I':
	case 'B':
	case 'Y':
	case 'T':
		result = static_cast<FieldType>(byte);
		return true;
	default:
		return false;
	}
}

FieldType FieldTypeFromByte(data_t byte) {
	FieldType result;
	if (!TryFieldTypeFromByte(byte, result)) {
		throw MalformedFieldDescriptorException("Unknown field type %s", StringUtil::ByteToString(byte));
	}
	return result;
}

string FieldTypeToString(FieldType type) {
	switch (type) {
	case FieldType::CHARACTER:
		return "CHARACTER";
	case FieldType::NUMERIC:
		return "NUMERIC";
	case FieldType::FLOAT:
		return "FLOAT";
	case FieldType::DATE:
		return "DATE";
	case FieldType::LOGICAL:
		return "LOGICAL";
	case FieldType::MEMO:
		return "MEMO";
	case FieldType::GENERAL:
		return "GENERAL";
	case FieldType::PICTURE:
		return "PICTURE";
	case FieldType::INTEGER:
		return "INTEGER";
	case FieldType::DOUBLE:
		return "DOUBLE";
	case FieldType::CURRENCY:
		return "CURRENCY";
	case FieldType::DATETIME:
		return "DATETIME";
	}
	return "UNKNOWN";
}

bool FieldTypeIsMemo(FieldType type) {
	switch (type) {
	case FieldType::MEMO:
	case FieldType::GENERAL:
	case FieldType::PICTURE:
		return true;
	default:
		return false;
	}
}

} // namespace dbase
