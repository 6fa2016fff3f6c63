#include "dbase/dbf/field_descriptor.hpp"

#include "dbase/common/exception.hpp"
#include "dbase/common/serializer/read_stream.hpp"
#include "dbase/common/string_util.hpp"
#include "dbase/dbf/dbf_header.hpp"

namespace dbase {

constexpr const char *FieldDescriptor::DELETION_FLAG_NAME;
constexpr const idx_t FieldDescriptor::NAME_SIZE;
constexpr const idx_t FieldDescriptor::MAX_NAME_LENGTH;
constexpr const data_t FieldDescriptor::FLAG_SYSTEM_COLUMN;
constexpr const data_t FieldDescriptor::FLAG_NULLABLE;
constexpr const data_t FieldDescriptor::FLAG_BINARY;
constexpr const data_t FieldDescriptor::FLAG_AUTOINCREMENT;

FieldDescriptor::FieldDescriptor(string name_p, FieldType type, uint8_t length, uint8_t decimal_count)
    : name(std::move(name_p)), type(type), length(length), decimal_count(decimal_count), address(0), flags(0),
      autoincrement_next(0), autoincrement_step(0), indexed(false), is_deletion_flag(false) {
}

FieldDescriptor FieldDescriptor::Read(ReadStream &source) {
	data_t buffer[DBFHeader::DESCRIPTOR_SIZE];
	source.ReadData(buffer, DBFHeader::DESCRIPTOR_SIZE);

	// the name is NUL terminated, some writers pad it with blanks instead
	idx_t name_length = 0;
	while (name_length < NAME_SIZE && buffer[name_length] != '\0') {
		name_length++;
	}
	string name(const_char_ptr_cast(buffer), name_length);
	// names are raw code page bytes, only the blank padding is removed
	StringUtil::RTrim(name, " ");
	if (name.empty()) {
		throw MalformedFieldDescriptorException("Field name is empty");
	}
	if (name.size() > MAX_NAME_LENGTH) {
		throw MalformedFieldDescriptorException("Field name \"%s\" is not NUL terminated", name);
	}

	FieldType type;
	if (!TryFieldTypeFromByte(buffer[11], type)) {
		throw MalformedFieldDescriptorException("Field \"%s\" has unknown type %s", name,
		                                        StringUtil::ByteToString(buffer[11]));
	}

	FieldDescriptor result(std::move(name), type, buffer[16], buffer[17]);
	result.address = Load<uint32_t>(buffer + 12);
	result.flags = buffer[18];
	result.autoincrement_next = Load<uint32_t>(buffer + 19);
	result.autoincrement_step = buffer[23];
	// bytes 24-30 are reserved
	result.indexed = buffer[31] != 0;
	result.Verify();
	return result;
}

FieldDescriptor FieldDescriptor::CreateDeletionFlag() {
	FieldDescriptor result(DELETION_FLAG_NAME, FieldType::CHARACTER, 1);
	result.is_deletion_flag = true;
	return result;
}

bool FieldDescriptor::IsValidLength(FieldType type, idx_t length) {
	if (length == 0) {
		return false;
	}
	switch (type) {
	case FieldType::DATE:
		return length == 8;
	case FieldType::LOGICAL:
		return length == 1;
	case FieldType::INTEGER:
		return length == 4;
	case FieldType::CURRENCY:
	case FieldType::DATETIME:
		return length == 8;
	case FieldType::DOUBLE:
		return length == 8 || length == 10;
	default:
		return true;
	}
}

void FieldDescriptor::Verify() const {
	if (name.empty()) {
		throw MalformedFieldDescriptorException("Field name is empty");
	}
	if (length == 0) {
		throw MalformedFieldDescriptorException("Field \"%s\" has length 0", name);
	}
	if (!IsValidLength(type, length)) {
		throw MalformedFieldDescriptorException("Field \"%s\" of type %s cannot have length %llu", name,
		                                        FieldTypeToString(type), idx_t(length));
	}
}

string FieldDescriptor::ToString() const {
	auto result = StringUtil::Format("%s %s(%llu", name, string(1, char(type)), idx_t(length));
	if (decimal_count > 0) {
		result += StringUtil::Format(",%llu", idx_t(decimal_count));
	}
	result += ")";
	return result;
}

bool FieldDescriptor::operator==(const FieldDescriptor &rhs) const {
	return name == rhs.name && type == rhs.type && length == rhs.length && decimal_count == rhs.decimal_count &&
	       is_deletion_flag == rhs.is_deletion_flag;
}

} // namespace dbase
