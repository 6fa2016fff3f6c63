#include "dbase/dbf/field_decoder.hpp"

#include "dbase/common/exception.hpp"
#include "dbase/common/serializer/read_stream.hpp"
#include "dbase/common/string_util.hpp"
#include "dbase/main/config.hpp"

#include "fast_float/fast_float.h"

#include <limits>
#include <system_error>

namespace dbase {

constexpr const idx_t FieldDecoder::MAX_FIELD_LENGTH;

FieldValue FieldDecoder::Decode(ReadStream &source, const FieldDescriptor &field, const ReaderOptions &options) {
	data_t buffer[MAX_FIELD_LENGTH];
	D_ASSERT(field.length <= MAX_FIELD_LENGTH);
	// always consume the complete field, so a bad value does not shift the following fields
	source.ReadData(buffer, field.length);
	return Decode(buffer, field.length, field, options);
}

FieldValue FieldDecoder::Decode(const_data_ptr_t data, idx_t length, const FieldDescriptor &field,
                                const ReaderOptions &options) {
	if (length != field.length) {
		throw InternalException("Field \"%s\" expects %llu bytes, but %llu were provided", field.name,
		                        idx_t(field.length), length);
	}
	switch (field.type) {
	case FieldType::CHARACTER:
		return DecodeCharacter(data, length, options);
	case FieldType::NUMERIC:
	case FieldType::FLOAT:
		return DecodeNumeric(data, length, field);
	case FieldType::DATE:
		return DecodeDate(data, length, field);
	case FieldType::LOGICAL:
		return DecodeLogical(data, field);
	case FieldType::MEMO:
	case FieldType::GENERAL:
	case FieldType::PICTURE:
		return DecodeMemo(data, length, field);
	case FieldType::INTEGER:
		return FieldValue::INTEGER(Load<int32_t>(data));
	case FieldType::DOUBLE:
		if (length == 10) {
			// dBase IV stores binary memo pointers in 'B' fields
			return DecodeMemo(data, length, field);
		}
		return FieldValue::DOUBLE(Load<double>(data));
	case FieldType::CURRENCY:
		return FieldValue::CURRENCY(Load<int64_t>(data));
	case FieldType::DATETIME:
		return DecodeDatetime(data, field);
	default:
		throw InternalException("Unsupported field type %s", FieldTypeToString(field.type));
	}
}

bool FieldDecoder::IsBlank(const_data_ptr_t data, idx_t length) {
	for (idx_t i = 0; i < length; i++) {
		if (data[i] != ' ' && data[i] != '\0') {
			return false;
		}
	}
	return true;
}

static string TrimmedString(const_data_ptr_t data, idx_t length) {
	string result(const_char_ptr_cast(data), length);
	StringUtil::RTrim(result, string(" \0", 2));
	StringUtil::LTrim(result);
	return result;
}

FieldValue FieldDecoder::DecodeCharacter(const_data_ptr_t data, idx_t length, const ReaderOptions &options) {
	string result(const_char_ptr_cast(data), length);
	if (options.trim_character_fields) {
		StringUtil::RTrim(result, string(" \0", 2));
	}
	return FieldValue::CHARACTER(std::move(result));
}

FieldValue FieldDecoder::DecodeNumeric(const_data_ptr_t data, idx_t length, const FieldDescriptor &field) {
	if (IsBlank(data, length)) {
		return FieldValue::Null(field.type);
	}
	auto text = TrimmedString(data, length);
	const char *begin = text.c_str();
	const char *end = begin + text.size();
	if (begin < end && *begin == '+') {
		begin++;
	}
	double result;
	auto parse_result = fast_float::from_chars(begin, end, result);
	if (parse_result.ec != std::errc() || parse_result.ptr != end) {
		throw InvalidFieldDataException("Field \"%s\" of type %s contains \"%s\", which is not a number",
		                                field.name, FieldTypeToString(field.type), StringUtil::EscapeBytes(data, length));
	}
	return field.type == FieldType::FLOAT ? FieldValue::FLOAT(result) : FieldValue::NUMERIC(result);
}

FieldValue FieldDecoder::DecodeDate(const_data_ptr_t data, idx_t length, const FieldDescriptor &field) {
	D_ASSERT(length == 8);
	if (IsBlank(data, length)) {
		return FieldValue::Null(FieldType::DATE);
	}
	int32_t parts[3] = {0, 0, 0};
	const idx_t widths[3] = {4, 2, 2};
	idx_t pos = 0;
	bool all_zero = true;
	for (idx_t part = 0; part < 3; part++) {
		for (idx_t i = 0; i < widths[part]; i++, pos++) {
			auto c = char(data[pos]);
			if (!StringUtil::CharacterIsDigit(c)) {
				throw InvalidFieldDataException("Field \"%s\" contains \"%s\", which is not a date in YYYYMMDD format",
				                                field.name, StringUtil::EscapeBytes(data, length));
			}
			all_zero = all_zero && c == '0';
			parts[part] = parts[part] * 10 + (c - '0');
		}
	}
	if (all_zero) {
		return FieldValue::Null(FieldType::DATE);
	}
	date_t result;
	if (!Date::TryFromDate(parts[0], parts[1], parts[2], result)) {
		throw InvalidFieldDataException("Field \"%s\" contains \"%s\", which is not a valid calendar date",
		                                field.name, StringUtil::EscapeBytes(data, length));
	}
	return FieldValue::DATE(result);
}

FieldValue FieldDecoder::DecodeLogical(const_data_ptr_t data, const FieldDescriptor &field) {
	switch (data[0]) {
	case 'T':
	case 't':
	case 'Y':
	case 'y':
		return FieldValue::LOGICAL(true);
	case 'F':
	case 'f':
	case 'N':
	case 'n':
		return FieldValue::LOGICAL(false);
	case '?':
	case ' ':
	case '\0':
		return FieldValue::Null(FieldType::LOGICAL);
	default:
		throw InvalidFieldDataException("Field \"%s\" contains %s, which is not a logical value", field.name,
		                                StringUtil::ByteToString(data[0]));
	}
}

FieldValue FieldDecoder::DecodeMemo(const_data_ptr_t data, idx_t length, const FieldDescriptor &field) {
	if (IsBlank(data, length)) {
		return FieldValue::Null(FieldType::MEMO);
	}
	if (length == 4) {
		// Visual FoxPro stores the block index as a binary integer
		return FieldValue::MEMO(Load<uint32_t>(data));
	}
	auto text = TrimmedString(data, length);
	uint64_t block_index = 0;
	for (auto c : text) {
		if (!StringUtil::CharacterIsDigit(c)) {
			throw InvalidFieldDataException("Field \"%s\" contains \"%s\", which is not a memo block index",
			                                field.name, StringUtil::EscapeBytes(data, length));
		}
		block_index = block_index * 10 + uint64_t(c - '0');
		if (block_index > std::numeric_limits<uint32_t>::max()) {
			throw InvalidFieldDataException("Memo block index \"%s\" of field \"%s\" is out of range", text,
			                                field.name);
		}
	}
	return FieldValue::MEMO(uint32_t(block_index));
}

FieldValue FieldDecoder::DecodeDatetime(const_data_ptr_t data, const FieldDescriptor &field) {
	auto julian_day = Load<int32_t>(data);
	auto milliseconds = Load<int32_t>(data + 4);
	if (julian_day == 0 && milliseconds == 0) {
		return FieldValue::Null(FieldType::DATETIME);
	}
	if (julian_day <= 0 || milliseconds < 0 || milliseconds >= Interval::MSECS_PER_DAY) {
		throw InvalidFieldDataException("Field \"%s\" contains julian day %lld and time %lld ms, which is not a "
		                                "valid timestamp",
		                                field.name, int64_t(julian_day), int64_t(milliseconds));
	}
	auto date = Date::FromJulianDay(julian_day);
	return FieldValue::DATETIME(Timestamp::FromDatetime(date, int64_t(milliseconds) * Interval::MICROS_PER_MSEC));
}

} // namespace dbase
