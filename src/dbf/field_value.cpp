#include "dbase/dbf/field_value.hpp"

#include "dbase/common/exception.hpp"
#include "dbase/common/string_util.hpp"

#include "fmt/format.h"

#include <ostream>

namespace dbase {

constexpr const int64_t FieldValue::CURRENCY_SCALE;

FieldValue::FieldValue() : FieldValue(FieldType::CHARACTER) {
}

FieldValue::FieldValue(FieldType type) : type_(type), is_null(true) {
	value_.currency = 0;
}

FieldValue FieldValue::Null(FieldType type) {
	return FieldValue(type);
}

FieldValue FieldValue::CHARACTER(string value) {
	FieldValue result(FieldType::CHARACTER);
	result.str_value = std::move(value);
	result.is_null = false;
	return result;
}

FieldValue FieldValue::NUMERIC(double value) {
	FieldValue result(FieldType::NUMERIC);
	result.value_.dbl = value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::FLOAT(double value) {
	FieldValue result(FieldType::FLOAT);
	result.value_.dbl = value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::DATE(date_t value) {
	FieldValue result(FieldType::DATE);
	result.value_.date = value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::DATE(int32_t year, int32_t month, int32_t day) {
	return FieldValue::DATE(Date::FromDate(year, month, day));
}

FieldValue FieldValue::LOGICAL(bool value) {
	FieldValue result(FieldType::LOGICAL);
	result.value_.boolean = value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::MEMO(uint32_t block_index) {
	FieldValue result(FieldType::MEMO);
	result.value_.memo = block_index;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::INTEGER(int32_t value) {
	FieldValue result(FieldType::INTEGER);
	result.value_.integer = value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::DOUBLE(double value) {
	FieldValue result(FieldType::DOUBLE);
	result.value_.dbl = value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::CURRENCY(int64_t scaled_value) {
	FieldValue result(FieldType::CURRENCY);
	result.value_.currency = scaled_value;
	result.is_null = false;
	return result;
}

FieldValue FieldValue::DATETIME(timestamp_t value) {
	FieldValue result(FieldType::DATETIME);
	result.value_.timestamp = value;
	result.is_null = false;
	return result;
}

void FieldValue::ThrowTypeMismatch(const char *requested) const {
	if (IsNull()) {
		throw InvalidInputException("Cannot get a %s from a NULL %s value", requested, FieldTypeToString(type_));
	}
	throw InvalidInputException("Cannot get a %s from a %s value", requested, FieldTypeToString(type_));
}

template <>
string FieldValue::GetValue() const {
	if (IsNull() || type_ != FieldType::CHARACTER) {
		ThrowTypeMismatch("string");
	}
	return str_value;
}

template <>
bool FieldValue::GetValue() const {
	if (IsNull() || type_ != FieldType::LOGICAL) {
		ThrowTypeMismatch("bool");
	}
	return value_.boolean;
}

template <>
int32_t FieldValue::GetValue() const {
	if (IsNull() || type_ != FieldType::INTEGER) {
		ThrowTypeMismatch("int32_t");
	}
	return value_.integer;
}

template <>
uint32_t FieldValue::GetValue() const {
	if (IsNull() || type_ != FieldType::MEMO) {
		ThrowTypeMismatch("uint32_t");
	}
	return value_.memo;
}

template <>
int64_t FieldValue::GetValue() const {
	if (IsNull()) {
		ThrowTypeMismatch("int64_t");
	}
	switch (type_) {
	case FieldType::INTEGER:
		return value_.integer;
	case FieldType::MEMO:
		return value_.memo;
	case FieldType::CURRENCY:
		return value_.currency;
	default:
		ThrowTypeMismatch("int64_t");
	}
	return 0;
}

template <>
double FieldValue::GetValue() const {
	if (IsNull()) {
		ThrowTypeMismatch("double");
	}
	switch (type_) {
	case FieldType::NUMERIC:
	case FieldType::FLOAT:
	case FieldType::DOUBLE:
		return value_.dbl;
	case FieldType::INTEGER:
		return value_.integer;
	case FieldType::CURRENCY:
		return double(value_.currency) / double(CURRENCY_SCALE);
	default:
		ThrowTypeMismatch("double");
	}
	return 0;
}

template <>
date_t FieldValue::GetValue() const {
	if (IsNull()) {
		ThrowTypeMismatch("date_t");
	}
	switch (type_) {
	case FieldType::DATE:
		return value_.date;
	case FieldType::DATETIME:
		return Timestamp::GetDate(value_.timestamp);
	default:
		ThrowTypeMismatch("date_t");
	}
	return date_t(0);
}

template <>
timestamp_t FieldValue::GetValue() const {
	if (IsNull()) {
		ThrowTypeMismatch("timestamp_t");
	}
	switch (type_) {
	case FieldType::DATETIME:
		return value_.timestamp;
	case FieldType::DATE:
		return Timestamp::FromDatetime(value_.date, 0);
	default:
		ThrowTypeMismatch("timestamp_t");
	}
	return timestamp_t(0);
}

static string CurrencyToString(int64_t scaled_value) {
	// avoid negating INT64_MIN by working on the unsigned magnitude
	uint64_t magnitude = scaled_value < 0 ? uint64_t(0) - uint64_t(scaled_value) : uint64_t(scaled_value);
	auto scale = uint64_t(FieldValue::CURRENCY_SCALE);
	return fmt::format("{}{}.{:04d}", scaled_value < 0 ? "-" : "", magnitude / scale, magnitude % scale);
}

string FieldValue::ToString() const {
	if (IsNull()) {
		return "NULL";
	}
	switch (type_) {
	case FieldType::CHARACTER:
		return str_value;
	case FieldType::NUMERIC:
	case FieldType::FLOAT:
	case FieldType::DOUBLE:
		return fmt::format("{}", value_.dbl);
	case FieldType::DATE:
		return Date::ToString(value_.date);
	case FieldType::LOGICAL:
		return value_.boolean ? "true" : "false";
	case FieldType::MEMO:
		return std::to_string(value_.memo);
	case FieldType::INTEGER:
		return std::to_string(value_.integer);
	case FieldType::CURRENCY:
		return CurrencyToString(value_.currency);
	case FieldType::DATETIME:
		return Timestamp::ToString(value_.timestamp);
	default:
		throw InternalException("Unimplemented type for FieldValue::ToString: %s", FieldTypeToString(type_));
	}
}

bool FieldValue::operator==(const FieldValue &rhs) const {
	if (type_ != rhs.type_ || is_null != rhs.is_null) {
		return false;
	}
	if (is_null) {
		return true;
	}
	switch (type_) {
	case FieldType::CHARACTER:
		return str_value == rhs.str_value;
	case FieldType::NUMERIC:
	case FieldType::FLOAT:
	case FieldType::DOUBLE:
		return value_.dbl == rhs.value_.dbl;
	case FieldType::DATE:
		return value_.date == rhs.value_.date;
	case FieldType::LOGICAL:
		return value_.boolean == rhs.value_.boolean;
	case FieldType::MEMO:
		return value_.memo == rhs.value_.memo;
	case FieldType::INTEGER:
		return value_.integer == rhs.value_.integer;
	case FieldType::CURRENCY:
		return value_.currency == rhs.value_.currency;
	case FieldType::DATETIME:
		return value_.timestamp == rhs.value_.timestamp;
	default:
		return false;
	}
}

bool FieldValue::operator!=(const FieldValue &rhs) const {
	return !(*this == rhs);
}

std::ostream &operator<<(std::ostream &out, const FieldValue &val) {
	out << val.ToString();
	return out;
}

} // namespace dbase
