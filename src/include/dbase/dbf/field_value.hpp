//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/dbf/field_value.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/common/types/date.hpp"
#include "dbase/common/types/timestamp.hpp"
#include "dbase/dbf/field_type.hpp"

#include <iosfwd>

namespace dbase {

//! The decoded value of a single field of a record.
//! Memo, general and picture fields (and dBase IV binary memo fields) all produce MEMO values holding the block index.
class FieldValue {
public:
	//! Create an empty NULL value of CHARACTER type
	FieldValue();
	//! Create a NULL value of the specified type
	explicit FieldValue(FieldType type);

	FieldValue(const FieldValue &other) = default;
	FieldValue(FieldValue &&other) noexcept = default;
	FieldValue &operator=(const FieldValue &other) = default;
	FieldValue &operator=(FieldValue &&other) noexcept = default;

	inline FieldType type() const { // NOLINT
		return type_;
	}
	inline bool IsNull() const {
		return is_null;
	}

	//! Create a NULL value of the specified type
	static FieldValue Null(FieldType type);
	static FieldValue CHARACTER(string value);
	static FieldValue NUMERIC(double value);
	static FieldValue FLOAT(double value);
	static FieldValue DATE(date_t value);
	static FieldValue DATE(int32_t year, int32_t month, int32_t day);
	static FieldValue LOGICAL(bool value);
	static FieldValue MEMO(uint32_t block_index);
	static FieldValue INTEGER(int32_t value);
	static FieldValue DOUBLE(double value);
	//! A currency amount, scaled by CURRENCY_SCALE (i.e. 12.5 is stored as 125000)
	static FieldValue CURRENCY(int64_t scaled_value);
	static FieldValue DATETIME(timestamp_t value);

	//! Returns the value as T; throws an InvalidInputException if the value is NULL or has an incompatible type
	template <class T>
	T GetValue() const;

	//! Convert the value to a string, "NULL" for NULL values
	string ToString() const;

	bool operator==(const FieldValue &rhs) const;
	bool operator!=(const FieldValue &rhs) const;

	friend std::ostream &operator<<(std::ostream &out, const FieldValue &val);

public:
	static constexpr const int64_t CURRENCY_SCALE = 10000;

private:
	void ThrowTypeMismatch(const char *requested) const;

	FieldType type_; // NOLINT
	bool is_null;

	union Val {
		bool boolean;
		int32_t integer;
		uint32_t memo;
		int64_t currency;
		double dbl;
		date_t date;
		timestamp_t timestamp;
	} value_; // NOLINT

	string str_value;
};

template <>
string FieldValue::GetValue() const;
template <>
bool FieldValue::GetValue() const;
template <>
int32_t FieldValue::GetValue() const;
template <>
uint32_t FieldValue::GetValue() const;
template <>
int64_t FieldValue::GetValue() const;
template <>
double FieldValue::GetValue() const;
template <>
date_t FieldValue::GetValue() const;
template <>
timestamp_t FieldValue::GetValue() const;

} // namespace dbase
