//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/types/date.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"

namespace dbase {

//! Type used to represent dates (days since 1970-01-01)
struct date_t { // NOLINT
	int32_t days;

	date_t() = default;
	explicit inline date_t(int32_t days_p) : days(days_p) {
	}

	inline bool operator==(const date_t &rhs) const {
		return days == rhs.days;
	}
	inline bool operator!=(const date_t &rhs) const {
		return days != rhs.days;
	}
	inline bool operator<(const date_t &rhs) const {
		return days < rhs.days;
	}
};

//! The Date class is a static class that holds helper functions for the date type.
class Date {
public:
	static const int32_t NORMAL_DAYS[13];
	static const int32_t LEAP_DAYS[13];
	//! The Julian day number of 1970-01-01
	static constexpr const int32_t EPOCH_JULIAN_DAY = 2440588;

public:
	//! Create a date from the given year, month and day; throws if the date is not valid
	static date_t FromDate(int32_t year, int32_t month, int32_t day);
	//! Try to create a date, returns false if the year/month/day triplet does not denote a valid date
	static bool TryFromDate(int32_t year, int32_t month, int32_t day, date_t &result);
	//! Extract the year, month and day from a given date object
	static void Convert(date_t date, int32_t &out_year, int32_t &out_month, int32_t &out_day);
	//! Convert a date object to a string in the format "YYYY-MM-DD"
	static string ToString(date_t date);

	//! Returns true if (year) is a leap year, and false otherwise
	static bool IsLeapYear(int32_t year);
	//! Returns true if the specified (year, month, day) combination is a valid date
	static bool IsValid(int32_t year, int32_t month, int32_t day);
	//! Returns the number of days in the given month of the given year
	static int32_t MonthDays(int32_t year, int32_t month);

	//! Converts a Julian day number (as stored by FoxPro datetime fields) into a date
	static date_t FromJulianDay(int32_t julian_day);
	static int32_t ExtractJulianDay(date_t date);
};

} // namespace dbase
