#include "dbase/common/types/date.hpp"

#include "dbase/common/exception.hpp"
#include "dbase/common/string_util.hpp"

namespace dbase {

static_assert(sizeof(date_t) == sizeof(int32_t), "date_t was padded");

const int32_t Date::NORMAL_DAYS[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
const int32_t Date::LEAP_DAYS[] = {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

bool Date::IsLeapYear(int32_t year) {
	return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

bool Date::IsValid(int32_t year, int32_t month, int32_t day) {
	if (month < 1 || month > 12) {
		return false;
	}
	if (day < 1) {
		return false;
	}
	return day <= MonthDays(year, month);
}

int32_t Date::MonthDays(int32_t year, int32_t month) {
	D_ASSERT(month >= 1 && month <= 12);
	return IsLeapYear(year) ? Date::LEAP_DAYS[month] : Date::NORMAL_DAYS[month];
}

bool Date::TryFromDate(int32_t year, int32_t month, int32_t day, date_t &result) {
	if (!Date::IsValid(year, month, day)) {
		return false;
	}
	// shift the year so that it starts in March: the leap day then falls at the end of the shifted year
	int64_t y = int64_t(year) - (month <= 2 ? 1 : 0);
	int64_t era = (y >= 0 ? y : y - 399) / 400;
	int64_t year_of_era = y - era * 400;
	int64_t day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
	int64_t day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
	result = date_t(int32_t(era * 146097 + day_of_era - 719468));
	return true;
}

date_t Date::FromDate(int32_t year, int32_t month, int32_t day) {
	date_t result;
	if (!Date::TryFromDate(year, month, day, result)) {
		throw InvalidInputException("Date out of range: %d-%d-%d", year, month, day);
	}
	return result;
}

void Date::Convert(date_t d, int32_t &year, int32_t &month, int32_t &day) {
	int64_t z = int64_t(d.days) + 719468;
	int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	int64_t day_of_era = z - era * 146097;
	int64_t year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
	int64_t day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
	int64_t shifted_month = (5 * day_of_year + 2) / 153;
	day = int32_t(day_of_year - (153 * shifted_month + 2) / 5 + 1);
	month = int32_t(shifted_month < 10 ? shifted_month + 3 : shifted_month - 9);
	year = int32_t(year_of_era + era * 400 + (month <= 2 ? 1 : 0));
}

string Date::ToString(date_t date) {
	int32_t year, month, day;
	Date::Convert(date, year, month, day);
	return StringUtil::Format("%04d-%02d-%02d", year, month, day);
}

date_t Date::FromJulianDay(int32_t julian_day) {
	return date_t(julian_day - EPOCH_JULIAN_DAY);
}

int32_t Date::ExtractJulianDay(date_t date) {
	return date.days + EPOCH_JULIAN_DAY;
}

} // namespace dbase
