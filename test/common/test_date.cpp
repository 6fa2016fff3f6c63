#include "catch.hpp"
#include "dbase/common/exception.hpp"
#include "dbase/common/types/date.hpp"
#include "dbase/common/types/timestamp.hpp"

using namespace dbase;

TEST_CASE("Test date conversion", "[date]") {
	REQUIRE(Date::FromDate(1970, 1, 1).days == 0);
	REQUIRE(Date::FromDate(1969, 12, 31).days == -1);
	REQUIRE(Date::FromDate(2000, 3, 1).days == 11017);

	int32_t year, month, day;
	Date::Convert(Date::FromDate(2024, 2, 29), year, month, day);
	REQUIRE(year == 2024);
	REQUIRE(month == 2);
	REQUIRE(day == 29);

	REQUIRE(Date::ToString(Date::FromDate(1999, 12, 31)) == "1999-12-31");
	REQUIRE(Date::ToString(Date::FromDate(5, 1, 2)) == "0005-01-02");
}

TEST_CASE("Test date validation", "[date]") {
	REQUIRE(Date::IsLeapYear(2000));
	REQUIRE(Date::IsLeapYear(2024));
	REQUIRE_FALSE(Date::IsLeapYear(1900));
	REQUIRE_FALSE(Date::IsLeapYear(2023));

	REQUIRE(Date::IsValid(2024, 2, 29));
	REQUIRE_FALSE(Date::IsValid(2023, 2, 29));
	REQUIRE_FALSE(Date::IsValid(2023, 13, 1));
	REQUIRE_FALSE(Date::IsValid(2023, 4, 31));
	REQUIRE_FALSE(Date::IsValid(2023, 0, 10));
	REQUIRE(Date::MonthDays(2023, 2) == 28);

	date_t result;
	REQUIRE_FALSE(Date::TryFromDate(2023, 2, 30, result));
	REQUIRE_THROWS_AS(Date::FromDate(2023, 2, 30), InvalidInputException);
}

TEST_CASE("Test julian days", "[date]") {
	REQUIRE(Date::FromJulianDay(Date::EPOCH_JULIAN_DAY).days == 0);
	REQUIRE(Date::ToString(Date::FromJulianDay(2451545)) == "2000-01-01");
	REQUIRE(Date::ExtractJulianDay(Date::FromDate(2000, 1, 1)) == 2451545);
}

TEST_CASE("Test timestamp conversion", "[timestamp]") {
	auto date = Date::FromDate(2001, 9, 9);
	auto ts = Timestamp::FromDatetime(date, 1 * Interval::MICROS_PER_HOUR + 46 * Interval::MICROS_PER_MINUTE +
	                                            40 * Interval::MICROS_PER_SEC);
	REQUIRE(Timestamp::ToString(ts) == "2001-09-09 01:46:40");
	REQUIRE(Timestamp::GetDate(ts) == date);

	auto with_millis = Timestamp::FromDatetime(date, 250 * Interval::MICROS_PER_MSEC);
	REQUIRE(Timestamp::ToString(with_millis) == "2001-09-09 00:00:00.250");

	// before the epoch
	auto before = Timestamp::FromDatetime(Date::FromDate(1969, 12, 31), 23 * Interval::MICROS_PER_HOUR);
	date_t out_date;
	int64_t out_micros;
	Timestamp::Convert(before, out_date, out_micros);
	REQUIRE(out_date == Date::FromDate(1969, 12, 31));
	REQUIRE(out_micros == 23 * Interval::MICROS_PER_HOUR);
}
