#include "dbase/common/types/timestamp.hpp"

#include "dbase/common/string_util.hpp"

#include <chrono>

namespace dbase {

static_assert(sizeof(timestamp_t) == sizeof(int64_t), "timestamp_t was padded");

timestamp_t Timestamp::FromDatetime(date_t date, int64_t micros_of_day) {
	return timestamp_t(int64_t(date.days) * Interval::MICROS_PER_DAY + micros_of_day);
}

void Timestamp::Convert(timestamp_t timestamp, date_t &out_date, int64_t &out_micros_of_day) {
	int64_t days = timestamp.value / Interval::MICROS_PER_DAY;
	int64_t micros = timestamp.value % Interval::MICROS_PER_DAY;
	if (micros < 0) {
		// round towards negative infinity
		days--;
		micros += Interval::MICROS_PER_DAY;
	}
	out_date = date_t(int32_t(days));
	out_micros_of_day = micros;
}

date_t Timestamp::GetDate(timestamp_t timestamp) {
	date_t result;
	int64_t micros;
	Convert(timestamp, result, micros);
	return result;
}

timestamp_t Timestamp::GetCurrentTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto epoch_us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
	return timestamp_t(static_cast<int64_t>(epoch_us));
}

string Timestamp::ToString(timestamp_t timestamp) {
	date_t date;
	int64_t micros;
	Convert(timestamp, date, micros);

	auto hours = micros / Interval::MICROS_PER_HOUR;
	micros -= hours * Interval::MICROS_PER_HOUR;
	auto minutes = micros / Interval::MICROS_PER_MINUTE;
	micros -= minutes * Interval::MICROS_PER_MINUTE;
	auto seconds = micros / Interval::MICROS_PER_SEC;
	micros -= seconds * Interval::MICROS_PER_SEC;
	auto millis = micros / Interval::MICROS_PER_MSEC;

	auto result = Date::ToString(date) + StringUtil::Format(" %02d:%02d:%02d", hours, minutes, seconds);
	if (millis != 0) {
		result += StringUtil::Format(".%03d", millis);
	}
	return result;
}

} // namespace dbase
