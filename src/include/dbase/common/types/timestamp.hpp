//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/types/timestamp.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/types/date.hpp"

namespace dbase {

//! Type used to represent timestamps (microseconds since 1970-01-01 00:00:00)
struct timestamp_t { // NOLINT
	int64_t value;

	timestamp_t() = default;
	explicit inline timestamp_t(int64_t value_p) : value(value_p) {
	}

	inline bool operator==(const timestamp_t &rhs) const {
		return value == rhs.value;
	}
	inline bool operator!=(const timestamp_t &rhs) const {
		return value != rhs.value;
	}
	inline bool operator<(const timestamp_t &rhs) const {
		return value < rhs.value;
	}
};

struct Interval {
	static constexpr const int64_t MICROS_PER_MSEC = 1000;
	static constexpr const int64_t MICROS_PER_SEC = MICROS_PER_MSEC * 1000;
	static constexpr const int64_t MICROS_PER_MINUTE = MICROS_PER_SEC * 60;
	static constexpr const int64_t MICROS_PER_HOUR = MICROS_PER_MINUTE * 60;
	static constexpr const int64_t MICROS_PER_DAY = MICROS_PER_HOUR * 24;
	static constexpr const int64_t MSECS_PER_DAY = MICROS_PER_DAY / MICROS_PER_MSEC;
};

//! The Timestamp class is a static class that holds helper functions for the timestamp type.
class Timestamp {
public:
	//! Create a timestamp from a date and the microseconds elapsed since midnight
	static timestamp_t FromDatetime(date_t date, int64_t micros_of_day);
	//! Extract the date and the microseconds since midnight from a timestamp
	static void Convert(timestamp_t timestamp, date_t &out_date, int64_t &out_micros_of_day);
	static date_t GetDate(timestamp_t timestamp);
	//! The current wall clock time
	static timestamp_t GetCurrentTimestamp();
	//! Convert a timestamp object to a string in the format "YYYY-MM-DD hh:mm:ss[.zzz]"
	static string ToString(timestamp_t timestamp);
};

} // namespace dbase
