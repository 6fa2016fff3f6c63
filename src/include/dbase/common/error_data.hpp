//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/error_data.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/exception.hpp"

namespace dbase {

//! An error captured as a value, so that it can be handed to a caller instead of being thrown
class ErrorData {
public:
	//! Not initialized, default constructor
	ErrorData();
	//! From std::exception
	ErrorData(const std::exception &ex); // NOLINT: allow implicit construction from exception
	//! From a raw string and exception type
	ErrorData(ExceptionType type, const string &raw_message);
	//! From a raw string
	explicit ErrorData(const string &raw_message);

public:
	//! Throw the error
	[[noreturn]] void Throw(const string &prepended_message = "") const;
	//! Get the internal exception type of the error
	const ExceptionType &Type() const;
	//! Used in clients like C-API, creates the final message and returns a reference to it
	const string &Message() const {
		return final_message;
	}
	const string &RawMessage() const {
		return raw_message;
	}
	bool operator==(const ErrorData &other) const;

	inline bool HasError() const {
		return initialized;
	}

private:
	//! Whether this ErrorData contains an exception or not
	bool initialized;
	//! The ExceptionType of the preserved exception
	ExceptionType type;
	//! The message the exception was constructed with (does not contain the Exception Type)
	string raw_message;
	//! The final message (stored in the preserved error for compatibility reasons with C-API)
	string final_message;

private:
	string ConstructFinalMessage() const;
};

} // namespace dbase
