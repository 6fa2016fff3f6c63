//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"

#include <stdexcept>

namespace dbase {

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,                    // invalid type
	IO = 1,                         // IO exception
	MALFORMED_HEADER = 2,           // the fixed file header is inconsistent
	MALFORMED_FIELD_DESCRIPTOR = 3, // a field descriptor could not be decoded
	INVALID_FIELD_DATA = 4,         // the bytes of a field do not match its declared type
	UNEXPECTED_TERMINATOR = 5,      // the descriptor table is not closed by the terminator byte
	INVALID_INPUT = 6,              // invalid input / api misuse
	INVALID_CONFIGURATION = 7,      // invalid configuration option or value
	NOT_IMPLEMENTED = 8,            // method not implemented
	INTERNAL = 9                    // internal error
};

enum class ExceptionFormatValueType : uint8_t {
	FORMAT_VALUE_TYPE_DOUBLE,
	FORMAT_VALUE_TYPE_INTEGER,
	FORMAT_VALUE_TYPE_STRING
};

struct ExceptionFormatValue {
	ExceptionFormatValue(double dbl_val);   // NOLINT
	ExceptionFormatValue(int64_t int_val);  // NOLINT
	ExceptionFormatValue(string str_val);   // NOLINT

	ExceptionFormatValueType type;

	double dbl_val = 0;
	int64_t int_val = 0;
	string str_val;

public:
	template <class T>
	static ExceptionFormatValue CreateFormatValue(const T &value) {
		return int64_t(value);
	}
	static string Format(const string &msg, std::vector<ExceptionFormatValue> &values);
};

template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const float &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const double &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const string &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const char *const &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(char *const &value);

class Exception : public std::runtime_error {
public:
	Exception(ExceptionType exception_type, const string &message);

	ExceptionType type;
	string raw_message;

public:
	ExceptionType GetType() const {
		return type;
	}
	const string &RawMessage() const {
		return raw_message;
	}

	static string ExceptionTypeToString(ExceptionType type);
	static ExceptionType StringToExceptionType(const string &type);

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		const std::size_t num_args = sizeof...(ARGS);
		if (num_args == 0) {
			return msg;
		}
		std::vector<ExceptionFormatValue> values;
		return ConstructMessageRecursive(msg, values, params...);
	}

	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values);

	template <class T, typename... ARGS>
	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values, T param,
	                                        ARGS... params) {
		values.push_back(ExceptionFormatValue::CreateFormatValue<T>(param));
		return ConstructMessageRecursive(msg, values, params...);
	}
};

//===--------------------------------------------------------------------===//
// Exception derived classes
//===--------------------------------------------------------------------===//

class IOException : public Exception {
public:
	explicit IOException(const string &msg);

	template <typename... ARGS>
	explicit IOException(const string &msg, ARGS... params) : IOException(ConstructMessage(msg, params...)) {
	}
};

class MalformedHeaderException : public Exception {
public:
	explicit MalformedHeaderException(const string &msg);

	template <typename... ARGS>
	explicit MalformedHeaderException(const string &msg, ARGS... params)
	    : MalformedHeaderException(ConstructMessage(msg, params...)) {
	}
};

class MalformedFieldDescriptorException : public Exception {
public:
	explicit MalformedFieldDescriptorException(const string &msg);

	template <typename... ARGS>
	explicit MalformedFieldDescriptorException(const string &msg, ARGS... params)
	    : MalformedFieldDescriptorException(ConstructMessage(msg, params...)) {
	}
};

class InvalidFieldDataException : public Exception {
public:
	explicit InvalidFieldDataException(const string &msg);

	template <typename... ARGS>
	explicit InvalidFieldDataException(const string &msg, ARGS... params)
	    : InvalidFieldDataException(ConstructMessage(msg, params...)) {
	}
};

class UnexpectedTerminatorException : public Exception {
public:
	explicit UnexpectedTerminatorException(data_t terminator);
};

class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

class InvalidConfigurationException : public Exception {
public:
	explicit InvalidConfigurationException(const string &msg);

	template <typename... ARGS>
	explicit InvalidConfigurationException(const string &msg, ARGS... params)
	    : InvalidConfigurationException(ConstructMessage(msg, params...)) {
	}
};

class NotImplementedException : public Exception {
public:
	explicit NotImplementedException(const string &msg);

	template <typename... ARGS>
	explicit NotImplementedException(const string &msg, ARGS... params)
	    : NotImplementedException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

} // namespace dbase
