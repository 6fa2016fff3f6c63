#include "dbase/common/exception.hpp"

#include "dbase/common/string_util.hpp"

namespace dbase {

Exception::Exception(ExceptionType exception_type, const string &message)
    : std::runtime_error(message), type(exception_type), raw_message(message) {
}

string Exception::ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values) {
#ifdef DEBUG
	// Verify that we have the required amount of values for the message
	idx_t parameter_count = 0;
	for (idx_t i = 0; i + 1 < msg.size(); i++) {
		if (msg[i] != '%') {
			continue;
		}
		if (msg[i + 1] == '%') {
			i++;
			continue;
		}
		parameter_count++;
	}
	if (parameter_count != values.size()) {
		throw InternalException("Primary exception: %s\nSecondary exception in ConstructMessageRecursive: Expected %d "
		                        "parameters, received %d",
		                        msg.c_str(), parameter_count, values.size());
	}

#endif
	return ExceptionFormatValue::Format(msg, values);
}

struct ExceptionEntry {
	ExceptionType type;
	char text[48];
};

static constexpr ExceptionEntry EXCEPTION_MAP[] = {
    {ExceptionType::INVALID, "Invalid"},
    {ExceptionType::IO, "IO"},
    {ExceptionType::MALFORMED_HEADER, "Malformed Header"},
    {ExceptionType::MALFORMED_FIELD_DESCRIPTOR, "Malformed Field Descriptor"},
    {ExceptionType::INVALID_FIELD_DATA, "Invalid Field Data"},
    {ExceptionType::UNEXPECTED_TERMINATOR, "Unexpected Terminator"},
    {ExceptionType::INVALID_INPUT, "Invalid Input"},
    {ExceptionType::INVALID_CONFIGURATION, "Invalid Configuration"},
    {ExceptionType::NOT_IMPLEMENTED, "Not implemented"},
    {ExceptionType::INTERNAL, "INTERNAL"}};

string Exception::ExceptionTypeToString(ExceptionType type) {
	for (auto &e : EXCEPTION_MAP) {
		if (e.type == type) {
			return e.text;
		}
	}
	return "Unknown";
}

ExceptionType Exception::StringToExceptionType(const string &type) {
	for (auto &e : EXCEPTION_MAP) {
		if (e.text == type) {
			return e.type;
		}
	}
	return ExceptionType::INVALID;
}

IOException::IOException(const string &msg) : Exception(ExceptionType::IO, msg) {
}

MalformedHeaderException::MalformedHeaderException(const string &msg)
    : Exception(ExceptionType::MALFORMED_HEADER, msg) {
}

MalformedFieldDescriptorException::MalformedFieldDescriptorException(const string &msg)
    : Exception(ExceptionType::MALFORMED_FIELD_DESCRIPTOR, msg) {
}

InvalidFieldDataException::InvalidFieldDataException(const string &msg)
    : Exception(ExceptionType::INVALID_FIELD_DATA, msg) {
}

UnexpectedTerminatorException::UnexpectedTerminatorException(data_t terminator)
    : Exception(ExceptionType::UNEXPECTED_TERMINATOR,
                ConstructMessage("Expected the field descriptor table to be terminated by 0x0D, found %s",
                                 StringUtil::ByteToString(terminator))) {
}

InvalidInputException::InvalidInputException(const string &msg) : Exception(ExceptionType::INVALID_INPUT, msg) {
}

InvalidConfigurationException::InvalidConfigurationException(const string &msg)
    : Exception(ExceptionType::INVALID_CONFIGURATION, msg) {
}

NotImplementedException::NotImplementedException(const string &msg) : Exception(ExceptionType::NOT_IMPLEMENTED, msg) {
}

InternalException::InternalException(const string &msg) : Exception(ExceptionType::INTERNAL, msg) {
}

} // namespace dbase
