#include "dbase/common/error_data.hpp"

#include "dbase/common/string_util.hpp"

namespace dbase {

ErrorData::ErrorData() : initialized(false), type(ExceptionType::INVALID) {
}

ErrorData::ErrorData(const std::exception &ex) : initialized(true), type(ExceptionType::INVALID) {
	auto dbase_ex = dynamic_cast<const Exception *>(&ex);
	if (dbase_ex) {
		type = dbase_ex->GetType();
		raw_message = dbase_ex->RawMessage();
	} else if (string(ex.what()) == std::bad_alloc().what()) {
		raw_message = "Allocation failure";
	} else {
		raw_message = ex.what();
	}
	final_message = ConstructFinalMessage();
}

ErrorData::ErrorData(ExceptionType type, const string &message)
    : initialized(true), type(type), raw_message(message), final_message(ConstructFinalMessage()) {
}

ErrorData::ErrorData(const string &message)
    : initialized(true), type(ExceptionType::INVALID), raw_message(message), final_message(ConstructFinalMessage()) {
}

string ErrorData::ConstructFinalMessage() const {
	return Exception::ExceptionTypeToString(type) + " Error: " + raw_message;
}

void ErrorData::Throw(const string &prepended_message) const {
	if (!initialized) {
		throw InternalException("Attempting to throw an ErrorData that does not hold an error");
	}
	throw Exception(type, prepended_message + raw_message);
}

const ExceptionType &ErrorData::Type() const {
	D_ASSERT(initialized);
	return this->type;
}

bool ErrorData::operator==(const ErrorData &other) const {
	if (initialized != other.initialized) {
		return false;
	}
	if (type != other.type) {
		return false;
	}
	return raw_message == other.raw_message;
}

} // namespace dbase
