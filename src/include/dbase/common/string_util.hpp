//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/string_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/exception.hpp"

namespace dbase {

//! String Utility Functions
class StringUtil {
public:
	static bool CharacterIsSpace(char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
	}
	static bool CharacterIsDigit(char c) {
		return c >= '0' && c <= '9';
	}
	static char CharacterToLower(char c) {
		if (c >= 'A' && c <= 'Z') {
			return c - ('A' - 'a');
		}
		return c;
	}
	static char CharacterToUpper(char c) {
		if (c >= 'a' && c <= 'z') {
			return c - ('a' - 'A');
		}
		return c;
	}

	//! Returns true if the needle string exists in the haystack
	static bool Contains(const string &haystack, const string &needle);

	//! Split the input string based on newline char
	static vector<string> Split(const string &str, char delimiter);

	//! Join multiple strings into one string. Components are concatenated by the given separator
	static string Join(const vector<string> &input, const string &separator);

	//! Convert a string to uppercase
	static string Upper(const string &str);

	//! Convert a string to lowercase
	static string Lower(const string &str);

	//! Format a string using printf semantics
	template <typename... ARGS>
	static string Format(const string fmt_str, ARGS... params) {
		return Exception::ConstructMessage(fmt_str, params...);
	}

	//! Remove the whitespace char in the left end of the string
	static void LTrim(string &str);
	//! Remove the whitespace char in the right end of the string
	static void RTrim(string &str);
	//! Remove the all chars from chars_to_trim char in the right end of the string
	static void RTrim(string &str, const string &chars_to_trim);
	//! Remove the whitespace char in the left and right end of the string
	static void Trim(string &str);

	//! Renders the bytes as a printable string, escaping everything outside of printable ASCII as \xNN
	static string EscapeBytes(const_data_ptr_t data, idx_t size);

	//! Parses a boolean from the usual textual spellings (true/false, 1/0, on/off, yes/no)
	static bool TryParseBoolean(const string &str, bool &result);

	//! Returns a human-readable version of a byte (printable ASCII, or its hex value)
	static string ByteToString(data_t byte);
};

} // namespace dbase
