#include "dbase/common/string_util.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dbase {

bool StringUtil::Contains(const string &haystack, const string &needle) {
	return (haystack.find(needle) != string::npos);
}

void StringUtil::LTrim(string &str) {
	auto it = str.begin();
	while (it != str.end() && CharacterIsSpace(*it)) {
		it++;
	}
	str.erase(str.begin(), it);
}

// Remove trailing '\0', ' ', '\f', '\n', '\r', '\t', '\v'; bytes >= 0x80 are kept
void StringUtil::RTrim(string &str) {
	str.erase(find_if(str.rbegin(), str.rend(), [](char ch) { return ch != '\0' && !CharacterIsSpace(ch); }).base(),
	          str.end());
}

void StringUtil::RTrim(string &str, const string &chars_to_trim) {
	str.erase(find_if(str.rbegin(), str.rend(),
	                  [&chars_to_trim](char ch) { return chars_to_trim.find(ch) == string::npos; })
	              .base(),
	          str.end());
}

void StringUtil::Trim(string &str) {
	StringUtil::LTrim(str);
	StringUtil::RTrim(str);
}

vector<string> StringUtil::Split(const string &str, char delimiter) {
	std::stringstream ss(str);
	vector<string> lines;
	string temp;
	while (getline(ss, temp, delimiter)) {
		lines.push_back(temp);
	}
	return (lines);
}

string StringUtil::Join(const vector<string> &input, const string &separator) {
	string result;
	for (idx_t i = 0; i < input.size(); i++) {
		if (i > 0) {
			result += separator;
		}
		result += input[i];
	}
	return result;
}

string StringUtil::Upper(const string &str) {
	string copy(str);
	transform(copy.begin(), copy.end(), copy.begin(),
	          [](unsigned char c) { return StringUtil::CharacterToUpper(static_cast<char>(c)); });
	return (copy);
}

string StringUtil::Lower(const string &str) {
	string copy(str);
	transform(copy.begin(), copy.end(), copy.begin(),
	          [](unsigned char c) { return StringUtil::CharacterToLower(static_cast<char>(c)); });
	return (copy);
}

string StringUtil::ByteToString(data_t byte) {
	if (byte >= 0x20 && byte < 0x7F) {
		return string("'") + char(byte) + "'";
	}
	std::ostringstream os;
	os << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
	return os.str();
}

string StringUtil::EscapeBytes(const_data_ptr_t data, idx_t size) {
	std::ostringstream os;
	for (idx_t i = 0; i < size; i++) {
		auto byte = data[i];
		if (byte >= 0x20 && byte < 0x7F && byte != '\\') {
			os << char(byte);
		} else {
			os << "\\x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(byte)
			   << std::dec;
		}
	}
	return os.str();
}

bool StringUtil::TryParseBoolean(const string &str, bool &result) {
	auto lower = Lower(str);
	Trim(lower);
	if (lower == "true" || lower == "t" || lower == "1" || lower == "on" || lower == "yes" || lower == "y") {
		result = true;
		return true;
	}
	if (lower == "false" || lower == "f" || lower == "0" || lower == "off" || lower == "no" || lower == "n") {
		result = false;
		return true;
	}
	return false;
}

} // namespace dbase
