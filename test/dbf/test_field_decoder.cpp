#include "catch.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace dbase;
using namespace std;

static FieldValue DecodeField(const FieldDescriptor &field, const string &bytes,
                              const ReaderOptions &options = ReaderOptions()) {
	REQUIRE(bytes.size() == field.length);
	// surround the field with other bytes to verify that exactly the field is consumed
	string buffer = "<" + bytes + ">";
	MemoryStream stream(const_data_ptr_cast(buffer.c_str()), buffer.size());
	REQUIRE(stream.Read<char>() == '<');
	FieldValue result;
	try {
		result = FieldDecoder::Decode(stream, field, options);
	} catch (std::exception &) {
		REQUIRE(stream.GetPosition() == 1 + bytes.size());
		throw;
	}
	REQUIRE(stream.Read<char>() == '>');
	return result;
}

static FieldValue DecodeField(char type, const string &bytes, uint8_t decimal_count = 0) {
	FieldDescriptor field("FIELD", FieldType(type), uint8_t(bytes.size()), decimal_count);
	return DecodeField(field, bytes);
}

TEST_CASE("Test decoding character fields", "[field_decoder]") {
	auto value = DecodeField('C', "Alice     ");
	REQUIRE(value.type() == FieldType::CHARACTER);
	REQUIRE(value.GetValue<string>() == "Alice");

	REQUIRE(DecodeField('C', string("Bob\0\0\0", 6)).GetValue<string>() == "Bob");
	REQUIRE(DecodeField('C', "  indented").GetValue<string>() == "  indented");
	REQUIRE(DecodeField('C', "    ").GetValue<string>() == "");
	REQUIRE_FALSE(DecodeField('C', "    ").IsNull());

	ReaderOptions untrimmed;
	untrimmed.trim_character_fields = false;
	FieldDescriptor field("NAME", FieldType::CHARACTER, 6);
	REQUIRE(DecodeField(field, "Carl  ", untrimmed).GetValue<string>() == "Carl  ");

	// bytes are passed through without transcoding
	REQUIRE(DecodeField('C', "caf\xE9").GetValue<string>() == "caf\xE9");
}

TEST_CASE("Test decoding numeric fields", "[field_decoder]") {
	REQUIRE(DecodeField('N', "    12.50", 2) == FieldValue::NUMERIC(12.5));
	REQUIRE(DecodeField('N', "-3").GetValue<double>() == -3);
	REQUIRE(DecodeField('N', "+42   ").GetValue<double>() == 42);
	REQUIRE(DecodeField('N', "  1e3").GetValue<double>() == 1000);
	REQUIRE(DecodeField('F', "  0.25").type() == FieldType::FLOAT);
	REQUIRE(DecodeField('F', "  0.25").GetValue<double>() == 0.25);

	auto null_value = DecodeField('N', "        ");
	REQUIRE(null_value.IsNull());
	REQUIRE(null_value.type() == FieldType::NUMERIC);
	REQUIRE(DecodeField('F', string("\0\0\0", 3)).IsNull());

	REQUIRE_THROWS_AS(DecodeField('N', "  12abc"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('N', "*******"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('N', "1 2"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('N', "  -  "), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('N', "++1"), InvalidFieldDataException);
}

TEST_CASE("Test decoding date fields", "[field_decoder]") {
	auto value = DecodeField('D', "20240229");
	REQUIRE(value.type() == FieldType::DATE);
	REQUIRE(value.GetValue<date_t>() == Date::FromDate(2024, 2, 29));
	REQUIRE(value.ToString() == "2024-02-29");

	REQUIRE(DecodeField('D', "        ").IsNull());
	REQUIRE(DecodeField('D', "00000000").IsNull());
	REQUIRE(DecodeField('D', "00000000").type() == FieldType::DATE);

	REQUIRE_THROWS_AS(DecodeField('D', "20230229"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('D', "20231301"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('D', "2024-1-1"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('D', "2024    "), InvalidFieldDataException);
}

TEST_CASE("Test decoding logical fields", "[field_decoder]") {
	for (auto c : string("TtYy")) {
		REQUIRE(DecodeField('L', string(1, c)) == FieldValue::LOGICAL(true));
	}
	for (auto c : string("FfNn")) {
		REQUIRE(DecodeField('L', string(1, c)) == FieldValue::LOGICAL(false));
	}
	REQUIRE(DecodeField('L', "?").IsNull());
	REQUIRE(DecodeField('L', " ").IsNull());
	REQUIRE(DecodeField('L', "?").type() == FieldType::LOGICAL);
	REQUIRE_THROWS_AS(DecodeField('L', "X"), InvalidFieldDataException);
}

TEST_CASE("Test decoding memo fields", "[field_decoder]") {
	auto value = DecodeField('M', "        17");
	REQUIRE(value.type() == FieldType::MEMO);
	REQUIRE(value.GetValue<uint32_t>() == 17);
	REQUIRE(DecodeField('G', "0000000003").GetValue<uint32_t>() == 3);
	REQUIRE(DecodeField('P', "5         ").GetValue<uint32_t>() == 5);
	REQUIRE(DecodeField('M', "          ").IsNull());

	// Visual FoxPro stores a binary block index
	REQUIRE(DecodeField('M', BinaryField<uint32_t>(4096)).GetValue<uint32_t>() == 4096);
	REQUIRE(DecodeField('M', BinaryField<uint32_t>(0)).IsNull());

	// dBase IV binary memo
	REQUIRE(DecodeField('B', "        42").GetValue<uint32_t>() == 42);
	REQUIRE(DecodeField('B', "        42").type() == FieldType::MEMO);

	REQUIRE_THROWS_AS(DecodeField('M', "      12x4"), InvalidFieldDataException);
	REQUIRE_THROWS_AS(DecodeField('M', "9999999999"), InvalidFieldDataException);
}

TEST_CASE("Test decoding binary numeric fields", "[field_decoder]") {
	auto integer = DecodeField('I', BinaryField<int32_t>(-123456));
	REQUIRE(integer.type() == FieldType::INTEGER);
	REQUIRE(integer.GetValue<int32_t>() == -123456);
	REQUIRE(integer.GetValue<int64_t>() == -123456);

	auto dbl = DecodeField('B', BinaryField<double>(3.25));
	REQUIRE(dbl.type() == FieldType::DOUBLE);
	REQUIRE(dbl.GetValue<double>() == 3.25);

	auto currency = DecodeField('Y', BinaryField<int64_t>(125000));
	REQUIRE(currency.type() == FieldType::CURRENCY);
	REQUIRE(currency.GetValue<int64_t>() == 125000);
	REQUIRE(currency.GetValue<double>() == 12.5);
	REQUIRE(currency.ToString() == "12.5000");
	REQUIRE(FieldValue::CURRENCY(-5).ToString() == "-0.0005");
}

TEST_CASE("Test decoding datetime fields", "[field_decoder]") {
	auto bytes = BinaryField<int32_t>(2451545) + BinaryField<int32_t>(int32_t(Interval::MSECS_PER_DAY / 2 + 250));
	auto value = DecodeField('T', bytes);
	REQUIRE(value.type() == FieldType::DATETIME);
	REQUIRE(value.ToString() == "2000-01-01 12:00:00.250");
	REQUIRE(value.GetValue<date_t>() == Date::FromDate(2000, 1, 1));

	REQUIRE(DecodeField('T', string(8, '\0')).IsNull());

	auto bad_time = BinaryField<int32_t>(2451545) + BinaryField<int32_t>(int32_t(Interval::MSECS_PER_DAY));
	REQUIRE_THROWS_AS(DecodeField('T', bad_time), InvalidFieldDataException);
	auto bad_day = BinaryField<int32_t>(-1) + BinaryField<int32_t>(0);
	REQUIRE_THROWS_AS(DecodeField('T', bad_day), InvalidFieldDataException);
}

TEST_CASE("Test decoding a short field", "[field_decoder]") {
	FieldDescriptor field("NAME", FieldType::CHARACTER, 10);
	string bytes = "abc";
	MemoryStream stream(const_data_ptr_cast(bytes.c_str()), bytes.size());
	REQUIRE_THROWS_AS(FieldDecoder::Decode(stream, field, ReaderOptions()), IOException);

	REQUIRE_THROWS_AS(FieldDecoder::Decode(const_data_ptr_cast(bytes.c_str()), bytes.size(), field, ReaderOptions()),
	                  InternalException);
}

TEST_CASE("Test field values", "[field_value]") {
	FieldValue null_value;
	REQUIRE(null_value.IsNull());
	REQUIRE(null_value.ToString() == "NULL");
	REQUIRE(null_value == FieldValue::Null(FieldType::CHARACTER));
	REQUIRE(null_value != FieldValue::Null(FieldType::NUMERIC));
	REQUIRE(null_value != FieldValue::CHARACTER(""));
	REQUIRE_THROWS_AS(null_value.GetValue<string>(), InvalidInputException);

	REQUIRE(FieldValue::INTEGER(1) != FieldValue::NUMERIC(1));
	REQUIRE_THROWS_AS(FieldValue::INTEGER(1).GetValue<string>(), InvalidInputException);
	REQUIRE_THROWS_AS(FieldValue::LOGICAL(true).GetValue<double>(), InvalidInputException);
	REQUIRE(FieldValue::LOGICAL(true).ToString() == "true");
	REQUIRE(FieldValue::NUMERIC(12.5).ToString() == "12.5");
	REQUIRE(FieldValue::MEMO(7).ToString() == "7");
	REQUIRE(FieldValue::DATE(2020, 1, 31).ToString() == "2020-01-31");

	auto date = FieldValue::DATE(2020, 1, 31);
	REQUIRE(date.GetValue<timestamp_t>() == Timestamp::FromDatetime(Date::FromDate(2020, 1, 31), 0));
}
