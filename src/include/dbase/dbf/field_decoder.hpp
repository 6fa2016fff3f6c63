//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/dbf/field_decoder.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/dbf/field_descriptor.hpp"
#include "dbase/dbf/field_value.hpp"

namespace dbase {

class ReadStream;
struct ReaderOptions;

//! Turns the raw bytes of a single field into a FieldValue
class FieldDecoder {
public:
	//! The widest field a descriptor can declare
	static constexpr const idx_t MAX_FIELD_LENGTH = 255;

	//! Reads exactly field.length bytes from the source and decodes them.
	//! Throws an InvalidFieldDataException if the bytes do not form a value of the field's type;
	//! the source is positioned after the field in that case as well.
	static FieldValue Decode(ReadStream &source, const FieldDescriptor &field, const ReaderOptions &options);
	//! Decode the bytes of a field that were already read
	static FieldValue Decode(const_data_ptr_t data, idx_t length, const FieldDescriptor &field,
	                         const ReaderOptions &options);

	//! Whether the field consists only of blanks and NUL bytes
	static bool IsBlank(const_data_ptr_t data, idx_t length);

private:
	static FieldValue DecodeCharacter(const_data_ptr_t data, idx_t length, const ReaderOptions &options);
	static FieldValue DecodeNumeric(const_data_ptr_t data, idx_t length, const FieldDescriptor &field);
	static FieldValue DecodeDate(const_data_ptr_t data, idx_t length, const FieldDescriptor &field);
	static FieldValue DecodeLogical(const_data_ptr_t data, const FieldDescriptor &field);
	static FieldValue DecodeMemo(const_data_ptr_t data, idx_t length, const FieldDescriptor &field);
	static FieldValue DecodeDatetime(const_data_ptr_t data, const FieldDescriptor &field);
};

} // namespace dbase
