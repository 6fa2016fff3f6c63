//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/helper.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/constants.hpp"

#include <cstring>
#include <type_traits>

namespace dbase {

template <class T, class... ARGS>
unique_ptr<T> make_uniq(ARGS &&...args) { // NOLINT: mimic std style
	return unique_ptr<T>(new T(std::forward<ARGS>(args)...));
}

template <class T, class... ARGS>
shared_ptr<T> make_shared_ptr(ARGS &&...args) { // NOLINT: mimic std style
	return std::make_shared<T>(std::forward<ARGS>(args)...);
}

template <class T>
unique_ptr<T[]> make_uniq_array(size_t n) { // NOLINT: mimic std style
	return unique_ptr<T[]>(new T[n]());
}

template <class T>
T MaxValue(T a, T b) {
	return a > b ? a : b;
}

template <class T>
T MinValue(T a, T b) {
	return a < b ? a : b;
}

template <class SRC>
data_ptr_t data_ptr_cast(SRC *src) { // NOLINT: naming
	static_assert(sizeof(SRC) == 1, "data_ptr_cast should only be used to cast from char/uint8_t");
	return reinterpret_cast<data_ptr_t>(src);
}

template <class SRC>
const_data_ptr_t const_data_ptr_cast(const SRC *src) { // NOLINT: naming
	static_assert(sizeof(SRC) == 1, "const_data_ptr_cast should only be used to cast from char/uint8_t");
	return reinterpret_cast<const_data_ptr_t>(src);
}

template <class SRC>
const char *const_char_ptr_cast(const SRC *src) { // NOLINT: naming
	static_assert(sizeof(SRC) == 1, "const_char_ptr_cast should only be used to cast from char/uint8_t");
	return reinterpret_cast<const char *>(src);
}

//! Reads a (possibly unaligned) value of type T from the given pointer.
//! All multi-byte integers in the .dbf format are little-endian, as is every platform we build for.
template <class T>
T Load(const_data_ptr_t ptr) {
	T ret;
	memcpy(&ret, ptr, sizeof(ret));
	return ret;
}

template <class T>
void Store(const T &val, data_ptr_t ptr) {
	memcpy(ptr, static_cast<const void *>(&val), sizeof(val));
}

} // namespace dbase
