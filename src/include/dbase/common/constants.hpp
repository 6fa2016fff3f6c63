//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/constants.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace dbase {

using std::move;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

//! a saner size_t for loop indices etc
typedef uint64_t idx_t;

//! The type used for a single byte of data
typedef uint8_t data_t;
//! Data pointers
typedef data_t *data_ptr_t;
typedef const data_t *const_data_ptr_t;

struct DConstants {
	//! The value used to signify an invalid index entry
	static constexpr const idx_t INVALID_INDEX = idx_t(-1);
};

} // namespace dbase
