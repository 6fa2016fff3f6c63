//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/common.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/assert.hpp"
#include "dbase/common/constants.hpp"
#include "dbase/common/helper.hpp"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace dbase {

using std::lock_guard;
using std::mutex;
using std::unique_lock;
using std::unordered_map;
using std::unordered_set;

} // namespace dbase
