//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/assert.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#if defined(DEBUG) && !defined(DISABLE_ASSERTIONS)
#include <cassert>
#define D_ASSERT assert
#else
#define D_ASSERT(x)                                                                                                    \
	do {                                                                                                               \
	} while (0)
#endif
