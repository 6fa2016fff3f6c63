//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/error_data.hpp"
#include "dbase/common/exception.hpp"
#include "dbase/common/file_system.hpp"
#include "dbase/common/serializer/buffered_file_reader.hpp"
#include "dbase/common/serializer/memory_stream.hpp"
#include "dbase/dbf/dbf_header.hpp"
#include "dbase/dbf/dbf_reader.hpp"
#include "dbase/dbf/field_decoder.hpp"
#include "dbase/dbf/field_descriptor.hpp"
#include "dbase/dbf/field_value.hpp"
#include "dbase/logging/log_manager.hpp"
#include "dbase/main/config.hpp"
