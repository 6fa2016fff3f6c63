//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/dbf/dbf_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/common.hpp"
#include "dbase/common/error_data.hpp"
#include "dbase/dbf/dbf_header.hpp"
#include "dbase/dbf/field_descriptor.hpp"
#include "dbase/dbf/field_value.hpp"
#include "dbase/main/config.hpp"

#include <iterator>

namespace dbase {

class FileSystem;
class Logger;
class ReadStream;

//! A decoded record: field name -> value, without the deletion flag
typedef unordered_map<string, FieldValue> Record;

//! Reads the records of a .dbf file one at a time.
//! The header and the field descriptor table are decoded when the reader is constructed;
//! records are only decoded when they are requested.
class DBFReader {
public:
	//! Read from the given source, which the reader takes ownership of
	explicit DBFReader(unique_ptr<ReadStream> source, ReaderConfig config = ReaderConfig());
	//! Open the file at the given path
	DBFReader(FileSystem &fs, const string &path, ReaderConfig config = ReaderConfig());
	~DBFReader();

	DBFReader(const DBFReader &) = delete;
	DBFReader &operator=(const DBFReader &) = delete;

	class iterator { // NOLINT: match std naming style
	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Record value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Record *pointer;
		typedef Record &reference;

		iterator() : reader(nullptr) {
		}
		explicit iterator(DBFReader &reader);

		Record &operator*() {
			return *current;
		}
		Record *operator->() {
			return current.get();
		}
		iterator &operator++();
		iterator operator++(int) {
			iterator result(*this);
			++(*this);
			return result;
		}
		bool operator==(const iterator &other) const {
			return reader == other.reader;
		}
		bool operator!=(const iterator &other) const {
			return reader != other.reader;
		}

	private:
		DBFReader *reader;
		//! Shared so that copies of an input iterator can still dereference the record they were made at
		shared_ptr<Record> current;
	};

public:
	const DBFHeader &GetHeader() const {
		return header;
	}
	//! The field descriptors, starting with the synthetic deletion flag
	const vector<FieldDescriptor> &GetFields() const {
		return fields;
	}
	//! The number of fields stored in the file (excluding the deletion flag)
	idx_t FieldCount() const {
		return fields.size() - 1;
	}
	//! The number of records declared in the header
	idx_t RecordCount() const {
		return header.record_count;
	}
	idx_t RecordsRead() const {
		return records_read;
	}
	//! Whether or not every declared record has been read
	bool Finished() const {
		return records_read >= header.record_count;
	}
	//! Whether or not a previous record failed to decode
	bool HasFailed() const {
		return failure.HasError();
	}
	//! Whether the deletion flag of the most recently read record marked it as deleted
	bool LastRecordDeleted() const {
		return last_record_deleted;
	}
	const ReaderConfig &GetConfig() const {
		return config;
	}
	//! Returns the descriptor of the field with the given name, or nullptr if there is none
	const FieldDescriptor *GetField(const string &name) const;

	//! Read the next record; returns nullptr once every record has been read.
	//! Throws if the record cannot be decoded; the reader cannot be used afterwards.
	unique_ptr<Record> Next();
	//! Read the next record; on failure returns nullptr and sets the error
	unique_ptr<Record> TryNext(ErrorData &error);
	//! Read every remaining record
	vector<Record> ReadAll();

	iterator begin() { // NOLINT: match stl API
		return iterator(*this);
	}
	iterator end() { // NOLINT: match stl API
		return iterator();
	}

	//! Read the descriptor table that follows the header, including the terminator and any reserved bytes.
	//! The returned table starts with the synthetic deletion flag.
	static vector<FieldDescriptor> ReadFieldDescriptors(ReadStream &source, const DBFHeader &header,
	                                                    const ReaderOptions &options, Logger &logger);

private:
	void Initialize();
	Logger &GetLogger();
	unique_ptr<Record> ReadRecord();

	unique_ptr<ReadStream> source;
	ReaderConfig config;
	//! Keeps the logger alive for as long as the reader
	shared_ptr<LogManager> log_manager;
	DBFHeader header;
	vector<FieldDescriptor> fields;
	idx_t records_read;
	bool last_record_deleted;
	ErrorData failure;
};

//! Read every record of the .dbf file at the given path
vector<Record> ReadDBF(const string &path);
vector<Record> ReadDBF(FileSystem &fs, const string &path, ReaderConfig config = ReaderConfig());
vector<Record> ReadDBF(unique_ptr<ReadStream> source, ReaderConfig config = ReaderConfig());

} // namespace dbase
