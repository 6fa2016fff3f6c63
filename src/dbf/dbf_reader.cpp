#include "dbase/dbf/dbf_reader.hpp"

#include "dbase/common/file_system.hpp"
#include "dbase/common/serializer/buffered_file_reader.hpp"
#include "dbase/common/serializer/read_stream.hpp"
#include "dbase/common/string_util.hpp"
#include "dbase/dbf/field_decoder.hpp"
#include "dbase/logging/log_manager.hpp"

namespace dbase {

DBFReader::DBFReader(unique_ptr<ReadStream> source_p, ReaderConfig config_p)
    : source(std::move(source_p)), config(std::move(config_p)), log_manager(config.GetLogManagerPointer()),
      records_read(0), last_record_deleted(false) {
	if (!source) {
		throw InvalidInputException("DBFReader requires a source to read from");
	}
	Initialize();
}

DBFReader::DBFReader(FileSystem &fs, const string &path, ReaderConfig config_p)
    : config(std::move(config_p)), log_manager(config.GetLogManagerPointer()), records_read(0),
      last_record_deleted(false) {
	source = make_uniq<BufferedFileReader>(fs, fs.OpenFile(path, FileFlags::FILE_FLAGS_READ, log_manager));
	Initialize();
}

DBFReader::~DBFReader() {
}

Logger &DBFReader::GetLogger() {
	return log_manager->GlobalLogger();
}

void DBFReader::Initialize() {
	header = DBFHeader::Read(*source, config.options);
	DBASE_LOG(GetLogger(), DBFReaderLogType, header);
	if (header.encrypted) {
		DBASE_LOG_WARN(GetLogger(), "The table is flagged as encrypted, field values are returned as stored");
	}

	fields = ReadFieldDescriptors(*source, header, config.options, GetLogger());
	DBASE_LOG(GetLogger(), DBFReaderLogType, "fields", records_read, RecordCount());
}

vector<FieldDescriptor> DBFReader::ReadFieldDescriptors(ReadStream &source, const DBFHeader &header,
                                                        const ReaderOptions &options, Logger &logger) {
	auto remainder = header.DescriptorRemainder();
	if (remainder != 0) {
		// strict mode rejects this in DBFHeader::Read
		D_ASSERT(!options.strict_descriptor_table);
		DBASE_LOG_WARN(logger,
		               "Header size %llu leaves %llu bytes that do not form a field descriptor, they are skipped",
		               idx_t(header.offset_to_first_record), remainder);
	}

	auto num_fields = header.FieldCount();
	vector<FieldDescriptor> result;
	result.reserve(num_fields + 1);
	result.push_back(FieldDescriptor::CreateDeletionFlag());

	unordered_set<string> names;
	idx_t total_length = 1;
	for (idx_t i = 0; i < num_fields; i++) {
		auto field = FieldDescriptor::Read(source);
		if (!names.insert(field.name).second) {
			throw MalformedFieldDescriptorException("Duplicate field name \"%s\"", field.name);
		}
		total_length += field.length;
		result.push_back(std::move(field));
	}

	auto terminator = source.Read<data_t>();
	if (terminator != DBFHeader::TERMINATOR) {
		throw UnexpectedTerminatorException(terminator);
	}

	// skip the database container backlink and any padding up to the first record
	auto skip = header.ReservedSize() + remainder;
	if (skip > 0) {
		auto buffer = make_uniq_array<data_t>(skip);
		source.ReadData(buffer.get(), skip);
	}

	if (options.verify_record_size && total_length != header.record_size) {
		throw MalformedHeaderException(
		    "Record size %llu does not match the field descriptors, which add up to %llu bytes (including the "
		    "deletion flag)",
		    idx_t(header.record_size), total_length);
	}
	return result;
}

const FieldDescriptor *DBFReader::GetField(const string &name) const {
	for (auto &field : fields) {
		if (!field.is_deletion_flag && field.name == name) {
			return &field;
		}
	}
	return nullptr;
}

unique_ptr<Record> DBFReader::ReadRecord() {
	auto record = make_uniq<Record>();
	record->reserve(fields.size());
	for (auto &field : fields) {
		auto value = FieldDecoder::Decode(*source, field, config.options);
		if (field.is_deletion_flag) {
			last_record_deleted = !value.IsNull() && value.GetValue<string>() == "*";
			continue;
		}
		(*record)[field.name] = std::move(value);
	}
	records_read++;
	return record;
}

unique_ptr<Record> DBFReader::Next() {
	if (failure.HasError()) {
		throw InvalidInputException("Cannot continue reading after record %llu failed to decode: %s", records_read,
		                            failure.Message());
	}
	if (Finished()) {
		return nullptr;
	}
	unique_ptr<Record> record;
	try {
		record = ReadRecord();
	} catch (std::exception &ex) {
		// whatever failed, the source is no longer aligned to a record boundary
		failure = ErrorData(ex);
		DBASE_LOG(GetLogger(), DBFReaderLogType, "failed", records_read, RecordCount());
		throw;
	}
	if (Finished()) {
		DBASE_LOG(GetLogger(), DBFReaderLogType, "finished", records_read, RecordCount());
	}
	return record;
}

unique_ptr<Record> DBFReader::TryNext(ErrorData &error) {
	try {
		return Next();
	} catch (std::exception &ex) {
		error = ErrorData(ex);
		return nullptr;
	}
}

vector<Record> DBFReader::ReadAll() {
	vector<Record> result;
	while (true) {
		auto record = Next();
		if (!record) {
			break;
		}
		result.push_back(std::move(*record));
	}
	return result;
}

DBFReader::iterator::iterator(DBFReader &reader_p) : reader(&reader_p) {
	++(*this);
}

DBFReader::iterator &DBFReader::iterator::operator++() {
	D_ASSERT(reader);
	current = reader->Next();
	if (!current) {
		reader = nullptr;
	}
	return *this;
}

vector<Record> ReadDBF(const string &path) {
	auto fs = FileSystem::CreateLocal();
	return ReadDBF(*fs, path);
}

vector<Record> ReadDBF(FileSystem &fs, const string &path, ReaderConfig config) {
	DBFReader reader(fs, path, std::move(config));
	return reader.ReadAll();
}

vector<Record> ReadDBF(unique_ptr<ReadStream> source, ReaderConfig config) {
	DBFReader reader(std::move(source), std::move(config));
	return reader.ReadAll();
}

} // namespace dbase
