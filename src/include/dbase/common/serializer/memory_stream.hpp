//===----------------------------------------------------------------------===//
//                         DBase
//
// dbase/common/serializer/memory_stream.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dbase/common/serializer/read_stream.hpp"

namespace dbase {

//! A read stream over a contiguous block of memory
class MemoryStream : public ReadStream {
public:
	//! Copy the given bytes into a buffer owned by the stream
	explicit MemoryStream(const vector<data_t> &bytes);
	//! Take ownership of the given bytes
	explicit MemoryStream(vector<data_t> &&bytes);
	//! Read from an externally owned buffer; the buffer must outlive the stream
	MemoryStream(const_data_ptr_t buffer, idx_t capacity);

	// Read-only streams can be moved but not copied
	MemoryStream(const MemoryStream &) = delete;
	MemoryStream &operator=(const MemoryStream &) = delete;
	MemoryStream(MemoryStream &&other) noexcept;
	MemoryStream &operator=(MemoryStream &&other) noexcept;

	~MemoryStream() override;

	void ReadData(data_ptr_t buffer, idx_t read_size) override;

	//! Rewind the stream to the beginning of the buffer
	void Rewind();
	//! Whether or not every byte of the buffer has been read
	bool Finished() const;

	const_data_ptr_t GetData() const;
	idx_t GetPosition() const;
	idx_t GetCapacity() const;

private:
	vector<data_t> owned_data;
	idx_t position;
	idx_t capacity;
	const_data_ptr_t data;
};

} // namespace dbase
