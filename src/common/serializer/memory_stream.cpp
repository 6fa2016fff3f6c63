#include "dbase/common/serializer/memory_stream.hpp"

#include "dbase/common/exception.hpp"

namespace dbase {

MemoryStream::MemoryStream(const vector<data_t> &bytes) : MemoryStream(vector<data_t>(bytes)) {
}

MemoryStream::MemoryStream(vector<data_t> &&bytes)
    : owned_data(std::move(bytes)), position(0), capacity(owned_data.size()), data(owned_data.data()) {
}

MemoryStream::MemoryStream(const_data_ptr_t buffer, idx_t capacity) : position(0), capacity(capacity), data(buffer) {
}

MemoryStream::~MemoryStream() {
}

MemoryStream::MemoryStream(MemoryStream &&other) noexcept {
	// moving a vector keeps its buffer, so a pointer into owned data stays valid
	owned_data = std::move(other.owned_data);
	position = other.position;
	capacity = other.capacity;
	data = other.data;

	// Reset the other stream
	other.owned_data.clear();
	other.data = nullptr;
	other.position = 0;
	other.capacity = 0;
}

MemoryStream &MemoryStream::operator=(MemoryStream &&other) noexcept {
	if (this != &other) {
		owned_data = std::move(other.owned_data);
		position = other.position;
		capacity = other.capacity;
		data = other.data;

		other.owned_data.clear();
		other.data = nullptr;
		other.position = 0;
		other.capacity = 0;
	}
	return *this;
}

void MemoryStream::ReadData(data_ptr_t destination, idx_t read_size) {
	if (position + read_size > capacity) {
		throw IOException("Unexpected end of input: requested %llu bytes at offset %llu, but only %llu are available",
		                  read_size, position, capacity - position);
	}
	if (read_size > 0) {
		memcpy(destination, data + position, read_size);
	}
	position += read_size;
}

void MemoryStream::Rewind() {
	position = 0;
}

bool MemoryStream::Finished() const {
	return position == capacity;
}

const_data_ptr_t MemoryStream::GetData() const {
	return data;
}

idx_t MemoryStream::GetPosition() const {
	return position;
}

idx_t MemoryStream::GetCapacity() const {
	return capacity;
}

} // namespace dbase
