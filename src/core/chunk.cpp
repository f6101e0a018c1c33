#include "chunkfetch/chunk.hpp"

namespace chunkfetch {

// Chunk implementation
Chunk::Chunk(const Address& address, ByteBuffer data)
    : address_(address)
    , data_(std::move(data))
{}

Chunk Chunk::from_content(ByteBuffer data) {
    Address address = Address::of(ByteView(data.data(), data.size()));
    return Chunk(address, std::move(data));
}

bool Chunk::same_content(const Chunk& other) const noexcept {
    return address_ == other.address_ && data_ == other.data_;
}

SharedChunk make_chunk(const Address& address, ByteBuffer data) {
    return std::make_shared<const Chunk>(address, std::move(data));
}

SharedChunk make_chunk(const Address& address, std::string_view data) {
    return make_chunk(address, ByteBuffer(data.begin(), data.end()));
}

SharedChunk make_content_chunk(ByteBuffer data) {
    return std::make_shared<const Chunk>(Chunk::from_content(std::move(data)));
}

}  // namespace chunkfetch
