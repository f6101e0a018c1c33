#pragma once

#include "types.hpp"
#include <memory>

namespace chunkfetch {

// A chunk is an immutable (address, payload) pair.
// Two chunks with the same address are assumed to carry identical bytes;
// integrity is not verified here.
class Chunk {
public:
    Chunk(const Address& address, ByteBuffer data);

    // Derive the address from the payload
    static Chunk from_content(ByteBuffer data);

    // Move-only (large data)
    Chunk(Chunk&&) = default;
    Chunk& operator=(Chunk&&) = default;
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    const Address& address() const noexcept { return address_; }

    ByteView data() const noexcept { return {data_.data(), data_.size()}; }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    bool same_content(const Chunk& other) const noexcept;

private:
    Address address_;
    ByteBuffer data_;
};

// Shared chunk for zero-copy hand-off between the store and waiters
using SharedChunk = std::shared_ptr<const Chunk>;

SharedChunk make_chunk(const Address& address, ByteBuffer data);
SharedChunk make_chunk(const Address& address, std::string_view data);
SharedChunk make_content_chunk(ByteBuffer data);

// A chunk or the reason there is none
struct ChunkResult {
    Status status;
    SharedChunk chunk;

    static ChunkResult found(SharedChunk chunk) {
        return {Status::make_ok(), std::move(chunk)};
    }
    static ChunkResult failed(Status status) {
        return {std::move(status), nullptr};
    }

    bool ok() const noexcept { return status.ok() && chunk != nullptr; }
    bool is_not_found() const noexcept { return status.is_not_found(); }
};

}  // namespace chunkfetch
