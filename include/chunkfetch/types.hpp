#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <optional>

namespace chunkfetch {

// Constants
constexpr size_t ADDRESS_SIZE = 16;                      // 128-bit content hash
constexpr size_t DEFAULT_MAX_CHUNK_SIZE = 4 * 1024 * 1024;  // 4MB
constexpr size_t DEFAULT_SESSION_TABLE_CAPACITY = 5000;

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

// Hash type (128-bit for content addressing)
struct Hash128 {
    uint64_t low = 0;
    uint64_t high = 0;

    bool operator==(const Hash128& other) const noexcept {
        return low == other.low && high == other.high;
    }

    bool operator<(const Hash128& other) const noexcept {
        return high < other.high || (high == other.high && low < other.low);
    }

    bool is_zero() const noexcept { return low == 0 && high == 0; }

    std::string to_hex() const;
    static Hash128 from_hex(std::string_view hex);
};

// Content address of a chunk
class Address {
public:
    Address() = default;
    explicit Address(const Hash128& hash) : hash_(hash) {}

    // Hash arbitrary content into an address (XXH3-128)
    static Address of(ByteView content);
    static Address of(std::string_view content);

    // Parse the 32 hex digit form; nullopt on malformed input
    static std::optional<Address> parse(std::string_view hex);

    const Hash128& hash() const noexcept { return hash_; }
    bool is_valid() const noexcept { return !hash_.is_zero(); }

    bool operator==(const Address& other) const noexcept {
        return hash_ == other.hash_;
    }

    bool operator<(const Address& other) const noexcept {
        return hash_ < other.hash_;
    }

    std::string to_hex() const { return hash_.to_hex(); }

private:
    Hash128 hash_;
};

// Identity of a requesting party
class NodeId {
public:
    NodeId() = default;
    explicit NodeId(uint64_t id) : id_(id) {}
    static NodeId generate();
    static NodeId from_address(std::string_view addr, uint16_t port);

    uint64_t value() const noexcept { return id_; }
    bool is_valid() const noexcept { return id_ != 0; }

    bool operator==(const NodeId& other) const noexcept { return id_ == other.id_; }
    bool operator<(const NodeId& other) const noexcept { return id_ < other.id_; }

    std::string to_string() const;

private:
    uint64_t id_ = 0;
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    NotFound,
    InvalidArgument,
    ChunkTooLarge,
    StorageError,
    StoreClosed,
    Timeout,
    Cancelled,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    bool is_not_found() const noexcept { return code_ == ErrorCode::NotFound; }
    explicit operator bool() const noexcept { return ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

}  // namespace chunkfetch

// Hash specializations for standard containers
namespace std {

template<>
struct hash<chunkfetch::Address> {
    size_t operator()(const chunkfetch::Address& a) const noexcept {
        return a.hash().low ^ a.hash().high;
    }
};

template<>
struct hash<chunkfetch::NodeId> {
    size_t operator()(const chunkfetch::NodeId& n) const noexcept {
        return n.value();
    }
};

template<>
struct hash<chunkfetch::Hash128> {
    size_t operator()(const chunkfetch::Hash128& h) const noexcept {
        return h.low ^ h.high;
    }
};

}  // namespace std
