#include "chunkfetch/types.hpp"
#include <xxhash.h>
#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <iomanip>

namespace chunkfetch {

// Hash128 implementation
std::string Hash128::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

Hash128 Hash128::from_hex(std::string_view hex) {
    Hash128 h;
    if (hex.size() >= 32) {
        auto high_str = std::string(hex.substr(0, 16));
        auto low_str = std::string(hex.substr(16, 16));
        h.high = std::stoull(high_str, nullptr, 16);
        h.low = std::stoull(low_str, nullptr, 16);
    }
    return h;
}

// Address implementation
Address Address::of(ByteView content) {
    XXH128_hash_t h = XXH3_128bits(content.data(), content.size());
    Hash128 hash;
    hash.low = h.low64;
    hash.high = h.high64;
    return Address(hash);
}

Address Address::of(std::string_view content) {
    return of(ByteView(reinterpret_cast<const uint8_t*>(content.data()), content.size()));
}

std::optional<Address> Address::parse(std::string_view hex) {
    if (hex.size() != ADDRESS_SIZE * 2) {
        return std::nullopt;
    }
    bool all_hex = std::all_of(hex.begin(), hex.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!all_hex) {
        return std::nullopt;
    }
    return Address(Hash128::from_hex(hex));
}

// NodeId implementation
NodeId NodeId::generate() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis(1);
    return NodeId(dis(gen));
}

NodeId NodeId::from_address(std::string_view addr, uint16_t port) {
    // Deterministic ID from a peer's network address
    std::string combined = std::string(addr) + ":" + std::to_string(port);
    return NodeId(XXH3_64bits(combined.data(), combined.size()));
}

std::string NodeId::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << id_;
    return oss.str();
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ChunkTooLarge: return "Chunk too large";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::StoreClosed: return "Store closed";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return error_code_string(code_);
    }
    return std::string(error_code_string(code_)) + ": " + message_;
}

}  // namespace chunkfetch
