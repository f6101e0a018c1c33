#include <catch2/catch_test_macros.hpp>
#include "chunkfetch/types.hpp"
#include <unordered_set>

using namespace chunkfetch;

TEST_CASE("Hash128 operations", "[types]") {
    SECTION("Zero hash") {
        Hash128 h;
        REQUIRE(h.is_zero());
        REQUIRE(h.low == 0);
        REQUIRE(h.high == 0);
    }

    SECTION("Hex conversion") {
        Hash128 h;
        h.low = 0x123456789ABCDEF0ULL;
        h.high = 0xFEDCBA9876543210ULL;

        std::string hex = h.to_hex();
        REQUIRE(hex.size() == 32);
        REQUIRE(hex == "fedcba9876543210123456789abcdef0");

        Hash128 h2 = Hash128::from_hex(hex);
        REQUIRE(h2 == h);
    }
}

TEST_CASE("Address derivation", "[types]") {
    SECTION("Same content, same address") {
        auto a = Address::of(std::string_view("addrX"));
        auto b = Address::of(std::string_view("addrX"));
        REQUIRE(a == b);
        REQUIRE(a.is_valid());
    }

    SECTION("Different content, different address") {
        auto x = Address::of(std::string_view("addrX"));
        auto y = Address::of(std::string_view("addrY"));
        REQUIRE(!(x == y));
        REQUIRE(((x < y) || (y < x)));
    }

    SECTION("String and byte views agree") {
        std::string text = "payload";
        ByteBuffer bytes(text.begin(), text.end());
        REQUIRE(Address::of(std::string_view(text)) == Address::of(ByteView(bytes)));
    }

    SECTION("Default address is invalid") {
        Address a;
        REQUIRE(!a.is_valid());
    }
}

TEST_CASE("Address parsing", "[types]") {
    auto a = Address::of(std::string_view("chunk"));

    SECTION("Hex round trip") {
        auto parsed = Address::parse(a.to_hex());
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == a);
    }

    SECTION("Wrong length is rejected") {
        REQUIRE(!Address::parse("abc").has_value());
        REQUIRE(!Address::parse(a.to_hex() + "0").has_value());
    }

    SECTION("Non-hex characters are rejected") {
        std::string hex = a.to_hex();
        hex[5] = 'z';
        REQUIRE(!Address::parse(hex).has_value());
    }

    SECTION("Temporary file names are rejected") {
        REQUIRE(!Address::parse(a.to_hex() + ".tmp").has_value());
    }
}

TEST_CASE("Address hashing for containers", "[types]") {
    std::unordered_set<Address> set;
    set.insert(Address::of(std::string_view("a")));
    set.insert(Address::of(std::string_view("b")));
    set.insert(Address::of(std::string_view("a")));
    REQUIRE(set.size() == 2);
}

TEST_CASE("NodeId", "[types]") {
    SECTION("Generated ids are valid and distinct") {
        auto a = NodeId::generate();
        auto b = NodeId::generate();
        REQUIRE(a.is_valid());
        REQUIRE(b.is_valid());
        REQUIRE(!(a == b));
    }

    SECTION("Ids from network address are deterministic") {
        auto a = NodeId::from_address("10.0.0.1", 7000);
        auto b = NodeId::from_address("10.0.0.1", 7000);
        auto c = NodeId::from_address("10.0.0.1", 7001);
        REQUIRE(a == b);
        REQUIRE(!(a == c));
    }

    SECTION("String form is fixed width hex") {
        NodeId id(0xabc);
        REQUIRE(id.to_string() == "0000000000000abc");
    }
}

TEST_CASE("Status operations", "[types]") {
    SECTION("OK status") {
        auto s = Status::make_ok();
        REQUIRE(s.ok());
        REQUIRE(!s.is_error());
        REQUIRE(static_cast<bool>(s));
        REQUIRE(s.to_string() == "Ok");
    }

    SECTION("Error status") {
        auto s = Status::error(ErrorCode::NotFound, "Key not found");
        REQUIRE(!s.ok());
        REQUIRE(s.is_error());
        REQUIRE(s.is_not_found());
        REQUIRE(s.code() == ErrorCode::NotFound);
        REQUIRE(s.message() == "Key not found");
        REQUIRE(s.to_string() == "Not found: Key not found");
    }

    SECTION("Termination codes") {
        REQUIRE(std::string(error_code_string(ErrorCode::Timeout)) == "Timeout");
        REQUIRE(std::string(error_code_string(ErrorCode::Cancelled)) == "Cancelled");
        REQUIRE(std::string(error_code_string(ErrorCode::StoreClosed)) == "Store closed");
    }
}
