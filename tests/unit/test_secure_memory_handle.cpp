#include <catch2/catch_test_macros.hpp>
#include "obscur/crypto/secure_memory_handle.hpp"
#include "obscur/crypto/sodium_interop.hpp"
using namespace obscur::core;
using namespace obscur::core::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
    }
    SECTION("Cannot allocate zero bytes") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
    SECTION("Move assignment transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Read and Write", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Written key reads back") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> key(32, 0x42);
        REQUIRE(handle.Write(key).IsOk());
        auto read = handle.ReadBytes();
        REQUIRE(read.IsOk());
        REQUIRE(read.Unwrap() == key);
    }
    SECTION("Write larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsErr());
    }
    SECTION("Moved-from handle rejects access") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto moved = std::move(handle);
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsErr());
        auto access = handle.WithReadAccess([](std::span<const uint8_t> bytes) { return bytes.size(); });
        REQUIRE(access.IsErr());
    }
    SECTION("WithReadAccess exposes the stored bytes") {
        auto handle = SecureMemoryHandle::Allocate(4).Unwrap();
        std::vector<uint8_t> data = {9, 8, 7, 6};
        REQUIRE(handle.Write(data).IsOk());
        auto first = handle.WithReadAccess([](std::span<const uint8_t> bytes) { return bytes[0]; });
        REQUIRE(first.IsOk());
        REQUIRE(first.Unwrap() == 9);
    }
}
