#pragma once
#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace obscur::core::crypto {
/// Hex and standard padded base64 through libsodium's constant-time codecs.
class Encoding {
public:
    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<std::vector<uint8_t>, ObscurFailure> FromHex(std::string_view hex);
    [[nodiscard]] static std::string ToBase64(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<std::vector<uint8_t>, ObscurFailure> FromBase64(std::string_view b64);
    [[nodiscard]] static std::vector<uint8_t> ToBytes(std::string_view text);
    [[nodiscard]] static std::string ToString(std::span<const uint8_t> bytes);
private:
    Encoding() = delete;
};
}
