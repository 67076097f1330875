#include "obscur/crypto/encoding.hpp"
#include <sodium.h>
namespace obscur::core::crypto {
std::string Encoding::ToHex(std::span<const uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(bytes.size() * 2);
    return hex;
}
Result<std::vector<uint8_t>, ObscurFailure> Encoding::FromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, ObscurFailure>::Err(
            ObscurFailure::Decode("Hex string has odd length"));
    }
    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &end) != 0 ||
        end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, ObscurFailure>::Err(
            ObscurFailure::Decode("Invalid hex string"));
    }
    bytes.resize(bin_len);
    return Result<std::vector<uint8_t>, ObscurFailure>::Ok(std::move(bytes));
}
std::string Encoding::ToBase64(std::span<const uint8_t> bytes) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string b64(sodium_base64_ENCODED_LEN(bytes.size(), variant), '\0');
    sodium_bin2base64(b64.data(), b64.size(), bytes.data(), bytes.size(), variant);
    b64.resize(b64.size() - 1);
    return b64;
}
Result<std::vector<uint8_t>, ObscurFailure> Encoding::FromBase64(std::string_view b64) {
    std::vector<uint8_t> bytes(b64.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(bytes.data(), bytes.size(), b64.data(), b64.size(),
                          nullptr, &bin_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != b64.data() + b64.size()) {
        return Result<std::vector<uint8_t>, ObscurFailure>::Err(
            ObscurFailure::Decode("Invalid base64 string"));
    }
    bytes.resize(bin_len);
    return Result<std::vector<uint8_t>, ObscurFailure>::Ok(std::move(bytes));
}
std::vector<uint8_t> Encoding::ToBytes(std::string_view text) {
    return {text.begin(), text.end()};
}
std::string Encoding::ToString(std::span<const uint8_t> bytes) {
    return {bytes.begin(), bytes.end()};
}
}
