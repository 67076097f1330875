#include "obscur/crypto/aes_gcm.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/core/constants.hpp"
#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <optional>
namespace obscur::core::crypto {
using OpenSSL = OpenSSLConstants;
using BytesResult = Result<std::vector<uint8_t>, ObscurFailure>;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    std::optional<ObscurFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return ObscurFailure::Validation(
                fmt::format("AES-256-GCM key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size()));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return ObscurFailure::Validation(
                fmt::format("AES-GCM nonce must be {} bytes, got {}",
                    Constants::AES_GCM_NONCE_SIZE, nonce.size()));
        }
        return std::nullopt;
    }
    BytesResult Fail(std::vector<uint8_t>& output, std::string_view what) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        (void) _wipe;
        return BytesResult::Err(ObscurFailure::Crypto(fmt::format("{}: {}", what, GetOpenSSLError())));
    }
}
BytesResult AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Fail(output, "Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Fail(output, "Failed to initialize AES-256-GCM");
    }
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        return Fail(output, "Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        return Fail(output, "Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            Constants::AES_GCM_TAG_SIZE,
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        return Fail(output, "Failed to get authentication tag");
    }
    output.resize(ciphertext_len + Constants::AES_GCM_TAG_SIZE);
    return BytesResult::Ok(std::move(output));
}
BytesResult AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(
            ObscurFailure::Validation(
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());
    std::vector<uint8_t> output(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Fail(output, "Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Fail(output, "Failed to initialize AES-256-GCM");
    }
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        return Fail(output, "Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            Constants::AES_GCM_TAG_SIZE, tag.data()) != OpenSSL::SUCCESS) {
        return Fail(output, "Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        return Fail(output, "Authentication tag verification failed");
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return BytesResult::Ok(std::move(output));
}
BytesResult AesGcm::Seal(std::span<const uint8_t> key, std::span<const uint8_t> plaintext) {
    const auto iv = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto encrypted = Encrypt(key, iv, plaintext);
    if (encrypted.IsErr()) {
        return encrypted;
    }
    std::vector<uint8_t> sealed(iv.begin(), iv.end());
    const auto& body = encrypted.Unwrap();
    sealed.insert(sealed.end(), body.begin(), body.end());
    return BytesResult::Ok(std::move(sealed));
}
BytesResult AesGcm::Open(std::span<const uint8_t> key, std::span<const uint8_t> sealed) {
    if (sealed.size() < Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(ObscurFailure::Decode("Sealed payload is too short"));
    }
    return Decrypt(key,
                   sealed.subspan(0, Constants::AES_GCM_NONCE_SIZE),
                   sealed.subspan(Constants::AES_GCM_NONCE_SIZE));
}
}
