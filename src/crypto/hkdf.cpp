#include "obscur/crypto/hkdf.hpp"
#include "obscur/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace obscur::core::crypto {

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;

    Result<std::vector<uint8_t>, ObscurFailure> Derive(
        int mode,
        std::span<const uint8_t> key,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr);
        if (!kdf) {
            return Result<std::vector<uint8_t>, ObscurFailure>::Err(
                ObscurFailure::Crypto("Failed to fetch HKDF algorithm"));
        }
        EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);
        if (!kctx) {
            return Result<std::vector<uint8_t>, ObscurFailure>::Err(
                ObscurFailure::Crypto("Failed to create HKDF context"));
        }
        OSSL_PARAM params[6];
        int param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST, const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
        params[param_idx++] = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_MODE, &mode);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(key.data()), key.size());
        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        std::vector<uint8_t> output(output_size);
        if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, ObscurFailure>::Err(
                ObscurFailure::Crypto("HKDF key derivation failed"));
        }
        return Result<std::vector<uint8_t>, ObscurFailure>::Ok(std::move(output));
    }
}

Result<std::vector<uint8_t>, ObscurFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {
    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, ObscurFailure>::Err(
            ObscurFailure::Validation("HKDF input key material cannot be empty"));
    }
    return Derive(EVP_KDF_HKDF_MODE_EXTRACT_ONLY, ikm, HASH_LEN, salt, {});
}

Result<std::vector<uint8_t>, ObscurFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    size_t output_size,
    std::span<const uint8_t> info) {
    if (prk.size() != HASH_LEN) {
        return Result<std::vector<uint8_t>, ObscurFailure>::Err(
            ObscurFailure::Validation(
                "HKDF pseudorandom key must be " + std::to_string(HASH_LEN) + " bytes"));
    }
    if (output_size == 0 || output_size > MAX_OUTPUT_LEN) {
        return Result<std::vector<uint8_t>, ObscurFailure>::Err(
            ObscurFailure::Validation(
                "HKDF output size out of range: " + std::to_string(output_size)));
    }
    return Derive(EVP_KDF_HKDF_MODE_EXPAND_ONLY, prk, output_size, {}, info);
}

}
