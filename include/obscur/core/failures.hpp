#pragma once
#include <string>
#include <string_view>
namespace obscur::core {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class ObscurFailureType {
    Generic,
    Validation,
    Crypto,
    Storage,
    NotFound,
    InvalidState,
    RetryExhausted,
    BridgeTimeout,
    Encode,
    Decode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ObscurFailure {
public:
    ObscurFailureType type;
    std::string message;
    ObscurFailure(const ObscurFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ObscurFailure Generic(std::string msg) {
        return {ObscurFailureType::Generic, std::move(msg)};
    }
    static ObscurFailure Validation(std::string msg) {
        return {ObscurFailureType::Validation, std::move(msg)};
    }
    static ObscurFailure Crypto(std::string msg) {
        return {ObscurFailureType::Crypto, std::move(msg)};
    }
    static ObscurFailure Storage(std::string msg) {
        return {ObscurFailureType::Storage, std::move(msg)};
    }
    static ObscurFailure NotFound(std::string msg) {
        return {ObscurFailureType::NotFound, std::move(msg)};
    }
    static ObscurFailure InvalidState(std::string msg) {
        return {ObscurFailureType::InvalidState, std::move(msg)};
    }
    static ObscurFailure RetryExhausted(std::string msg) {
        return {ObscurFailureType::RetryExhausted, std::move(msg)};
    }
    static ObscurFailure BridgeTimeout(std::string msg) {
        return {ObscurFailureType::BridgeTimeout, std::move(msg)};
    }
    static ObscurFailure Encode(std::string msg) {
        return {ObscurFailureType::Encode, std::move(msg)};
    }
    static ObscurFailure Decode(std::string msg) {
        return {ObscurFailureType::Decode, std::move(msg)};
    }
    static ObscurFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }
    [[nodiscard]] std::string_view TypeName() const noexcept {
        switch (type) {
            case ObscurFailureType::Validation: return "ValidationError";
            case ObscurFailureType::Crypto: return "CryptoError";
            case ObscurFailureType::Storage: return "StorageError";
            case ObscurFailureType::NotFound: return "NotFoundError";
            case ObscurFailureType::InvalidState: return "InvalidStateError";
            case ObscurFailureType::RetryExhausted: return "RetryExhaustedError";
            case ObscurFailureType::BridgeTimeout: return "BridgeTimeoutError";
            case ObscurFailureType::Encode: return "EncodeError";
            case ObscurFailureType::Decode: return "DecodeError";
            case ObscurFailureType::Generic: break;
        }
        return "Error";
    }
};
}
