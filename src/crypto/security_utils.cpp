#include "obscur/crypto/security_utils.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/core/constants.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace obscur::core::crypto {

namespace {
    constexpr std::array<std::string_view, 18> SENSITIVE_KEY_PATTERNS = {
        "privatekey", "privkey", "private_key", "sk",
        "password", "passphrase", "secret", "token",
        "key", "keys", "seed", "mnemonic",
        "content", "plaintext", "ciphertext", "encrypted",
        "signature", "sig"};

    std::string ToLower(std::string_view value) {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    const std::regex& AssignmentPattern() {
        static const std::regex pattern(
            R"re(([A-Za-z_][A-Za-z0-9_]*)(\s*[=:]\s*)("[^"]*"|'[^']*'|[^\s,;]+))re");
        return pattern;
    }

    bool IsTokenChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
               c == '+' || c == '/' || c == '=' || c == '_' || c == '-';
    }

    std::string RedactLongTokens(const std::string& text) {
        std::string result;
        result.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            if (!IsTokenChar(text[i])) {
                result += text[i++];
                continue;
            }
            size_t end = i;
            while (end < text.size() && IsTokenChar(text[end])) {
                ++end;
            }
            if (end - i >= LoggingConstants::MIN_SECRET_TOKEN_LENGTH) {
                result += LoggingConstants::REDACTED;
            } else {
                result.append(text, i, end - i);
            }
            i = end;
        }
        return result;
    }
}

void SecurityUtils::ClearSensitiveBuffer(std::span<uint8_t> buffer) {
    if (SodiumInterop::IsInitialized()) {
        auto _wipe = SodiumInterop::SecureWipe(buffer);
        (void) _wipe;
        return;
    }
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
}

void SecurityUtils::ClearSensitiveString(std::string& value) {
    ClearSensitiveBuffer(std::span<uint8_t>(reinterpret_cast<uint8_t*>(value.data()), value.size()));
    value.clear();
}

bool SecurityUtils::ConstantTimeCompare(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
    const size_t length = std::max(a.size(), b.size());
    uint8_t diff = a.size() == b.size() ? 0 : 1;
    for (size_t i = 0; i < length; ++i) {
        const uint8_t lhs = i < a.size() ? a[i] : 0;
        const uint8_t rhs = i < b.size() ? b[i] : 0;
        diff |= static_cast<uint8_t>(lhs ^ rhs);
    }
    return diff == 0;
}

bool SecurityUtils::ConstantTimeStringCompare(std::string_view a, std::string_view b) noexcept {
    return ConstantTimeCompare(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(a.data()), a.size()),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(b.data()), b.size()));
}

bool SecurityUtils::IsSensitiveKey(std::string_view key) {
    const std::string lowered = ToLower(key);
    return std::any_of(SENSITIVE_KEY_PATTERNS.begin(), SENSITIVE_KEY_PATTERNS.end(),
                       [&](std::string_view pattern) {
                           return lowered.find(pattern) != std::string::npos;
                       });
}

nlohmann::json SecurityUtils::SanitizeForLogging(const nlohmann::json& value) {
    if (value.is_array()) {
        nlohmann::json sanitized = nlohmann::json::array();
        for (const auto& item : value) {
            sanitized.push_back(SanitizeForLogging(item));
        }
        return sanitized;
    }
    if (!value.is_object()) {
        return value;
    }
    nlohmann::json sanitized = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (IsSensitiveKey(it.key())) {
            sanitized[it.key()] = std::string(LoggingConstants::REDACTED);
        } else {
            sanitized[it.key()] = SanitizeForLogging(it.value());
        }
    }
    return sanitized;
}

nlohmann::json SecurityUtils::SanitizeForLogging(const ObscurFailure& failure) {
    return {{"name", std::string(failure.TypeName())}, {"message", RedactText(failure.message)}};
}

nlohmann::json SecurityUtils::SanitizeForLogging(const std::exception& ex) {
    return {{"name", "Error"}, {"message", RedactText(ex.what())}};
}

std::string SecurityUtils::RedactText(std::string_view text) {
    const std::string input(text);
    std::string assigned;
    assigned.reserve(input.size());
    auto last = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), AssignmentPattern()), end; it != end; ++it) {
        const std::smatch& match = *it;
        assigned.append(last, match[0].first);
        if (IsSensitiveKey(match[1].str())) {
            assigned += match[1].str();
            assigned += match[2].str();
            assigned += LoggingConstants::REDACTED;
        } else {
            assigned += match[0].str();
        }
        last = match[0].second;
    }
    assigned.append(last, input.cend());
    return RedactLongTokens(assigned);
}

}
