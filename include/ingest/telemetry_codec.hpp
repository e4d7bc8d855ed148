#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace puv {

bool base64Decode(const std::string& text, std::vector<unsigned char>& out, std::string& error);
std::string base64Encode(const unsigned char* data, std::size_t size);

struct DecodeResult {
    bool ok{false};
    ErrorKind kind{ErrorKind::None}; // Decryption | SchemaValidation on failure
    std::string error;
    TelemetryReading reading;
};

// Envelope wire format: base64(iv[16] || AES-256-CBC(PKCS7(json))).
class TelemetryCodec {
public:
    static constexpr std::size_t kKeyBytes = 32;
    static constexpr std::size_t kIvBytes = 16;
    using Iv = std::array<unsigned char, kIvBytes>;

    bool setKeyHex(const std::string& hex, std::string& error);
    bool hasKey() const { return key_.size() == kKeyBytes; }

    bool decryptEnvelope(const std::string& envelope_b64, std::string& plaintext, std::string& error) const;
    bool encryptEnvelope(const std::string& plaintext, std::string& envelope_b64, std::string& error) const;
    bool encryptEnvelope(const std::string& plaintext, const Iv& iv, std::string& envelope_b64, std::string& error) const;

    DecodeResult decode(const std::string& envelope_b64) const;

    static bool parseReading(const std::string& json_text, TelemetryReading& out, std::string& error);
    static std::string serializeReading(const TelemetryReading& reading);

private:
    std::vector<unsigned char> key_;
};

}  // namespace puv
