#include "ingest/telemetry_codec.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace puv {

namespace {

using json = nlohmann::json;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool readNumber(const json& obj, const char* key, double& out, std::string& error) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        error = std::string("missing field '") + key + "'";
        return false;
    }
    if (!it->is_number()) {
        error = std::string("field '") + key + "' must be a number";
        return false;
    }
    out = it->get<double>();
    return true;
}

bool readOptionalNumber(const json& obj, const char* key, std::optional<double>& out, std::string& error) {
    out.reset();
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        error = std::string("field '") + key + "' must be a number";
        return false;
    }
    out = it->get<double>();
    return true;
}

bool readOptionalId(const json& obj, const char* key, std::string& out, std::string& error) {
    out.clear();
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (it->is_string()) {
        out = it->get<std::string>();
        return true;
    }
    if (it->is_number_unsigned()) {
        out = std::to_string(it->get<uint64_t>());
        return true;
    }
    if (it->is_number_integer()) {
        out = std::to_string(it->get<int64_t>());
        return true;
    }
    error = std::string("field '") + key + "' must be a string or integer id";
    return false;
}

}  // namespace

bool base64Decode(const std::string& text, std::vector<unsigned char>& out, std::string& error) {
    std::string compact;
    compact.reserve(text.size());
    for (const char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.empty() || (compact.size() % 4U) != 0U) {
        error = "base64 length must be a non-zero multiple of 4";
        return false;
    }

    out.assign((compact.size() / 4U) * 3U, 0U);
    const int n = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(compact.data()), static_cast<int>(compact.size()));
    if (n < 0) {
        error = "invalid base64 input";
        return false;
    }

    std::size_t padding = 0;
    if (compact.back() == '=') ++padding;
    if (compact.size() >= 2 && compact[compact.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(n) - padding);
    return true;
}

std::string base64Encode(const unsigned char* data, std::size_t size) {
    std::string out(4U * ((size + 2U) / 3U) + 1U, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

bool TelemetryCodec::setKeyHex(const std::string& hex, std::string& error) {
    if (hex.size() != kKeyBytes * 2U) {
        error = "AES-256 key must be 64 hex characters";
        return false;
    }
    std::vector<unsigned char> key(kKeyBytes);
    for (std::size_t i = 0; i < kKeyBytes; ++i) {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            error = "AES-256 key contains non-hex characters";
            return false;
        }
        key[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    key_ = std::move(key);
    error.clear();
    return true;
}

bool TelemetryCodec::decryptEnvelope(const std::string& envelope_b64, std::string& plaintext, std::string& error) const {
    if (!hasKey()) {
        error = "decryption key not configured";
        return false;
    }

    std::vector<unsigned char> raw;
    if (!base64Decode(envelope_b64, raw, error)) {
        return false;
    }
    if (raw.size() < kIvBytes + 16U) {
        error = "envelope shorter than IV plus one cipher block";
        return false;
    }
    const std::size_t cipher_len = raw.size() - kIvBytes;
    if ((cipher_len % 16U) != 0U) {
        error = "ciphertext length is not a multiple of the AES block size";
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        error = "EVP_CIPHER_CTX_new failed";
        return false;
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), raw.data()) != 1) {
        error = "EVP_DecryptInit_ex failed";
        return false;
    }

    std::vector<unsigned char> out(cipher_len + 16U);
    int len1 = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len1, raw.data() + kIvBytes, static_cast<int>(cipher_len)) != 1) {
        error = "EVP_DecryptUpdate failed";
        return false;
    }
    int len2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + len1, &len2) != 1) {
        error = "bad PKCS7 padding (wrong key or corrupted envelope)";
        return false;
    }

    plaintext.assign(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len1 + len2));
    error.clear();
    return true;
}

bool TelemetryCodec::encryptEnvelope(const std::string& plaintext, std::string& envelope_b64, std::string& error) const {
    Iv iv{};
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        error = "RAND_bytes failed";
        return false;
    }
    return encryptEnvelope(plaintext, iv, envelope_b64, error);
}

bool TelemetryCodec::encryptEnvelope(
    const std::string& plaintext, const Iv& iv, std::string& envelope_b64, std::string& error) const {
    if (!hasKey()) {
        error = "encryption key not configured";
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        error = "EVP_CIPHER_CTX_new failed";
        return false;
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), iv.data()) != 1) {
        error = "EVP_EncryptInit_ex failed";
        return false;
    }

    std::vector<unsigned char> out(kIvBytes + plaintext.size() + 16U);
    std::copy(iv.begin(), iv.end(), out.begin());
    int len1 = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data() + kIvBytes, &len1,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        error = "EVP_EncryptUpdate failed";
        return false;
    }
    int len2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kIvBytes + len1, &len2) != 1) {
        error = "EVP_EncryptFinal_ex failed";
        return false;
    }
    out.resize(kIvBytes + static_cast<std::size_t>(len1 + len2));

    envelope_b64 = base64Encode(out.data(), out.size());
    error.clear();
    return true;
}

DecodeResult TelemetryCodec::decode(const std::string& envelope_b64) const {
    DecodeResult result;
    std::string plaintext;
    if (!decryptEnvelope(envelope_b64, plaintext, result.error)) {
        result.kind = ErrorKind::Decryption;
        return result;
    }
    if (!parseReading(plaintext, result.reading, result.error)) {
        result.kind = ErrorKind::SchemaValidation;
        return result;
    }
    result.ok = true;
    return result;
}

bool TelemetryCodec::parseReading(const std::string& json_text, TelemetryReading& out, std::string& error) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        error = "decrypted payload is not valid JSON";
        return false;
    }
    if (!doc.is_object()) {
        error = "decrypted payload must be a JSON object";
        return false;
    }

    TelemetryReading r;
    double svid = 0.0;
    if (!readNumber(doc, "Cn0DbHz", r.cn0_dbhz, error) ||
        !readNumber(doc, "Svid", svid, error) ||
        !readNumber(doc, "SvElevationDegrees", r.sv_elevation_deg, error) ||
        !readNumber(doc, "SvAzimuthDegrees", r.sv_azimuth_deg, error) ||
        !readNumber(doc, "MeasurementX", r.measurement[0], error) ||
        !readNumber(doc, "MeasurementY", r.measurement[1], error) ||
        !readNumber(doc, "MeasurementZ", r.measurement[2], error) ||
        !readNumber(doc, "BiasX", r.bias[0], error) ||
        !readNumber(doc, "BiasY", r.bias[1], error) ||
        !readNumber(doc, "BiasZ", r.bias[2], error)) {
        return false;
    }
    r.svid = static_cast<int>(svid);

    const auto imu = doc.find("IMU_MessageType");
    if (imu == doc.end() || !imu->is_string()) {
        error = "field 'IMU_MessageType' must be a string";
        return false;
    }
    r.imu_message_type = imu->get<std::string>();

    std::optional<double> wx, wy, wz, lat, lon, alt, gt_lat, gt_lon;
    if (!readOptionalNumber(doc, "WlsPositionXEcefMeters", wx, error) ||
        !readOptionalNumber(doc, "WlsPositionYEcefMeters", wy, error) ||
        !readOptionalNumber(doc, "WlsPositionZEcefMeters", wz, error) ||
        !readOptionalNumber(doc, "raw_latitude", lat, error) ||
        !readOptionalNumber(doc, "raw_longitude", lon, error) ||
        !readOptionalNumber(doc, "raw_altitude", alt, error) ||
        !readOptionalNumber(doc, "SpeedMps", r.speed_mps, error) ||
        !readOptionalNumber(doc, "SpeedKmh", r.speed_kmh, error) ||
        !readOptionalNumber(doc, "LatitudeDegrees_gt", gt_lat, error) ||
        !readOptionalNumber(doc, "LongitudeDegrees_gt", gt_lon, error) ||
        !readOptionalId(doc, "device_id", r.device_id, error)) {
        return false;
    }

    const bool wls_provided = wx && wy && wz;
    const bool raw_provided = lat && lon && alt;
    if (!wls_provided && !raw_provided) {
        error = "either WLS ECEF coordinates (WlsPosition{X,Y,Z}EcefMeters) or raw coordinates "
                "(raw_latitude, raw_longitude, raw_altitude) must be provided";
        return false;
    }
    if (wls_provided && raw_provided) {
        error = "provide either WLS ECEF coordinates or raw coordinates, not both";
        return false;
    }

    if (raw_provided) {
        if (*lat < -90.0 || *lat > 90.0 || *lon < -180.0 || *lon > 180.0) {
            error = "raw_latitude/raw_longitude out of range";
            return false;
        }
        r.fix = GeodeticPosition{*lat, *lon, *alt};
    } else {
        r.fix = EcefPosition{cv::Vec3d(*wx, *wy, *wz)};
    }

    if (gt_lat && gt_lon) {
        r.ground_truth = GeoPoint{*gt_lat, *gt_lon};
    }

    out = std::move(r);
    error.clear();
    return true;
}

std::string TelemetryCodec::serializeReading(const TelemetryReading& reading) {
    json doc = {
        {"Cn0DbHz", reading.cn0_dbhz},
        {"Svid", reading.svid},
        {"SvElevationDegrees", reading.sv_elevation_deg},
        {"SvAzimuthDegrees", reading.sv_azimuth_deg},
        {"IMU_MessageType", reading.imu_message_type},
        {"MeasurementX", reading.measurement[0]},
        {"MeasurementY", reading.measurement[1]},
        {"MeasurementZ", reading.measurement[2]},
        {"BiasX", reading.bias[0]},
        {"BiasY", reading.bias[1]},
        {"BiasZ", reading.bias[2]},
    };
    if (!reading.device_id.empty()) {
        doc["device_id"] = reading.device_id;
    }
    if (reading.speed_mps) {
        doc["SpeedMps"] = *reading.speed_mps;
    }
    if (reading.speed_kmh) {
        doc["SpeedKmh"] = *reading.speed_kmh;
    }
    if (const auto* ecef = std::get_if<EcefPosition>(&reading.fix)) {
        doc["WlsPositionXEcefMeters"] = ecef->xyz[0];
        doc["WlsPositionYEcefMeters"] = ecef->xyz[1];
        doc["WlsPositionZEcefMeters"] = ecef->xyz[2];
    } else if (const auto* geo = std::get_if<GeodeticPosition>(&reading.fix)) {
        doc["raw_latitude"] = geo->latitude_deg;
        doc["raw_longitude"] = geo->longitude_deg;
        doc["raw_altitude"] = geo->altitude_m;
    }
    if (reading.ground_truth) {
        doc["LatitudeDegrees_gt"] = reading.ground_truth->latitude;
        doc["LongitudeDegrees_gt"] = reading.ground_truth->longitude;
    }
    return doc.dump();
}

}  // namespace puv
