#include "ingest/telemetry_codec.hpp"
#include "support/test_support.hpp"

#include <cmath>
#include <iostream>
#include <variant>

namespace {
const char* kKey = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";
const char* kOtherKey = "1f1e1d1c1b1a191817161514131211100f0e0d0c0b0a09080706050403020100";
}

int main() {
    puv::TelemetryCodec codec;
    std::string err;
    if (codec.setKeyHex("abc", err) || codec.hasKey()) {
        std::cerr << "short key should be rejected\n";
        return 1;
    }
    if (!codec.setKeyHex(kKey, err)) {
        std::cerr << "setKeyHex failed: " << err << "\n";
        return 1;
    }

    // base64 of "hello" and malformed inputs
    std::vector<unsigned char> bytes;
    if (!puv::base64Decode("aGVsbG8=", bytes, err) || std::string(bytes.begin(), bytes.end()) != "hello") {
        std::cerr << "base64Decode of 'hello' failed\n";
        return 1;
    }
    if (puv::base64Decode("aGVsbG8", bytes, err) || puv::base64Decode("", bytes, err)) {
        std::cerr << "truncated/empty base64 should fail\n";
        return 1;
    }

    const puv::TelemetryReading reading = puv::testing::sampleReading(puv::GeoPoint{14.6, 121.0}, "dev-001");
    std::string envelope;
    if (!codec.encryptEnvelope(puv::TelemetryCodec::serializeReading(reading), envelope, err)) {
        std::cerr << "encryptEnvelope failed: " << err << "\n";
        return 1;
    }

    const puv::DecodeResult decoded = codec.decode(envelope);
    if (!decoded.ok) {
        std::cerr << "decode failed: " << decoded.error << "\n";
        return 1;
    }
    const auto* geo = std::get_if<puv::GeodeticPosition>(&decoded.reading.fix);
    if (geo == nullptr || std::abs(geo->latitude_deg - 14.6) > 1e-12 || decoded.reading.device_id != "dev-001" ||
        decoded.reading.imu_message_type != "UncalAccel" || !decoded.reading.speed_mps) {
        std::cerr << "decoded reading does not match the sent one\n";
        return 1;
    }

    // Same plaintext under a fresh IV must produce a different envelope.
    std::string envelope2;
    if (!codec.encryptEnvelope(puv::TelemetryCodec::serializeReading(reading), envelope2, err) || envelope2 == envelope) {
        std::cerr << "random IV should change the envelope\n";
        return 1;
    }

    puv::TelemetryCodec wrong;
    if (!wrong.setKeyHex(kOtherKey, err)) {
        return 1;
    }
    const puv::DecodeResult bad_key = wrong.decode(envelope);
    // A wrong key may still unpad by chance; the JSON check then rejects it.
    if (bad_key.ok ||
        (bad_key.kind != puv::ErrorKind::Decryption && bad_key.kind != puv::ErrorKind::SchemaValidation)) {
        std::cerr << "wrong key must not decode\n";
        return 1;
    }

    const puv::DecodeResult not_b64 = codec.decode("!!!not-base64!!!");
    if (not_b64.ok || not_b64.kind != puv::ErrorKind::Decryption) {
        std::cerr << "invalid base64 should be a decryption error\n";
        return 1;
    }

    std::string short_env;
    const unsigned char tiny[8] = {1, 2, 3, 4, 5, 6, 7, 8};
    short_env = puv::base64Encode(tiny, sizeof(tiny));
    if (codec.decode(short_env).kind != puv::ErrorKind::Decryption) {
        std::cerr << "short envelope should be a decryption error\n";
        return 1;
    }

    // Valid envelope whose plaintext is not JSON.
    std::string garbage_env;
    if (!codec.encryptEnvelope("not json at all", garbage_env, err) ||
        codec.decode(garbage_env).kind != puv::ErrorKind::SchemaValidation) {
        std::cerr << "non-JSON plaintext should be a schema error\n";
        return 1;
    }

    // Neither fix alternative.
    std::string neither = R"({"Cn0DbHz":30,"Svid":3,"SvElevationDegrees":40,"SvAzimuthDegrees":10,
        "IMU_MessageType":"UncalGyro","MeasurementX":0,"MeasurementY":0,"MeasurementZ":0,
        "BiasX":0,"BiasY":0,"BiasZ":0})";
    puv::TelemetryReading parsed;
    if (puv::TelemetryCodec::parseReading(neither, parsed, err)) {
        std::cerr << "reading without any fix should be rejected\n";
        return 1;
    }

    // Both alternatives.
    std::string both = R"({"Cn0DbHz":30,"Svid":3,"SvElevationDegrees":40,"SvAzimuthDegrees":10,
        "IMU_MessageType":"UncalGyro","MeasurementX":0,"MeasurementY":0,"MeasurementZ":0,
        "BiasX":0,"BiasY":0,"BiasZ":0,
        "WlsPositionXEcefMeters":-3.1e6,"WlsPositionYEcefMeters":5.2e6,"WlsPositionZEcefMeters":1.6e6,
        "raw_latitude":14.6,"raw_longitude":121.0,"raw_altitude":10})";
    if (puv::TelemetryCodec::parseReading(both, parsed, err)) {
        std::cerr << "reading with both fixes should be rejected\n";
        return 1;
    }

    // Partial ECEF plus full raw counts as raw only; integer device id is accepted.
    std::string ecef_only = R"({"Cn0DbHz":30,"Svid":3,"SvElevationDegrees":40,"SvAzimuthDegrees":10,
        "IMU_MessageType":"UncalMag","MeasurementX":0,"MeasurementY":0,"MeasurementZ":0,
        "BiasX":0,"BiasY":0,"BiasZ":0,"device_id":42,
        "WlsPositionXEcefMeters":-3.1e6,"WlsPositionYEcefMeters":5.2e6,"WlsPositionZEcefMeters":1.6e6})";
    if (!puv::TelemetryCodec::parseReading(ecef_only, parsed, err)) {
        std::cerr << "ECEF-only reading should parse: " << err << "\n";
        return 1;
    }
    if (!std::holds_alternative<puv::EcefPosition>(parsed.fix) || parsed.device_id != "42") {
        std::cerr << "ECEF fix or numeric device id not carried through\n";
        return 1;
    }

    std::string wrong_type = R"({"Cn0DbHz":"strong","Svid":3})";
    if (puv::TelemetryCodec::parseReading(wrong_type, parsed, err)) {
        std::cerr << "string Cn0DbHz should be rejected\n";
        return 1;
    }

    return 0;
}
