#include "core/config.hpp"
#include "core/math_utils.hpp"
#include "ingest/telemetry_codec.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct SimArgs {
    std::string config_path{"config/config.yaml"};
    std::string device_id{"dev-001"};
    double latitude{14.5995};
    double longitude{120.9842};
    double heading_deg{45.0};
    double speed_mps{8.0};
    int count{10};
    int interval_ms{1000};
    bool raw_latlon{false};
    std::string post_host;
    std::string post_port{"8000"};
};

bool parseArgs(int argc, char** argv, SimArgs& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) out.config_path = argv[++i];
        else if (arg == "--device" && has_value) out.device_id = argv[++i];
        else if (arg == "--lat" && has_value) out.latitude = std::atof(argv[++i]);
        else if (arg == "--lon" && has_value) out.longitude = std::atof(argv[++i]);
        else if (arg == "--heading" && has_value) out.heading_deg = std::atof(argv[++i]);
        else if (arg == "--speed" && has_value) out.speed_mps = std::atof(argv[++i]);
        else if (arg == "--count" && has_value) out.count = std::atoi(argv[++i]);
        else if (arg == "--interval-ms" && has_value) out.interval_ms = std::atoi(argv[++i]);
        else if (arg == "--raw") out.raw_latlon = true;
        else if (arg == "--post" && has_value) out.post_host = argv[++i];
        else if (arg == "--port" && has_value) out.post_port = argv[++i];
        else return false;
    }
    return out.count > 0 && out.interval_ms >= 0;
}

bool postEnvelope(const SimArgs& args, const std::string& envelope, std::string& reply, std::string& error) {
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        stream.connect(resolver.resolve(args.post_host, args.post_port));

        http::request<http::string_body> req{http::verb::post, "/predict", 11};
        req.set(http::field::host, args.post_host);
        req.set(http::field::content_type, "application/json");
        req.body() = nlohmann::json{{"encrypted_data", envelope}}.dump();
        req.prepare_payload();
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);
        reply = std::to_string(res.result_int()) + " " + res.body();

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    SimArgs args;
    if (!parseArgs(argc, argv, args)) {
        std::cerr << "usage: puv_device_sim [--config path] [--device id] [--lat deg] [--lon deg] [--heading deg]\n"
                     "                      [--speed m/s] [--count n] [--interval-ms ms] [--raw] [--post host [--port p]]\n";
        return 1;
    }

    puv::AppConfig cfg;
    std::string err;
    if (!puv::loadConfig(args.config_path, cfg, err)) {
        std::cerr << "config load failed: " << err << "\n";
        return 1;
    }
    puv::TelemetryCodec codec;
    if (!codec.setKeyHex(cfg.telemetry.aes_key_hex, err)) {
        std::cerr << "telemetry key rejected: " << err << "\n";
        return 1;
    }

    const double heading = puv::degreesToRadians(args.heading_deg);
    const puv::GeoPoint origin{args.latitude, args.longitude};
    for (int i = 0; i < args.count; ++i) {
        const double along = args.speed_mps * static_cast<double>(i) * static_cast<double>(args.interval_ms) / 1000.0;
        const puv::GeoPoint p = puv::fromLocalMeters(origin, cv::Point2d(along * std::sin(heading), along * std::cos(heading)));

        puv::TelemetryReading reading;
        reading.device_id = args.device_id;
        reading.cn0_dbhz = 38.0 + (i % 5);
        reading.svid = 5 + (i % 20);
        reading.sv_elevation_deg = 45.0;
        reading.sv_azimuth_deg = 120.0;
        reading.imu_message_type = "UncalAccel";
        reading.measurement = cv::Vec3d(0.02, -0.01, 9.81);
        reading.bias = cv::Vec3d(0.0, 0.0, 0.0);
        reading.speed_mps = args.speed_mps;
        if (args.raw_latlon) {
            reading.fix = puv::GeodeticPosition{p.latitude, p.longitude, 15.0};
        } else {
            reading.fix = puv::EcefPosition{puv::geodeticToEcef(p.latitude, p.longitude, 15.0)};
        }

        std::string envelope;
        if (!codec.encryptEnvelope(puv::TelemetryCodec::serializeReading(reading), envelope, err)) {
            std::cerr << "encrypt failed: " << err << "\n";
            return 1;
        }

        if (args.post_host.empty()) {
            std::cout << envelope << "\n";
        } else {
            std::string reply;
            if (!postEnvelope(args, envelope, reply, err)) {
                std::cerr << "post failed: " << err << "\n";
                return 1;
            }
            std::cout << "fix " << i << " -> " << reply << "\n";
        }

        if (i + 1 < args.count && args.interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(args.interval_ms));
        }
    }
    return 0;
}
