#pragma once

#include <string>

namespace puv {

struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    int port{8000};
    int io_threads{2};
    int blocking_threads{4}; // inference, store and push calls run here
    int ws_max_pending_messages{64};
    std::string control_socket{"/tmp/puvtrack.sock"};
};

struct TelemetryConfig {
    std::string aes_key_hex; // 64 hex chars, AES-256
    bool ground_truth_comparison{false};
};

struct ModelConfig {
    std::string onnx_path{"models/offset_model.onnx"};
    std::string feature_schema_path{"config/features.yaml"};
    bool autoload{true};
};

struct RoutingConfig {
    bool snapping_enabled{false};
    int cache_ttl_s{3600};
    double max_snap_distance_m{0.0}; // 0 = unlimited
};

struct EtaConfig {
    int history_window_s{300};
    int max_samples{30};
    int fresh_window_s{120};
    double percentile{0.7};
    double urban_speed_mps{8.33};
    double min_congested_speed_mps{2.78};
    double buffer_ratio{0.15};
    double max_buffer_min{5.0};
    int subscription_ttl_s{300}; // live ETA subscriptions expire this long after subscribing
};

struct ProximityConfig {
    double radius_m{500.0};
    int cooldown_s{300};
    std::string push_gateway{"realtime"}; // realtime | log
    std::string title{"PUV Nearby!"};
};

struct SchedulerConfig {
    int sweep_interval_ms{10000};
    int error_backoff_ms{5000};
    int inactivity_threshold_s{300};
    int inactivity_check_interval_ms{60000};
    int counts_interval_ms{5000};
    int eta_refresh_interval_ms{10000};
};

struct StoreConfig {
    std::string fixtures_path{"config/fixtures.yaml"};
    int tracking_log_max_per_device{2048};
};

struct AppConfig {
    ServerConfig server;
    TelemetryConfig telemetry;
    ModelConfig model;
    RoutingConfig routing;
    EtaConfig eta;
    ProximityConfig proximity;
    SchedulerConfig scheduler;
    StoreConfig store;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

}  // namespace puv
