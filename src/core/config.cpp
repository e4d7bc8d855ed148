#include "core/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

#include <opencv2/core.hpp>

namespace puv {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    if (node.empty()) {
        return;
    }
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

bool isHexKey(const std::string& s) {
    if (s.size() != 64) {
        return false;
    }
    for (const char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void applyEnvOverrides(AppConfig& out) {
    if (const char* key = std::getenv("PUV_TELEMETRY_KEY")) {
        out.telemetry.aes_key_hex = key;
    }
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == '%') {
            continue;
        }

        // section header, e.g. "server:"
        if (!t.empty() && t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        // strip inline comment
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "server") {
                if (key == "bind_address") out.server.bind_address = value;
                else if (key == "port") out.server.port = std::stoi(value);
                else if (key == "io_threads") out.server.io_threads = std::stoi(value);
                else if (key == "blocking_threads") out.server.blocking_threads = std::stoi(value);
                else if (key == "ws_max_pending_messages") out.server.ws_max_pending_messages = std::stoi(value);
                else if (key == "control_socket") out.server.control_socket = value;
            } else if (section == "telemetry") {
                if (key == "aes_key_hex") out.telemetry.aes_key_hex = value;
                else if (key == "ground_truth_comparison") {
                    bool b = out.telemetry.ground_truth_comparison;
                    if (toBool(value, b)) out.telemetry.ground_truth_comparison = b;
                }
            } else if (section == "model") {
                if (key == "onnx_path") out.model.onnx_path = value;
                else if (key == "feature_schema_path") out.model.feature_schema_path = value;
                else if (key == "autoload") {
                    bool b = out.model.autoload;
                    if (toBool(value, b)) out.model.autoload = b;
                }
            } else if (section == "routing") {
                if (key == "snapping_enabled") {
                    bool b = out.routing.snapping_enabled;
                    if (toBool(value, b)) out.routing.snapping_enabled = b;
                } else if (key == "cache_ttl_s") out.routing.cache_ttl_s = std::stoi(value);
                else if (key == "max_snap_distance_m") out.routing.max_snap_distance_m = std::stod(value);
            } else if (section == "eta") {
                if (key == "history_window_s") out.eta.history_window_s = std::stoi(value);
                else if (key == "max_samples") out.eta.max_samples = std::stoi(value);
                else if (key == "fresh_window_s") out.eta.fresh_window_s = std::stoi(value);
                else if (key == "percentile") out.eta.percentile = std::stod(value);
                else if (key == "urban_speed_mps") out.eta.urban_speed_mps = std::stod(value);
                else if (key == "min_congested_speed_mps") out.eta.min_congested_speed_mps = std::stod(value);
                else if (key == "buffer_ratio") out.eta.buffer_ratio = std::stod(value);
                else if (key == "max_buffer_min") out.eta.max_buffer_min = std::stod(value);
                else if (key == "subscription_ttl_s") out.eta.subscription_ttl_s = std::stoi(value);
            } else if (section == "proximity") {
                if (key == "radius_m") out.proximity.radius_m = std::stod(value);
                else if (key == "cooldown_s") out.proximity.cooldown_s = std::stoi(value);
                else if (key == "push_gateway") out.proximity.push_gateway = value;
                else if (key == "title") out.proximity.title = value;
            } else if (section == "scheduler") {
                if (key == "sweep_interval_ms") out.scheduler.sweep_interval_ms = std::stoi(value);
                else if (key == "error_backoff_ms") out.scheduler.error_backoff_ms = std::stoi(value);
                else if (key == "inactivity_threshold_s") out.scheduler.inactivity_threshold_s = std::stoi(value);
                else if (key == "inactivity_check_interval_ms") out.scheduler.inactivity_check_interval_ms = std::stoi(value);
                else if (key == "counts_interval_ms") out.scheduler.counts_interval_ms = std::stoi(value);
                else if (key == "eta_refresh_interval_ms") out.scheduler.eta_refresh_interval_ms = std::stoi(value);
            } else if (section == "store") {
                if (key == "fixtures_path") out.store.fixtures_path = value;
                else if (key == "tracking_log_max_per_device") out.store.tracking_log_max_per_device = std::stoi(value);
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    applyEnvOverrides(out);
    return validateConfig(out, error);
}

}  // namespace

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.server.port <= 0 || cfg.server.port > 65535) {
        error = "server.port must be in [1, 65535]";
        return false;
    }
    if (cfg.server.io_threads <= 0 || cfg.server.blocking_threads <= 0) {
        error = "server thread counts must be > 0";
        return false;
    }
    if (cfg.server.ws_max_pending_messages <= 0) {
        error = "server.ws_max_pending_messages must be > 0";
        return false;
    }
    if (!isHexKey(cfg.telemetry.aes_key_hex)) {
        error = "telemetry.aes_key_hex must be 64 hex characters";
        return false;
    }
    if (cfg.model.onnx_path.empty() || cfg.model.feature_schema_path.empty()) {
        error = "model.onnx_path and model.feature_schema_path must not be empty";
        return false;
    }
    if (cfg.routing.cache_ttl_s <= 0) {
        error = "routing.cache_ttl_s must be > 0";
        return false;
    }
    if (cfg.routing.max_snap_distance_m < 0.0) {
        error = "routing.max_snap_distance_m must be >= 0";
        return false;
    }
    if (cfg.eta.history_window_s <= 0 || cfg.eta.max_samples <= 0 || cfg.eta.fresh_window_s <= 0 ||
        cfg.eta.subscription_ttl_s <= 0) {
        error = "eta windows and max_samples must be > 0";
        return false;
    }
    if (cfg.eta.percentile <= 0.0 || cfg.eta.percentile >= 1.0) {
        error = "eta.percentile must be in (0,1)";
        return false;
    }
    if (cfg.eta.urban_speed_mps <= 0.0 || cfg.eta.min_congested_speed_mps <= 0.0) {
        error = "eta default speeds must be > 0";
        return false;
    }
    if (cfg.eta.buffer_ratio < 0.0 || cfg.eta.max_buffer_min < 0.0) {
        error = "eta buffer settings must be >= 0";
        return false;
    }
    if (cfg.proximity.radius_m <= 0.0) {
        error = "proximity.radius_m must be > 0";
        return false;
    }
    if (cfg.proximity.cooldown_s < 0) {
        error = "proximity.cooldown_s must be >= 0";
        return false;
    }
    if (cfg.proximity.push_gateway != "realtime" && cfg.proximity.push_gateway != "log") {
        error = "proximity.push_gateway must be 'realtime' or 'log'";
        return false;
    }
    if (cfg.scheduler.sweep_interval_ms <= 0 || cfg.scheduler.error_backoff_ms <= 0 ||
        cfg.scheduler.inactivity_check_interval_ms <= 0 || cfg.scheduler.counts_interval_ms <= 0 ||
        cfg.scheduler.eta_refresh_interval_ms <= 0) {
        error = "scheduler intervals must be > 0";
        return false;
    }
    if (cfg.scheduler.inactivity_threshold_s <= 0) {
        error = "scheduler.inactivity_threshold_s must be > 0";
        return false;
    }
    if (cfg.store.tracking_log_max_per_device <= 0) {
        error = "store.tracking_log_max_per_device must be > 0";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode server = fs["server"];
            const cv::FileNode telemetry = fs["telemetry"];
            const cv::FileNode model = fs["model"];
            const cv::FileNode routing = fs["routing"];
            const cv::FileNode eta = fs["eta"];
            const cv::FileNode proximity = fs["proximity"];
            const cv::FileNode scheduler = fs["scheduler"];
            const cv::FileNode store = fs["store"];

            readOrDefault(server, "bind_address", out.server.bind_address);
            readOrDefault(server, "port", out.server.port);
            readOrDefault(server, "io_threads", out.server.io_threads);
            readOrDefault(server, "blocking_threads", out.server.blocking_threads);
            readOrDefault(server, "ws_max_pending_messages", out.server.ws_max_pending_messages);
            readOrDefault(server, "control_socket", out.server.control_socket);

            readOrDefault(telemetry, "aes_key_hex", out.telemetry.aes_key_hex);
            readOrDefault(telemetry, "ground_truth_comparison", out.telemetry.ground_truth_comparison);

            readOrDefault(model, "onnx_path", out.model.onnx_path);
            readOrDefault(model, "feature_schema_path", out.model.feature_schema_path);
            readOrDefault(model, "autoload", out.model.autoload);

            readOrDefault(routing, "snapping_enabled", out.routing.snapping_enabled);
            readOrDefault(routing, "cache_ttl_s", out.routing.cache_ttl_s);
            readOrDefault(routing, "max_snap_distance_m", out.routing.max_snap_distance_m);

            readOrDefault(eta, "history_window_s", out.eta.history_window_s);
            readOrDefault(eta, "max_samples", out.eta.max_samples);
            readOrDefault(eta, "fresh_window_s", out.eta.fresh_window_s);
            readOrDefault(eta, "percentile", out.eta.percentile);
            readOrDefault(eta, "urban_speed_mps", out.eta.urban_speed_mps);
            readOrDefault(eta, "min_congested_speed_mps", out.eta.min_congested_speed_mps);
            readOrDefault(eta, "buffer_ratio", out.eta.buffer_ratio);
            readOrDefault(eta, "max_buffer_min", out.eta.max_buffer_min);
            readOrDefault(eta, "subscription_ttl_s", out.eta.subscription_ttl_s);

            readOrDefault(proximity, "radius_m", out.proximity.radius_m);
            readOrDefault(proximity, "cooldown_s", out.proximity.cooldown_s);
            readOrDefault(proximity, "push_gateway", out.proximity.push_gateway);
            readOrDefault(proximity, "title", out.proximity.title);

            readOrDefault(scheduler, "sweep_interval_ms", out.scheduler.sweep_interval_ms);
            readOrDefault(scheduler, "error_backoff_ms", out.scheduler.error_backoff_ms);
            readOrDefault(scheduler, "inactivity_threshold_s", out.scheduler.inactivity_threshold_s);
            readOrDefault(scheduler, "inactivity_check_interval_ms", out.scheduler.inactivity_check_interval_ms);
            readOrDefault(scheduler, "counts_interval_ms", out.scheduler.counts_interval_ms);
            readOrDefault(scheduler, "eta_refresh_interval_ms", out.scheduler.eta_refresh_interval_ms);

            readOrDefault(store, "fixtures_path", out.store.fixtures_path);
            readOrDefault(store, "tracking_log_max_per_device", out.store.tracking_log_max_per_device);

            applyEnvOverrides(out);
            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace puv
