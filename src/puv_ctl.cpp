#include "core/config.hpp"
#include "ipc/control_plane.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: puv_ctl <status|reload-models|sweep-now|stats> [config_path]\n";
        return 1;
    }

    const std::string command = argv[1];
    const std::string config_path = (argc > 2) ? argv[2] : "config/config.yaml";

    puv::AppConfig cfg;
    std::string err;
    if (!puv::loadConfig(config_path, cfg, err)) {
        std::cerr << "config load failed: " << err << "\n";
        return 1;
    }

    std::string response;
    if (!puv::ipc::unixControlRequest(cfg.server.control_socket, command + "\n", response, err)) {
        std::cerr << "control request failed: " << err << "\n";
        return 1;
    }

    std::cout << response;
    return response.rfind("OK", 0) == 0 ? 0 : 2;
}
