#include "core/types.hpp"

namespace puv {

const char* vehicleStatusName(VehicleStatus status) {
    switch (status) {
        case VehicleStatus::Available: return "available";
        case VehicleStatus::Full: return "full";
        case VehicleStatus::Unavailable: return "unavailable";
    }
    return "unavailable";
}

bool parseVehicleStatus(const std::string& text, VehicleStatus& out) {
    if (text == "available") {
        out = VehicleStatus::Available;
        return true;
    }
    if (text == "full") {
        out = VehicleStatus::Full;
        return true;
    }
    if (text == "unavailable") {
        out = VehicleStatus::Unavailable;
        return true;
    }
    return false;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Decryption: return "decryption_error";
        case ErrorKind::SchemaValidation: return "schema_validation_error";
        case ErrorKind::ModelNotReady: return "model_not_ready";
        case ErrorKind::ModelUnavailable: return "model_unavailable";
        case ErrorKind::Inference: return "inference_error";
        case ErrorKind::GeometryUnavailable: return "geometry_unavailable";
        case ErrorKind::Persistence: return "persistence_warning";
        case ErrorKind::PushDispatch: return "push_dispatch_failure";
        case ErrorKind::Connection: return "connection_fault";
        case ErrorKind::Internal: return "internal_error";
    }
    return "internal_error";
}

}  // namespace puv
