#include "correction/offset_model.hpp"

#include <algorithm>
#include <cmath>

namespace puv {

bool FeatureSchema::load(const std::string& path, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            error = "failed to open feature schema: " + path;
            return false;
        }

        FeatureSchema loaded;
        fs["features"] >> loaded.features;
        fs["scaler_center"] >> loaded.center;
        fs["scaler_scale"] >> loaded.scale;

        const cv::FileNode categorical = fs["categorical"];
        if (!categorical.empty() && categorical.isMap()) {
            for (cv::FileNodeIterator it = categorical.begin(); it != categorical.end(); ++it) {
                const cv::FileNode entry = *it;
                std::vector<std::string> classes;
                entry >> classes;
                loaded.label_classes[entry.name()] = classes;
            }
        }

        if (!loaded.validate(error)) {
            return false;
        }
        *this = std::move(loaded);
    } catch (const cv::Exception& e) {
        error = "feature schema parse failed: " + std::string(e.what());
        return false;
    }
    error.clear();
    return true;
}

bool FeatureSchema::validate(std::string& error) const {
    if (features.empty()) {
        error = "feature schema lists no features";
        return false;
    }
    if (!center.empty() && center.size() != features.size()) {
        error = "scaler_center size does not match feature count";
        return false;
    }
    if (!scale.empty() && scale.size() != features.size()) {
        error = "scaler_scale size does not match feature count";
        return false;
    }
    for (const auto& kv : label_classes) {
        if (std::find(features.begin(), features.end(), kv.first) == features.end()) {
            error = "categorical feature '" + kv.first + "' is not in the feature list";
            return false;
        }
        if (kv.second.empty()) {
            error = "categorical feature '" + kv.first + "' has no classes";
            return false;
        }
    }
    error.clear();
    return true;
}

bool FeatureSchema::vectorize(const FeatureInput& input, cv::Mat& row, std::string& error) const {
    row.create(1, static_cast<int>(features.size()), CV_32F);
    for (std::size_t i = 0; i < features.size(); ++i) {
        const std::string& name = features[i];
        double value = 0.0;

        const auto classes = label_classes.find(name);
        if (classes != label_classes.end()) {
            const auto cat = input.categorical.find(name);
            if (cat == input.categorical.end()) {
                error = "missing categorical feature '" + name + "'";
                return false;
            }
            const auto pos = std::find(classes->second.begin(), classes->second.end(), cat->second);
            if (pos == classes->second.end()) {
                error = "unknown value '" + cat->second + "' for feature '" + name + "'";
                return false;
            }
            value = static_cast<double>(pos - classes->second.begin());
        } else {
            const auto num = input.numeric.find(name);
            if (num == input.numeric.end()) {
                error = "missing numeric feature '" + name + "'";
                return false;
            }
            value = num->second;
        }

        if (!center.empty()) {
            value -= center[i];
        }
        if (!scale.empty() && std::abs(scale[i]) > 1e-12) {
            value /= scale[i];
        }
        row.at<float>(0, static_cast<int>(i)) = static_cast<float>(value);
    }
    error.clear();
    return true;
}

bool DnnOffsetModel::load(const std::string& onnx_path, const std::string& schema_path, std::string& error) {
    FeatureSchema schema;
    if (!schema.load(schema_path, error)) {
        return false;
    }

    cv::dnn::Net net;
    try {
        net = cv::dnn::readNetFromONNX(onnx_path);
    } catch (const cv::Exception& e) {
        error = "failed to read ONNX model " + onnx_path + ": " + e.what();
        return false;
    }
    if (net.empty()) {
        error = "ONNX model is empty: " + onnx_path;
        return false;
    }
    net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

    std::lock_guard<std::mutex> lock(mutex_);
    schema_ = std::move(schema);
    net_ = net;
    error.clear();
    return true;
}

bool DnnOffsetModel::predict(const FeatureInput& input, cv::Vec2d& offset_deg, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (net_.empty()) {
        error = "model not loaded";
        return false;
    }

    cv::Mat row;
    if (!schema_.vectorize(input, row, error)) {
        return false;
    }

    cv::Mat out;
    try {
        net_.setInput(row);
        out = net_.forward();
    } catch (const cv::Exception& e) {
        error = std::string("forward pass failed: ") + e.what();
        return false;
    }
    if (out.total() < 2) {
        error = "model produced fewer than two outputs";
        return false;
    }

    cv::Mat flat;
    out.reshape(1, 1).convertTo(flat, CV_64F);
    offset_deg = cv::Vec2d(flat.at<double>(0, 0), flat.at<double>(0, 1));
    if (!std::isfinite(offset_deg[0]) || !std::isfinite(offset_deg[1])) {
        error = "model produced a non-finite offset";
        return false;
    }
    error.clear();
    return true;
}

}  // namespace puv
