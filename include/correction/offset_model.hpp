#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

namespace puv {

struct FeatureInput {
    std::map<std::string, double> numeric;
    std::map<std::string, std::string> categorical;
};

// Inference capability: feature vector in, (dlat, dlon) in degrees out.
class OffsetModel {
public:
    virtual ~OffsetModel() = default;
    virtual bool predict(const FeatureInput& input, cv::Vec2d& offset_deg, std::string& error) = 0;
};

// Column order, label encoders and robust-scaler parameters the regressor was trained with.
struct FeatureSchema {
    std::vector<std::string> features;
    std::map<std::string, std::vector<std::string>> label_classes;
    std::vector<double> center;
    std::vector<double> scale;

    bool load(const std::string& path, std::string& error);
    bool validate(std::string& error) const;
    bool vectorize(const FeatureInput& input, cv::Mat& row, std::string& error) const;
};

class DnnOffsetModel : public OffsetModel {
public:
    bool load(const std::string& onnx_path, const std::string& schema_path, std::string& error);
    bool predict(const FeatureInput& input, cv::Vec2d& offset_deg, std::string& error) override;

private:
    FeatureSchema schema_;
    std::mutex mutex_; // cv::dnn::Net::forward is not reentrant
    cv::dnn::Net net_;
};

}  // namespace puv
