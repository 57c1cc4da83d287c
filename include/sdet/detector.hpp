#pragma once
#include "detection.hpp"
#include <opencv2/dnn.hpp>
#include <memory>
#include <string>
#include <vector>

namespace sdet {
struct SessionConfig;

// One instance per session. The loaded model is only read by infer().
class Detector {
public:
    virtual ~Detector() = default;
    // Throws ModelLoadError when the weights are missing or incompatible.
    virtual void load(const std::string& weights) = 0;
    virtual void unload() = 0;
    virtual bool loaded() const = 0;
    // Confidence filter then same-class suppression. Throws InferenceError on
    // malformed input. Same frame and model always give the same result.
    virtual Dets infer(const Frame& f, float conf, float iou) = 0;
};

// YOLO OBB exported to ONNX, run through cv::dnn.
class DnnObbDetector : public Detector {
public:
    explicit DnnObbDetector(const SessionConfig& cfg);

    void load(const std::string& weights) override;
    void unload() override;
    bool loaded() const override { return !net_.empty(); }
    Dets infer(const Frame& f, float conf, float iou) override;

private:
    cv::Mat forward(const cv::Mat& blob);

    cv::dnn::Net net_;
    std::vector<std::string> out_names_;
    std::vector<std::string> names_;
    std::string backend_;
    std::string labels_path_;
    int input_ = 640;
    int classes_ = 0;
};

// DOTA v1 class names, the set the public OBB checkpoints are trained on.
const std::vector<std::string>& default_obb_labels();
// One name per line, blank lines skipped. Throws ModelLoadError if unreadable.
std::vector<std::string> load_labels(const std::string& path);

std::unique_ptr<Detector> make_dnn_detector(const SessionConfig& cfg);
}
