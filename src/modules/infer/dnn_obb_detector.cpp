#include "sdet/detector.hpp"
#include "sdet/errors.hpp"
#include "sdet/logger.hpp"
#include "sdet/postprocess.hpp"
#include "sdet/preprocess.hpp"
#include "sdet/session.hpp"
#include <filesystem>
#include <fstream>

namespace sdet {
const std::vector<std::string>& default_obb_labels() {
    static const std::vector<std::string> names{
        "plane", "ship", "storage tank", "baseball diamond", "tennis court",
        "basketball court", "ground track field", "harbor", "bridge", "large vehicle",
        "small vehicle", "helicopter", "roundabout", "soccer ball field", "swimming pool"};
    return names;
}

std::vector<std::string> load_labels(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ModelLoadError("cannot read labels " + path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (!line.empty()) out.push_back(line);
    }
    if (out.empty()) throw ModelLoadError("labels file is empty: " + path);
    return out;
}

DnnObbDetector::DnnObbDetector(const SessionConfig& cfg)
    : backend_(cfg.dnn_backend), labels_path_(cfg.labels), input_(cfg.model_input_size) {}

void DnnObbDetector::load(const std::string& weights) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(weights, ec)) throw ModelLoadError("weights not found: " + weights);
    names_ = labels_path_.empty() ? default_obb_labels() : load_labels(labels_path_);
    try {
        net_ = cv::dnn::readNet(weights);
        if (net_.empty()) throw ModelLoadError("no network in " + weights);
        if (backend_ == "cuda") {
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
        } else if (backend_ == "opencl") {
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_OPENCL);
        } else {
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        }
        out_names_ = net_.getUnconnectedOutLayersNames();

        // warm-up pass doubles as a layout check
        cv::Mat blank(input_, input_, CV_8UC3, cv::Scalar::all(114));
        cv::Mat out = forward(cv::dnn::blobFromImage(blank, 1.0 / 255.0, cv::Size(), cv::Scalar(), true, false));
        classes_ = obb_class_count(out);
    } catch (const cv::Exception& e) {
        net_ = cv::dnn::Net();
        throw ModelLoadError("cannot load " + weights + ": " + e.what());
    }
    if (classes_ <= 0) {
        net_ = cv::dnn::Net();
        throw ModelLoadError(weights + " does not produce an oriented-box head");
    }
    if (classes_ != static_cast<int>(names_.size()))
        Logger::warn("[detect] model has %d classes, %zu labels known", classes_, names_.size());
    Logger::info("[detect] loaded %s (%d classes, input %d, backend %s)", weights.c_str(), classes_, input_,
                 backend_.c_str());
}

void DnnObbDetector::unload() {
    net_ = cv::dnn::Net();
    out_names_.clear();
    classes_ = 0;
}

cv::Mat DnnObbDetector::forward(const cv::Mat& blob) {
    net_.setInput(blob);
    std::vector<cv::Mat> outs;
    net_.forward(outs, out_names_);
    if (outs.empty()) return cv::Mat();
    return outs[0];
}

Dets DnnObbDetector::infer(const Frame& f, float conf, float iou) {
    if (net_.empty()) throw InferenceError("model not loaded");
    if (f.bgr.empty()) throw InferenceError("empty frame " + std::to_string(f.seq));
    if (f.bgr.type() != CV_8UC3)
        throw InferenceError("frame " + std::to_string(f.seq) + ": expected 8-bit 3-channel image, got " +
                             std::to_string(f.bgr.channels()) + " channel(s)");
    try {
        LetterboxInfo lb;
        cv::Mat in = letterbox(f.bgr, input_, lb);
        cv::Mat out = forward(cv::dnn::blobFromImage(in, 1.0 / 255.0, cv::Size(), cv::Scalar(), true, false));
        if (obb_class_count(out) != classes_) throw InferenceError("unexpected output shape");
        return NMS(decode_obb(out, conf, lb, names_), iou);
    } catch (const cv::Exception& e) {
        throw InferenceError("frame " + std::to_string(f.seq) + ": " + e.what());
    }
}

std::unique_ptr<Detector> make_dnn_detector(const SessionConfig& cfg) {
    return std::make_unique<DnnObbDetector>(cfg);
}
}
