#include "viewfinder/camera/SimulatedCamera.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace viewfinder {
namespace camera {

namespace {

constexpr const char* kComponent = "SimulatedCamera";
constexpr double kMeteredDurationUs = 1e6 / 60.0;
constexpr const char* kRawFormat = "BayerRGGB16";

// Luminance ramp with a checkerboard patch for hard edges
cv::Mat makeBaseScene(cv::Size size) {
    cv::Mat scene(size, CV_8UC3);
    for (int y = 0; y < size.height; ++y) {
        auto* row = scene.ptr<cv::Vec3b>(y);
        for (int x = 0; x < size.width; ++x) {
            const auto v = static_cast<uchar>(30 + (160 * x) / std::max(1, size.width - 1));
            row[x] = cv::Vec3b(v, static_cast<uchar>(std::min(255, v + 10)), v);
        }
    }

    const int cell = std::max(4, size.height / 12);
    const cv::Point origin(size.width / 3, size.height / 3);
    for (int cy = 0; cy < 4; ++cy) {
        for (int cx = 0; cx < 4; ++cx) {
            const cv::Scalar colour = ((cx + cy) % 2 == 0) ? cv::Scalar(235, 235, 235)
                                                           : cv::Scalar(20, 20, 20);
            cv::rectangle(scene,
                          cv::Rect(origin.x + cx * cell, origin.y + cy * cell, cell, cell),
                          colour, cv::FILLED);
        }
    }
    return scene;
}

} // namespace

// SimulatedCaptureDevice

SimulatedCaptureDevice::SimulatedCaptureDevice(const core::SimulatedDeviceConfig& config)
    : config_(config)
    , durationUs_(std::clamp<int64_t>(static_cast<int64_t>(kMeteredDurationUs),
                                      std::min(config.minExposureUs, config.maxExposureUs),
                                      std::max(config.minExposureUs, config.maxExposureUs)))
    , iso_(std::min(config.minISO, config.maxISO)) {}

CaptureDeviceProfile SimulatedCaptureDevice::profile() const {
    CaptureDeviceProfile p;
    p.deviceId = config_.id;
    p.name = config_.name;
    p.position = config_.position;
    p.lens = config_.lens;
    p.minISO = config_.minISO;
    p.maxISO = config_.maxISO;
    p.minExposureUs = config_.minExposureUs;
    p.maxExposureUs = config_.maxExposureUs;
    p.minExposureBias = config_.minExposureBias;
    p.maxExposureBias = config_.maxExposureBias;
    return p.normalized();
}

void SimulatedCaptureDevice::lockForConfiguration() {
    if (failLock_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAMERA_BUSY,
                              "Device " + config_.id + " is busy");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (locked_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAMERA_BUSY,
                              "Device " + config_.id + " is already locked");
    }
    locked_ = true;
    ++configurationCount_;
}

void SimulatedCaptureDevice::unlockForConfiguration() {
    std::lock_guard<std::mutex> lock(mutex_);
    locked_ = false;
}

void SimulatedCaptureDevice::requireLock(const char* operation) const {
    if (!locked_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_NOT_INITIALIZED,
                              std::string(operation) + " requires the configuration lock");
    }
}

bool SimulatedCaptureDevice::isExposureModeSupported(ExposureMode mode) const {
    return mode != ExposureMode::Custom || config_.customExposure;
}

bool SimulatedCaptureDevice::isFocusModeSupported(FocusMode mode) const {
    switch (mode) {
        case FocusMode::Locked:    return config_.lockedFocus;
        case FocusMode::AutoFocus: return config_.lockedFocus || config_.pointOfInterest;
        default:                   return true;
    }
}

bool SimulatedCaptureDevice::isWhiteBalanceModeSupported(WhiteBalanceMode mode) const {
    return mode != WhiteBalanceMode::Locked || config_.lockedWhiteBalance;
}

void SimulatedCaptureDevice::setExposureMode(ExposureMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setExposureMode");
    if (!isExposureModeSupported(mode)) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Exposure mode not supported");
    }
    exposureMode_ = mode;
}

void SimulatedCaptureDevice::setFocusMode(FocusMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setFocusMode");
    if (!isFocusModeSupported(mode)) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Focus mode not supported");
    }
    focusMode_ = mode;
}

void SimulatedCaptureDevice::setWhiteBalanceMode(WhiteBalanceMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setWhiteBalanceMode");
    if (!isWhiteBalanceModeSupported(mode)) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "White balance mode not supported");
    }
    whiteBalanceMode_ = mode;
}

void SimulatedCaptureDevice::setExposureModeCustom(int64_t durationUs, float iso) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setExposureModeCustom");
    if (!config_.customExposure) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Custom exposure not supported");
    }
    exposureMode_ = ExposureMode::Custom;
    durationUs_ = durationUs;
    iso_ = iso;
}

void SimulatedCaptureDevice::setFocusModeLocked(float lensPosition) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setFocusModeLocked");
    if (!config_.lockedFocus) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Locked focus not supported");
    }
    focusMode_ = FocusMode::Locked;
    lensPosition_ = lensPosition;
}

void SimulatedCaptureDevice::setFocusPointOfInterest(const cv::Point2f& point) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setFocusPointOfInterest");
    focusPoint_ = point;
}

void SimulatedCaptureDevice::setExposurePointOfInterest(const cv::Point2f& point) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setExposurePointOfInterest");
    exposurePoint_ = point;
}

void SimulatedCaptureDevice::setSubjectAreaChangeMonitoring(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setSubjectAreaChangeMonitoring");
    subjectAreaMonitoring_ = enabled;
}

WhiteBalanceGains SimulatedCaptureDevice::deviceWhiteBalanceGains(float kelvin) const {
    return CameraUtils::gainsForTemperature(kelvin);
}

void SimulatedCaptureDevice::setWhiteBalanceModeLocked(const WhiteBalanceGains& gains) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setWhiteBalanceModeLocked");
    if (!config_.lockedWhiteBalance) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Locked white balance not supported");
    }
    whiteBalanceMode_ = WhiteBalanceMode::Locked;
    gains_ = gains;
}

float SimulatedCaptureDevice::exposureTargetBias() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bias_;
}

void SimulatedCaptureDevice::setExposureTargetBias(float bias) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireLock("setExposureTargetBias");
    bias_ = bias;
}

ExposureMode SimulatedCaptureDevice::exposureMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exposureMode_;
}

FocusMode SimulatedCaptureDevice::focusMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focusMode_;
}

WhiteBalanceMode SimulatedCaptureDevice::whiteBalanceMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return whiteBalanceMode_;
}

int64_t SimulatedCaptureDevice::exposureDurationUs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durationUs_;
}

float SimulatedCaptureDevice::iso() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return iso_;
}

float SimulatedCaptureDevice::lensPosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lensPosition_;
}

WhiteBalanceGains SimulatedCaptureDevice::whiteBalanceGains() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gains_;
}

cv::Point2f SimulatedCaptureDevice::focusPointOfInterest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focusPoint_;
}

cv::Point2f SimulatedCaptureDevice::exposurePointOfInterest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exposurePoint_;
}

bool SimulatedCaptureDevice::subjectAreaChangeMonitoring() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subjectAreaMonitoring_;
}

bool SimulatedCaptureDevice::isLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

int SimulatedCaptureDevice::configurationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configurationCount_;
}

double SimulatedCaptureDevice::exposureGain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double gain;
    if (exposureMode_ == ExposureMode::Custom) {
        gain = (iso_ / 100.0) * (durationUs_ / kMeteredDurationUs);
    } else {
        gain = std::pow(2.0, bias_);
    }
    return std::clamp(gain, 0.05, 8.0);
}

// SimulatedCaptureSession

SimulatedCaptureSession::SimulatedCaptureSession(
    const std::vector<core::SimulatedDeviceConfig>& devices,
    double frameRate,
    cv::Size previewSize)
    : frameRate_(frameRate > 0.0 ? frameRate : 60.0)
    , previewSize_(previewSize) {
    for (const auto& config : devices) {
        devices_.push_back(std::make_shared<SimulatedCaptureDevice>(config));
    }
    VIEWFINDER_LOG_INFO(kComponent) << "Simulated body with " << devices_.size()
                                    << " camera module(s), " << previewSize_.width << "x"
                                    << previewSize_.height << " @ " << frameRate_ << " fps";
}

SimulatedCaptureSession::~SimulatedCaptureSession() {
    stopRunning();
}

std::shared_ptr<CaptureDevice> SimulatedCaptureSession::findDevice(DevicePosition position,
                                                                   LensClass lens) {
    for (const auto& device : devices_) {
        const auto& config = device->config();
        if (config.position == position && config.lens == lens) {
            return device;
        }
    }
    return nullptr;
}

std::shared_ptr<SimulatedCaptureDevice> SimulatedCaptureSession::device(const std::string& id) const {
    for (const auto& device : devices_) {
        if (device->id() == id) {
            return device;
        }
    }
    return nullptr;
}

void SimulatedCaptureSession::beginConfiguration() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++configDepth_;
}

void SimulatedCaptureSession::commitConfiguration() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configDepth_ == 0) {
        VIEWFINDER_LOG_WARNING(kComponent) << "commitConfiguration without beginConfiguration";
        return;
    }
    if (--configDepth_ == 0) {
        VIEWFINDER_LOG_DEBUG(kComponent) << "Configuration committed, input "
                                         << (input_ ? input_->id() : std::string("none"));
    }
}

int SimulatedCaptureSession::configurationDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configDepth_;
}

bool SimulatedCaptureSession::canAddInput(const std::shared_ptr<CaptureDevice>& device) const {
    if (!device || rejectInputs_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !input_ && std::dynamic_pointer_cast<SimulatedCaptureDevice>(device) != nullptr;
}

void SimulatedCaptureSession::addInput(const std::shared_ptr<CaptureDevice>& device) {
    auto simulated = std::dynamic_pointer_cast<SimulatedCaptureDevice>(device);
    if (!simulated) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_INVALID_PARAMETER,
                              "Device does not belong to the simulated session");
    }
    if (failAddInput_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Simulated failure adding " + simulated->id());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (input_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAMERA_BUSY,
                              "Session already has input " + input_->id());
    }
    input_ = simulated;
}

void SimulatedCaptureSession::removeInput() {
    std::lock_guard<std::mutex> lock(mutex_);
    input_.reset();
}

std::shared_ptr<CaptureDevice> SimulatedCaptureSession::currentInput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return input_;
}

std::shared_ptr<SimulatedCaptureDevice> SimulatedCaptureSession::activeSimulatedDevice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return input_;
}

void SimulatedCaptureSession::startRunning() {
    if (!activeSimulatedDevice()) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_NOT_INITIALIZED,
                              "Cannot start a session without input");
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    ++startCount_;
    streamThread_ = std::thread(&SimulatedCaptureSession::streamLoop, this);
}

void SimulatedCaptureSession::stopRunning() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(streamMutex_);
    }
    streamCv_.notify_all();
    if (streamThread_.joinable()) {
        streamThread_.join();
    }
}

void SimulatedCaptureSession::setFrameHandler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

StillCapabilities SimulatedCaptureSession::stillCapabilities() const {
    StillCapabilities caps;
    auto device = activeSimulatedDevice();
    if (!device) {
        return caps;
    }
    const auto& config = device->config();
    caps.maxDimensions = cv::Size(config.stillWidth, config.stillHeight);
    caps.rawSupported = config.rawSupported;
    if (config.rawSupported) {
        caps.rawFormats.push_back(kRawFormat);
    }
    return caps;
}

StillImage SimulatedCaptureSession::captureStill(const StillCaptureSettings& settings) {
    auto device = activeSimulatedDevice();
    if (!device) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_NOT_INITIALIZED,
                              "No input for still capture");
    }
    if (failStills_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Simulated still capture failure");
    }

    const auto& config = device->config();
    const bool wantRaw = settings.format == StillFormat::RawWithProcessedPreview;
    if (wantRaw && !config.rawSupported) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Raw capture not supported by " + config.id);
    }

    cv::Size size(config.stillWidth, config.stillHeight);
    if (settings.maxDimensions.area() > 0) {
        size = cv::Size(std::min(size.width, settings.maxDimensions.width),
                        std::min(size.height, settings.maxDimensions.height));
    }

    StillImage still;
    still.processed = renderScene(size, framesDelivered_, 3);
    if (wantRaw) {
        cv::Mat gray;
        cv::cvtColor(still.processed, gray, cv::COLOR_BGR2GRAY);
        gray.convertTo(still.raw, CV_16U, 257.0);
        still.rawFormat = settings.rawFormat.empty() ? kRawFormat : settings.rawFormat;
    }
    return still;
}

cv::Mat SimulatedCaptureSession::renderScene(cv::Size size, uint64_t sequence, int channels) const {
    cv::Mat scene = makeBaseScene(size);

    // Moving bar
    const int barWidth = std::max(2, size.width / 20);
    const int travel = std::max(1, size.width - barWidth);
    const int x = static_cast<int>((sequence * 4) % static_cast<uint64_t>(travel));
    cv::rectangle(scene, cv::Rect(x, 0, barWidth, size.height / 4), cv::Scalar(200, 120, 60),
                  cv::FILLED);

    auto device = activeSimulatedDevice();
    const double gain = device ? device->exposureGain() : 1.0;
    if (std::fabs(gain - 1.0) > 1e-3) {
        scene.convertTo(scene, -1, gain);
    }

    if (channels == 4) {
        cv::Mat bgra;
        cv::cvtColor(scene, bgra, cv::COLOR_BGR2BGRA);
        return bgra;
    }
    return scene;
}

void SimulatedCaptureSession::streamLoop() {
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / frameRate_));
    auto next = std::chrono::steady_clock::now();
    uint64_t sequence = 0;

    VIEWFINDER_LOG_DEBUG(kComponent) << "Streaming started";
    while (running_) {
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }

        if (handler && activeSimulatedDevice()) {
            Frame frame;
            frame.sequence = sequence++;
            frame.timestampNs = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(
                    std::chrono::steady_clock::now().time_since_epoch()).count());
            frame.image = renderScene(previewSize_, frame.sequence, 4);
            handler(frame);
            ++framesDelivered_;
        }

        next += period;
        const auto now = std::chrono::steady_clock::now();
        if (next < now) {
            // Running late: skip the missed slots instead of bursting
            next = now;
        }
        std::unique_lock<std::mutex> lock(streamMutex_);
        streamCv_.wait_until(lock, next, [this] { return !running_; });
    }
    VIEWFINDER_LOG_DEBUG(kComponent) << "Streaming stopped after " << framesDelivered_ << " frames";
}

} // namespace camera
} // namespace viewfinder
