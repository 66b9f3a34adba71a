#include "viewfinder/camera/LibcameraCaptureSession.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"

#include <opencv2/imgproc.hpp>

#include <sys/mman.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>

using namespace libcamera;

namespace viewfinder {
namespace camera {

namespace {

constexpr const char* kComponent = "LibcameraSession";
constexpr unsigned int kBufferCount = 4;
constexpr auto kLockTimeout = std::chrono::milliseconds(200);
constexpr auto kStillTimeout = std::chrono::seconds(2);
constexpr float kIsoPerUnitGain = 100.0f;

std::mutex managerMutex;

} // namespace

// LibcameraCaptureDevice

LibcameraCaptureDevice::LibcameraCaptureDevice(std::shared_ptr<Camera> camera, LensClass lens)
    : camera_(std::move(camera))
    , pending_(controls::controls) {
    const ControlList& props = camera_->properties();
    const int32_t location = props.get(properties::Location).value_or(properties::CameraLocationBack);

    profile_.deviceId = camera_->id();
    profile_.name = props.get(properties::Model).value_or(camera_->id());
    profile_.position = location == properties::CameraLocationFront ? DevicePosition::Front
                                                                   : DevicePosition::Back;
    profile_.lens = lens;

    const ControlInfoMap& info = camera_->controls();
    auto exposure = info.find(&controls::ExposureTime);
    if (exposure != info.end()) {
        profile_.minExposureUs = exposure->second.min().get<int32_t>();
        profile_.maxExposureUs = exposure->second.max().get<int32_t>();
    }
    auto gain = info.find(&controls::AnalogueGain);
    if (gain != info.end()) {
        profile_.minISO = gain->second.min().get<float>() * kIsoPerUnitGain;
        profile_.maxISO = gain->second.max().get<float>() * kIsoPerUnitGain;
    }
    auto ev = info.find(&controls::ExposureValue);
    if (ev != info.end()) {
        profile_.minExposureBias = ev->second.min().get<float>();
        profile_.maxExposureBias = ev->second.max().get<float>();
    } else {
        profile_.minExposureBias = 0.0f;
        profile_.maxExposureBias = 0.0f;
    }
    profile_ = profile_.normalized();
}

bool LibcameraCaptureDevice::hasControl(const ControlId& id) const {
    return camera_->controls().count(&id) > 0;
}

void LibcameraCaptureDevice::requireSupport(bool supported, const char* what) const {
    if (!supported) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              std::string(what) + " not supported by " + camera_->id());
    }
}

void LibcameraCaptureDevice::lockForConfiguration() {
    if (!configMutex_.try_lock_for(kLockTimeout)) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAMERA_BUSY,
                              "Timed out locking " + camera_->id() + " for configuration");
    }
}

void LibcameraCaptureDevice::unlockForConfiguration() {
    configMutex_.unlock();
}

bool LibcameraCaptureDevice::isExposureModeSupported(ExposureMode mode) const {
    if (!hasControl(controls::AeEnable)) {
        return false;
    }
    if (mode == ExposureMode::Custom) {
        return hasControl(controls::ExposureTime) && hasControl(controls::AnalogueGain);
    }
    return true;
}

bool LibcameraCaptureDevice::isFocusModeSupported(FocusMode mode) const {
    if (!hasControl(controls::AfMode)) {
        return false;
    }
    switch (mode) {
        case FocusMode::Locked:    return hasControl(controls::LensPosition);
        case FocusMode::AutoFocus: return hasControl(controls::AfTrigger);
        default:                   return true;
    }
}

bool LibcameraCaptureDevice::isWhiteBalanceModeSupported(WhiteBalanceMode mode) const {
    if (!hasControl(controls::AwbEnable)) {
        return false;
    }
    return mode != WhiteBalanceMode::Locked || hasControl(controls::ColourGains);
}

bool LibcameraCaptureDevice::isFocusPointOfInterestSupported() const {
    return hasControl(controls::AfMetering) && hasControl(controls::AfWindows);
}

void LibcameraCaptureDevice::setExposureMode(ExposureMode mode) {
    requireSupport(isExposureModeSupported(mode), "Exposure mode");
    setPending(controls::AeEnable, mode != ExposureMode::Locked && mode != ExposureMode::Custom);
}

void LibcameraCaptureDevice::setFocusMode(FocusMode mode) {
    requireSupport(isFocusModeSupported(mode), "Focus mode");
    switch (mode) {
        case FocusMode::Locked:
            setPending(controls::AfMode, controls::AfModeManual);
            break;
        case FocusMode::AutoFocus:
            setPending(controls::AfMode, controls::AfModeAuto);
            setPending(controls::AfTrigger, controls::AfTriggerStart);
            break;
        case FocusMode::ContinuousAutoFocus:
            setPending(controls::AfMode, controls::AfModeContinuous);
            break;
    }
}

void LibcameraCaptureDevice::setWhiteBalanceMode(WhiteBalanceMode mode) {
    requireSupport(isWhiteBalanceModeSupported(mode), "White balance mode");
    setPending(controls::AwbEnable, mode != WhiteBalanceMode::Locked);
}

void LibcameraCaptureDevice::setExposureModeCustom(int64_t durationUs, float iso) {
    requireSupport(isExposureModeSupported(ExposureMode::Custom), "Custom exposure");
    setPending(controls::AeEnable, false);
    setPending(controls::ExposureTime, static_cast<int32_t>(durationUs));
    setPending(controls::AnalogueGain, iso / kIsoPerUnitGain);
}

void LibcameraCaptureDevice::setFocusModeLocked(float lensPosition) {
    requireSupport(isFocusModeSupported(FocusMode::Locked), "Locked focus");

    // LensPosition is in dioptres: 0 is infinity, the maximum is the closest distance
    const ControlInfoMap& info = camera_->controls();
    const float maxDioptres = info.find(&controls::LensPosition)->second.max().get<float>();
    setPending(controls::AfMode, controls::AfModeManual);
    setPending(controls::LensPosition, (1.0f - lensPosition) * maxDioptres);
}

void LibcameraCaptureDevice::setFocusPointOfInterest(const cv::Point2f& point) {
    requireSupport(isFocusPointOfInterestSupported(), "Focus point of interest");

    const Rectangle crop = camera_->properties().get(properties::ScalerCropMaximum)
                               .value_or(Rectangle(0, 0, 1920, 1080));
    const unsigned int w = std::max(1u, crop.width / 8);
    const unsigned int h = std::max(1u, crop.height / 8);
    const int x = crop.x + static_cast<int>(point.x * crop.width) - static_cast<int>(w / 2);
    const int y = crop.y + static_cast<int>(point.y * crop.height) - static_cast<int>(h / 2);

    std::array<Rectangle, 1> windows = {Rectangle(std::max(crop.x, x), std::max(crop.y, y), w, h)};
    setPending(controls::AfMetering, controls::AfMeteringWindows);
    setPending(controls::AfWindows, Span<const Rectangle>(windows));
}

void LibcameraCaptureDevice::setExposurePointOfInterest(const cv::Point2f&) {
    requireSupport(false, "Exposure point of interest");
}

void LibcameraCaptureDevice::setSubjectAreaChangeMonitoring(bool enabled) {
    VIEWFINDER_LOG_DEBUG(kComponent) << "Subject area monitoring " << (enabled ? "on" : "off")
                                     << " has no libcamera control, ignored";
}

WhiteBalanceGains LibcameraCaptureDevice::deviceWhiteBalanceGains(float kelvin) const {
    return CameraUtils::gainsForTemperature(kelvin);
}

float LibcameraCaptureDevice::maxWhiteBalanceGain() const {
    const ControlInfoMap& info = camera_->controls();
    auto it = info.find(&controls::ColourGains);
    if (it == info.end()) {
        return 1.0f;
    }
    const float max = it->second.max().get<float>();
    return max > 1.0f ? max : 8.0f;
}

void LibcameraCaptureDevice::setWhiteBalanceModeLocked(const WhiteBalanceGains& gains) {
    requireSupport(isWhiteBalanceModeSupported(WhiteBalanceMode::Locked), "Locked white balance");

    // libcamera gains are relative to green
    std::array<float, 2> colourGains = {gains.red / gains.green, gains.blue / gains.green};
    setPending(controls::AwbEnable, false);
    setPending(controls::ColourGains, Span<const float, 2>(colourGains));
}

float LibcameraCaptureDevice::exposureTargetBias() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return bias_;
}

void LibcameraCaptureDevice::setExposureTargetBias(float bias) {
    if (hasControl(controls::ExposureValue)) {
        setPending(controls::ExposureValue, bias);
    }
    std::lock_guard<std::mutex> lock(pendingMutex_);
    bias_ = bias;
}

void LibcameraCaptureDevice::applyPendingControls(ControlList& controls) {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    for (const auto& entry : pending_) {
        controls.set(entry.first, entry.second);
    }
    pending_.clear();
}

// LibcameraCaptureSession

std::shared_ptr<CameraManager> LibcameraCaptureSession::sharedCameraManager() {
    static std::weak_ptr<CameraManager> shared;

    std::lock_guard<std::mutex> lock(managerMutex);
    if (auto manager = shared.lock()) {
        return manager;
    }

    auto manager = std::make_shared<CameraManager>();
    const int ret = manager->start();
    if (ret < 0) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Failed to start CameraManager: " + std::to_string(ret));
    }
    shared = manager;
    return manager;
}

LibcameraCaptureSession::LibcameraCaptureSession(const core::LibcameraConfig& config,
                                                 cv::Size previewSize,
                                                 double frameRate)
    : config_(config)
    , previewSize_(previewSize)
    , frameRate_(frameRate)
    , manager_(sharedCameraManager()) {
    for (const auto& camera : manager_->cameras()) {
        auto it = config_.lensMap.find(camera->id());
        const LensClass lens = it != config_.lensMap.end() ? it->second : LensClass::Wide;
        auto device = std::make_shared<LibcameraCaptureDevice>(camera, lens);
        const CaptureDeviceProfile p = device->profile();
        VIEWFINDER_LOG_INFO(kComponent) << "Found " << p.name << " (" << camera->id() << ") "
                                        << CameraUtils::toString(p.position) << "/"
                                        << CameraUtils::toString(p.lens) << ", ISO "
                                        << p.minISO << "-" << p.maxISO;
        devices_.push_back(device);
    }
    if (devices_.empty()) {
        VIEWFINDER_LOG_WARNING(kComponent) << "No cameras reported by libcamera";
    }
}

LibcameraCaptureSession::~LibcameraCaptureSession() {
    stopRunning();
    removeInput();
    devices_.clear();
}

std::shared_ptr<CaptureDevice> LibcameraCaptureSession::findDevice(DevicePosition position,
                                                                   LensClass lens) {
    for (const auto& device : devices_) {
        const CaptureDeviceProfile p = device->profile();
        if (p.position == position && p.lens == lens) {
            return device;
        }
    }
    return nullptr;
}

void LibcameraCaptureSession::beginConfiguration() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++configDepth_;
}

void LibcameraCaptureSession::commitConfiguration() {
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (configDepth_ == 0) {
            VIEWFINDER_LOG_WARNING(kComponent) << "commitConfiguration without beginConfiguration";
            return;
        }
        if (--configDepth_ > 0) {
            return;
        }
        restart = restartAfterCommit_ && input_;
        restartAfterCommit_ = false;
    }

    if (restart) {
        try {
            startStreaming();
        } catch (const core::Exception& e) {
            VIEWFINDER_LOG_ERROR(kComponent) << "Failed to resume streaming after reconfiguration: "
                                             << e.what();
        }
    }
}

bool LibcameraCaptureSession::canAddInput(const std::shared_ptr<CaptureDevice>& device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !input_ && std::dynamic_pointer_cast<LibcameraCaptureDevice>(device) != nullptr;
}

void LibcameraCaptureSession::addInput(const std::shared_ptr<CaptureDevice>& device) {
    auto libcameraDevice = std::dynamic_pointer_cast<LibcameraCaptureDevice>(device);
    if (!libcameraDevice) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_INVALID_PARAMETER,
                              "Device does not belong to the libcamera session");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (input_) {
            VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAMERA_BUSY,
                                  "Session already has input " + input_->id());
        }
    }

    auto camera = libcameraDevice->camera();
    const int ret = camera->acquire();
    if (ret < 0) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAMERA_BUSY,
                              "Failed to acquire " + camera->id() + ": " + std::to_string(ret));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        input_ = libcameraDevice;
    }

    try {
        configureStream();
        allocateBuffers();
        createRequests();
    } catch (const core::Exception&) {
        releaseStream();
        throw;
    }

    camera->requestCompleted.connect(this, &LibcameraCaptureSession::handleRequestComplete);
    VIEWFINDER_LOG_INFO(kComponent) << "Input " << camera->id() << " configured at "
                                    << previewSize_.width << "x" << previewSize_.height;
}

void LibcameraCaptureSession::configureStream() {
    auto camera = input_->camera();
    cameraConfig_ = camera->generateConfiguration({StreamRole::Viewfinder});
    if (!cameraConfig_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Failed to generate camera configuration");
    }

    StreamConfiguration& streamConfig = cameraConfig_->at(0);
    streamConfig.pixelFormat = formats::XRGB8888;
    streamConfig.size.width = static_cast<unsigned int>(previewSize_.width);
    streamConfig.size.height = static_cast<unsigned int>(previewSize_.height);
    streamConfig.bufferCount = kBufferCount;

    const CameraConfiguration::Status validation = cameraConfig_->validate();
    if (validation == CameraConfiguration::Invalid) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Invalid camera configuration");
    }
    if (validation == CameraConfiguration::Adjusted) {
        VIEWFINDER_LOG_WARNING(kComponent) << "Stream adjusted to " << streamConfig.toString();
        previewSize_ = cv::Size(static_cast<int>(streamConfig.size.width),
                                static_cast<int>(streamConfig.size.height));
    }
    if (streamConfig.pixelFormat != formats::XRGB8888) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Camera cannot produce XRGB8888, got "
                                  + streamConfig.pixelFormat.toString());
    }

    const int ret = camera->configure(cameraConfig_.get());
    if (ret < 0) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Failed to configure camera: " + std::to_string(ret));
    }
    stream_ = streamConfig.stream();
    stride_ = streamConfig.stride;
}

void LibcameraCaptureSession::allocateBuffers() {
    allocator_ = std::make_unique<FrameBufferAllocator>(input_->camera());
    const int ret = allocator_->allocate(stream_);
    if (ret < 0) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Failed to allocate buffers: " + std::to_string(ret));
    }

    for (const auto& buffer : allocator_->buffers(stream_)) {
        const FrameBuffer::Plane& plane = buffer->planes()[0];
        const size_t mapLength = plane.offset + plane.length;
        void* map = mmap(nullptr, mapLength, PROT_READ, MAP_SHARED, plane.fd.get(), 0);
        if (map == MAP_FAILED) {
            VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                                  std::string("Failed to map frame buffer: ") + std::strerror(errno));
        }
        MappedBuffer mapped;
        mapped.map = map;
        mapped.mapLength = mapLength;
        mapped.data = static_cast<const uint8_t*>(map) + plane.offset;
        mapped.length = plane.length;
        mapped_[buffer.get()] = mapped;
    }
}

void LibcameraCaptureSession::createRequests() {
    auto camera = input_->camera();
    for (const auto& buffer : allocator_->buffers(stream_)) {
        std::unique_ptr<Request> request = camera->createRequest();
        if (!request) {
            VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                                  "Failed to create request");
        }
        const int ret = request->addBuffer(stream_, buffer.get());
        if (ret < 0) {
            VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                                  "Failed to add buffer to request: " + std::to_string(ret));
        }
        requests_.push_back(std::move(request));
    }
}

void LibcameraCaptureSession::releaseStream() {
    std::shared_ptr<LibcameraCaptureDevice> input;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        input = input_;
    }
    if (!input) {
        return;
    }

    auto camera = input->camera();
    camera->requestCompleted.disconnect(this);
    requests_.clear();
    for (auto& entry : mapped_) {
        if (munmap(entry.second.map, entry.second.mapLength) != 0) {
            VIEWFINDER_LOG_ERROR(kComponent) << "Failed to unmap frame buffer: "
                                             << std::strerror(errno);
        }
    }
    mapped_.clear();
    if (allocator_ && stream_) {
        allocator_->free(stream_);
    }
    allocator_.reset();
    stream_ = nullptr;
    cameraConfig_.reset();
    camera->release();

    std::lock_guard<std::mutex> lock(mutex_);
    input_.reset();
}

void LibcameraCaptureSession::removeInput() {
    if (running_) {
        stopStreaming();
        std::lock_guard<std::mutex> lock(mutex_);
        restartAfterCommit_ = configDepth_ > 0;
    }
    releaseStream();
}

std::shared_ptr<CaptureDevice> LibcameraCaptureSession::currentInput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return input_;
}

void LibcameraCaptureSession::startRunning() {
    if (running_) {
        return;
    }
    if (!currentInput()) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_NOT_INITIALIZED,
                              "Cannot start a session without input");
    }
    startStreaming();
}

void LibcameraCaptureSession::stopRunning() {
    if (!running_) {
        return;
    }
    stopStreaming();
}

void LibcameraCaptureSession::startStreaming() {
    auto camera = input_->camera();

    ControlList startControls(controls::controls);
    if (camera->controls().count(&controls::FrameDurationLimits) > 0 && frameRate_ > 0.0) {
        const auto frameUs = static_cast<int64_t>(1e6 / frameRate_);
        std::array<int64_t, 2> limits = {frameUs, frameUs};
        startControls.set(controls::FrameDurationLimits, Span<const int64_t, 2>(limits));
    }

    int ret = camera->start(&startControls);
    if (ret < 0) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                              "Failed to start camera: " + std::to_string(ret));
    }
    running_ = true;

    for (auto& request : requests_) {
        input_->applyPendingControls(request->controls());
        ret = camera->queueRequest(request.get());
        if (ret < 0) {
            running_ = false;
            camera->stop();
            VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_HARDWARE_FAILURE,
                                  "Failed to queue request: " + std::to_string(ret));
        }
    }
    VIEWFINDER_LOG_INFO(kComponent) << "Streaming from " << camera->id();
}

void LibcameraCaptureSession::stopStreaming() {
    running_ = false;
    // Completion callbacks still run while stop() drains the queue
    const int ret = input_->camera()->stop();
    if (ret < 0) {
        VIEWFINDER_LOG_ERROR(kComponent) << "Failed to stop camera: " << ret;
    }
    latestCv_.notify_all();
}

void LibcameraCaptureSession::setFrameHandler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void LibcameraCaptureSession::handleRequestComplete(Request* request) {
    if (request->status() == Request::RequestCancelled) {
        return;
    }

    FrameBuffer* buffer = request->findBuffer(stream_);
    auto mapped = buffer ? mapped_.find(buffer) : mapped_.end();
    if (mapped == mapped_.end()) {
        VIEWFINDER_LOG_ERROR(kComponent) << "Completed request without a mapped buffer";
        recycleRequest(request);
        return;
    }

    Frame frame;
    frame.sequence = sequence_++;
    frame.timestampNs = static_cast<uint64_t>(
        request->metadata().get(controls::SensorTimestamp).value_or(0));

    // Copy out of the DMA buffer before it is handed back to the camera
    const cv::Mat view(previewSize_, CV_8UC4, const_cast<uint8_t*>(mapped->second.data), stride_);
    frame.image = view.clone();

    {
        std::lock_guard<std::mutex> lock(latestMutex_);
        latest_ = frame;
    }
    latestCv_.notify_all();

    FrameHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(frame);
    }

    recycleRequest(request);
}

void LibcameraCaptureSession::recycleRequest(Request* request) {
    if (!running_) {
        return;
    }
    request->reuse(Request::ReuseBuffers);
    input_->applyPendingControls(request->controls());
    const int ret = input_->camera()->queueRequest(request);
    if (ret < 0) {
        VIEWFINDER_LOG_ERROR(kComponent) << "Failed to requeue request: " << ret;
    }
}

StillCapabilities LibcameraCaptureSession::stillCapabilities() const {
    StillCapabilities caps;
    if (currentInput()) {
        caps.maxDimensions = previewSize_;
    }
    // TODO: add a Raw stream role so stills can carry unpacked Bayer data
    caps.rawSupported = false;
    return caps;
}

StillImage LibcameraCaptureSession::captureStill(const StillCaptureSettings& settings) {
    if (settings.format == StillFormat::RawWithProcessedPreview) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED,
                              "Raw stills are not available from the libcamera backend");
    }
    if (!running_) {
        VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_NOT_INITIALIZED,
                              "Still capture requires a running session");
    }

    Frame frame;
    {
        std::unique_lock<std::mutex> lock(latestMutex_);
        const uint64_t after = latest_.image.empty() ? 0 : latest_.sequence + 1;
        const bool ready = latestCv_.wait_for(lock, kStillTimeout, [this, after] {
            return !running_ || (!latest_.image.empty() && latest_.sequence >= after);
        });
        if (!ready || !running_) {
            VIEWFINDER_THROW_CODE(core::CameraException, core::ResultCode::ERROR_TIMEOUT,
                                  "No frame received for still capture");
        }
        frame = latest_;
    }

    StillImage still;
    cv::cvtColor(frame.image, still.processed, cv::COLOR_BGRA2BGR);
    return still;
}

} // namespace camera
} // namespace viewfinder
