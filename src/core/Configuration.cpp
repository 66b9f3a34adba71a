#include "viewfinder/core/Configuration.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/core/exception.h"

#include <yaml-cpp/yaml.h>

namespace viewfinder {
namespace core {

namespace {

template<typename T>
void readValue(const YAML::Node& section, const std::string& sectionName,
               const char* key, T& out) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("Invalid value for '" + sectionName + "." + key + "'",
                                     e.what());
    }
}

void readPosition(const YAML::Node& section, const std::string& sectionName,
                  const char* key, camera::DevicePosition& out) {
    std::string text;
    readValue(section, sectionName, key, text);
    if (!text.empty()) {
        out = camera::CameraUtils::parseDevicePosition(text);
    }
}

void readLens(const YAML::Node& section, const std::string& sectionName,
              const char* key, camera::LensClass& out) {
    std::string text;
    readValue(section, sectionName, key, text);
    if (!text.empty()) {
        out = camera::CameraUtils::parseLensClass(text);
    }
}

void requireRange(bool ok, const std::string& key, const std::string& detail) {
    if (!ok) {
        throw ConfigurationException("Invalid value for '" + key + "': " + detail);
    }
}

} // namespace

Configuration::Configuration()
    : simulatedDevices(defaultSimulatedDevices()) {}

std::vector<SimulatedDeviceConfig> Configuration::defaultSimulatedDevices() {
    std::vector<SimulatedDeviceConfig> devices;

    SimulatedDeviceConfig ultraWide;
    ultraWide.id = "sim-back-ultra-wide";
    ultraWide.name = "Simulated Back Ultra Wide Camera";
    ultraWide.lens = camera::LensClass::UltraWide;
    ultraWide.minISO = 40.0f;
    ultraWide.maxISO = 2000.0f;
    ultraWide.maxExposureUs = 500000;
    ultraWide.lockedFocus = false;
    devices.push_back(ultraWide);

    SimulatedDeviceConfig wide;
    wide.id = "sim-back-wide";
    wide.name = "Simulated Back Wide Camera";
    devices.push_back(wide);

    SimulatedDeviceConfig front;
    front.id = "sim-front-wide";
    front.name = "Simulated Front Camera";
    front.position = camera::DevicePosition::Front;
    front.minISO = 25.0f;
    front.maxISO = 1600.0f;
    front.maxExposureUs = 333333;
    front.lockedFocus = false;
    front.stillWidth = 3088;
    front.stillHeight = 2316;
    front.rawSupported = false;
    devices.push_back(front);

    return devices;
}

Configuration Configuration::fromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("Failed to load configuration file " + path, e.what());
    }

    Configuration config;
    config.load(root);
    config.validate();
    LOG_INFO("Configuration loaded from " + path);
    return config;
}

Configuration Configuration::fromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigurationException("Failed to parse configuration", e.what());
    }

    Configuration config;
    config.load(root);
    config.validate();
    return config;
}

void Configuration::load(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigurationException("Configuration root must be a mapping");
    }

    if (const YAML::Node node = root["logging"]) {
        std::string level;
        readValue(node, "logging", "level", level);
        if (!level.empty()) {
            logging.level = parseLogLevel(level);
        }
        readValue(node, "logging", "console", logging.console);
        readValue(node, "logging", "directory", logging.directory);
    }

    if (const YAML::Node node = root["session"]) {
        readValue(node, "session", "backend", session.backend);
        readValue(node, "session", "frame_rate", session.frameRate);
        readValue(node, "session", "preview_width", session.previewWidth);
        readValue(node, "session", "preview_height", session.previewHeight);
        readPosition(node, "session", "initial_position", session.initialPosition);
        readLens(node, "session", "initial_lens", session.initialLens);
    }

    if (const YAML::Node node = root["analysis"]) {
        readValue(node, "analysis", "histogram", analysis.histogram);
        readValue(node, "analysis", "peaking", analysis.peaking);
        readValue(node, "analysis", "peaking_intensity", analysis.peakingIntensity);
        readValue(node, "analysis", "peaking_threshold", analysis.peakingThreshold);
    }

    if (const YAML::Node node = root["controls"]) {
        readValue(node, "controls", "default_shutter_seconds", controls.defaultShutterSeconds);
        readValue(node, "controls", "default_focus", controls.defaultFocus);
        readValue(node, "controls", "default_white_balance_kelvin", controls.defaultWhiteBalanceKelvin);
        readValue(node, "controls", "white_balance_min_kelvin", controls.whiteBalanceMinKelvin);
        readValue(node, "controls", "white_balance_max_kelvin", controls.whiteBalanceMaxKelvin);
        readValue(node, "controls", "carry_focus_across_swap", controls.carryFocusAcrossSwap);
    }

    if (const YAML::Node node = root["capture"]) {
        readValue(node, "capture", "output_directory", capture.outputDirectory);
        readValue(node, "capture", "prefer_raw", capture.preferRaw);
        readValue(node, "capture", "jpeg_quality", capture.jpegQuality);
        readValue(node, "capture", "write_metadata", capture.writeMetadata);
    }

    if (const YAML::Node node = root["simulated"]) {
        const YAML::Node devices = node["devices"];
        if (devices) {
            if (!devices.IsSequence()) {
                throw ConfigurationException("'simulated.devices' must be a list");
            }
            simulatedDevices.clear();
            for (std::size_t i = 0; i < devices.size(); ++i) {
                const YAML::Node d = devices[i];
                const std::string name = "simulated.devices[" + std::to_string(i) + "]";
                SimulatedDeviceConfig device;
                readPosition(d, name, "position", device.position);
                readLens(d, name, "lens", device.lens);
                device.id = "sim-" + camera::CameraUtils::toString(device.position) + "-"
                          + camera::CameraUtils::toString(device.lens);
                device.name = "Simulated " + camera::CameraUtils::toString(device.position)
                            + " " + camera::CameraUtils::toString(device.lens) + " camera";
                readValue(d, name, "id", device.id);
                readValue(d, name, "name", device.name);
                readValue(d, name, "min_iso", device.minISO);
                readValue(d, name, "max_iso", device.maxISO);
                readValue(d, name, "min_exposure_us", device.minExposureUs);
                readValue(d, name, "max_exposure_us", device.maxExposureUs);
                readValue(d, name, "min_exposure_bias", device.minExposureBias);
                readValue(d, name, "max_exposure_bias", device.maxExposureBias);
                readValue(d, name, "max_white_balance_gain", device.maxWhiteBalanceGain);
                readValue(d, name, "custom_exposure", device.customExposure);
                readValue(d, name, "locked_focus", device.lockedFocus);
                readValue(d, name, "locked_white_balance", device.lockedWhiteBalance);
                readValue(d, name, "point_of_interest", device.pointOfInterest);
                readValue(d, name, "still_width", device.stillWidth);
                readValue(d, name, "still_height", device.stillHeight);
                readValue(d, name, "raw", device.rawSupported);
                simulatedDevices.push_back(device);
            }
        }
    }

    if (const YAML::Node node = root["libcamera"]) {
        const YAML::Node lensMap = node["lens_map"];
        if (lensMap) {
            if (!lensMap.IsMap()) {
                throw ConfigurationException("'libcamera.lens_map' must be a mapping");
            }
            for (const auto& entry : lensMap) {
                libcamera.lensMap[entry.first.as<std::string>()] =
                    camera::CameraUtils::parseLensClass(entry.second.as<std::string>());
            }
        }
    }
}

void Configuration::validate() const {
    requireRange(session.backend == "simulated" || session.backend == "libcamera",
                 "session.backend", "expected 'simulated' or 'libcamera'");
    requireRange(session.frameRate > 0.0, "session.frame_rate", "must be positive");
    requireRange(session.previewWidth > 0 && session.previewHeight > 0,
                 "session.preview_width/preview_height", "must be positive");

    requireRange(analysis.peakingIntensity > 0.0f, "analysis.peaking_intensity", "must be positive");
    requireRange(analysis.peakingThreshold >= 0.0f && analysis.peakingThreshold < 1.0f,
                 "analysis.peaking_threshold", "must be in [0, 1)");

    requireRange(controls.defaultShutterSeconds > 0.0, "controls.default_shutter_seconds",
                 "must be positive");
    requireRange(controls.defaultFocus >= 0.0f && controls.defaultFocus <= 1.0f,
                 "controls.default_focus", "must be in [0, 1]");
    requireRange(controls.whiteBalanceMinKelvin > 0.0f
                     && controls.whiteBalanceMinKelvin <= controls.whiteBalanceMaxKelvin,
                 "controls.white_balance_min_kelvin", "must be positive and <= white_balance_max_kelvin");

    requireRange(capture.jpegQuality >= 0 && capture.jpegQuality <= 100,
                 "capture.jpeg_quality", "must be in [0, 100]");
    requireRange(!capture.outputDirectory.empty(), "capture.output_directory", "must not be empty");

    for (const auto& device : simulatedDevices) {
        const std::string key = "simulated.devices[" + device.id + "]";
        requireRange(device.minISO > 0.0f && device.minISO <= device.maxISO, key + ".min_iso",
                     "must be positive and <= max_iso");
        requireRange(device.minExposureUs > 0 && device.minExposureUs <= device.maxExposureUs,
                     key + ".min_exposure_us", "must be positive and <= max_exposure_us");
        requireRange(device.minExposureBias <= device.maxExposureBias, key + ".min_exposure_bias",
                     "must be <= max_exposure_bias");
        requireRange(device.maxWhiteBalanceGain >= 1.0f, key + ".max_white_balance_gain",
                     "must be >= 1");
        requireRange(device.stillWidth > 0 && device.stillHeight > 0, key + ".still_width/still_height",
                     "must be positive");
    }
}

} // namespace core
} // namespace viewfinder
