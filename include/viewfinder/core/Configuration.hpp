#pragma once

#include "viewfinder/camera/CameraTypes.hpp"
#include "viewfinder/core/Logger.hpp"

#include <map>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace viewfinder {
namespace core {

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    bool console = true;
    std::string directory;              ///< Empty: console only
};

struct SessionConfig {
    std::string backend = "simulated"; ///< "simulated" or "libcamera"
    double frameRate = 60.0;
    int previewWidth = 1280;
    int previewHeight = 720;
    camera::DevicePosition initialPosition = camera::DevicePosition::Back;
    camera::LensClass initialLens = camera::LensClass::Wide;
};

struct AnalysisConfig {
    bool histogram = true;
    bool peaking = false;
    float peakingIntensity = 5.0f;
    float peakingThreshold = 0.0f;      ///< Fraction of full scale
};

struct ControlsConfig {
    double defaultShutterSeconds = 1.0 / 60.0;
    float defaultFocus = 0.5f;
    float defaultWhiteBalanceKelvin = 5000.0f;
    float whiteBalanceMinKelvin = 3000.0f;
    float whiteBalanceMaxKelvin = 8000.0f;
    bool carryFocusAcrossSwap = false;
};

struct CaptureConfig {
    std::string outputDirectory = "captures";
    bool preferRaw = true;
    int jpegQuality = 95;
    bool writeMetadata = true;
};

/**
 * One camera module of the simulated body
 */
struct SimulatedDeviceConfig {
    std::string id;
    std::string name;
    camera::DevicePosition position = camera::DevicePosition::Back;
    camera::LensClass lens = camera::LensClass::Wide;

    float minISO = 32.0f;
    float maxISO = 3200.0f;
    int64_t minExposureUs = 14;
    int64_t maxExposureUs = 1000000;
    float minExposureBias = -8.0f;
    float maxExposureBias = 8.0f;
    float maxWhiteBalanceGain = 4.0f;

    bool customExposure = true;
    bool lockedFocus = true;
    bool lockedWhiteBalance = true;
    bool pointOfInterest = true;

    int stillWidth = 4032;
    int stillHeight = 3024;
    bool rawSupported = true;
};

struct LibcameraConfig {
    std::map<std::string, camera::LensClass> lensMap;   ///< camera id -> lens class
};

/**
 * Typed application configuration loaded from YAML.
 *
 * Every key is optional; a default-constructed Configuration holds the
 * defaults listed in the sample config/viewfinder.yaml.
 */
class Configuration {
public:
    Configuration();

    /**
     * @throws ConfigurationException if the file cannot be read or holds
     *         invalid values
     */
    static Configuration fromFile(const std::string& path);

    /**
     * @throws ConfigurationException on malformed YAML or invalid values
     */
    static Configuration fromString(const std::string& yaml);

    /**
     * Check ranges and consistency
     * @throws ConfigurationException naming the offending key
     */
    void validate() const;

    LoggingConfig logging;
    SessionConfig session;
    AnalysisConfig analysis;
    ControlsConfig controls;
    CaptureConfig capture;
    std::vector<SimulatedDeviceConfig> simulatedDevices;
    LibcameraConfig libcamera;

    /**
     * Back ultra-wide and wide modules plus a front wide module
     */
    static std::vector<SimulatedDeviceConfig> defaultSimulatedDevices();

private:
    void load(const YAML::Node& root);
};

} // namespace core
} // namespace viewfinder
