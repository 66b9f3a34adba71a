#include "viewfinder/viewfinder.h"
#include "viewfinder/camera/LibcameraCaptureSession.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

using namespace viewfinder;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_interrupted{false};

void handleSignal(int) {
    g_interrupted = true;
}

struct Options {
    std::string configPath;
    int seconds = 5;
    std::optional<float> iso;
    std::optional<double> shutter;
    std::optional<float> focus;
    std::optional<float> whiteBalance;
    std::optional<float> exposureBias;
    std::optional<camera::LensClass> lens;
    bool front = false;
    bool peaking = false;
    bool capture = false;
    std::optional<core::LogLevel> logLevel;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  --config FILE      YAML configuration file\n"
              << "  --seconds N        run time before shutdown (default 5)\n"
              << "  --iso X            manual ISO\n"
              << "  --shutter S        manual shutter in seconds, e.g. 0.0333 or 1/30\n"
              << "  --focus F          manual focus position 0..1, enables peaking\n"
              << "  --wb K             lock white balance at K kelvin\n"
              << "  --ev B             exposure bias in stops\n"
              << "  --lens 0.5|1|5     back camera lens\n"
              << "  --front            start on the front camera\n"
              << "  --peaking          enable focus peaking\n"
              << "  --capture          take one photo before shutdown\n"
              << "  --log-level L      trace, debug, info, warning, error or critical\n";
}

double parseDouble(const std::string& flag, const std::string& text) {
    // Shutter speeds are commonly written as fractions
    const auto slash = text.find('/');
    try {
        std::size_t used = 0;
        if (slash != std::string::npos) {
            const double num = std::stod(text.substr(0, slash));
            const std::string denText = text.substr(slash + 1);
            const double den = std::stod(denText, &used);
            if (used != denText.size() || den == 0.0) {
                throw std::invalid_argument(text);
            }
            return num / den;
        }
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    }
}

/**
 * @return exit code to use, or nullopt to continue
 */
std::optional<int> parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        try {
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return kExitOk;
            } else if (arg == "--config") {
                options.configPath = next();
            } else if (arg == "--seconds") {
                const double seconds = parseDouble(arg, next());
                if (seconds < 0.0) {
                    throw std::invalid_argument("--seconds must not be negative");
                }
                options.seconds = static_cast<int>(seconds);
            } else if (arg == "--iso") {
                options.iso = static_cast<float>(parseDouble(arg, next()));
            } else if (arg == "--shutter") {
                options.shutter = parseDouble(arg, next());
            } else if (arg == "--focus") {
                options.focus = static_cast<float>(parseDouble(arg, next()));
            } else if (arg == "--wb") {
                options.whiteBalance = static_cast<float>(parseDouble(arg, next()));
            } else if (arg == "--ev") {
                options.exposureBias = static_cast<float>(parseDouble(arg, next()));
            } else if (arg == "--lens") {
                options.lens = camera::CameraUtils::parseLensClass(next());
            } else if (arg == "--front") {
                options.front = true;
            } else if (arg == "--peaking") {
                options.peaking = true;
            } else if (arg == "--capture") {
                options.capture = true;
            } else if (arg == "--log-level") {
                options.logLevel = core::parseLogLevel(next());
            } else {
                throw std::invalid_argument("Unknown option " + arg);
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            printUsage(argv[0]);
            return kExitUsage;
        } catch (const core::ConfigurationException& e) {
            std::cerr << "Error: " << e.getMessage() << std::endl;
            printUsage(argv[0]);
            return kExitUsage;
        }
    }
    return std::nullopt;
}

std::shared_ptr<camera::CaptureSession> createSession(const core::Configuration& config) {
    const cv::Size previewSize(config.session.previewWidth, config.session.previewHeight);
    if (config.session.backend == "libcamera") {
        return std::make_shared<camera::LibcameraCaptureSession>(
            config.libcamera, previewSize, config.session.frameRate);
    }
    return std::make_shared<camera::SimulatedCaptureSession>(
        config.simulatedDevices, config.session.frameRate, previewSize);
}

std::string statusLine(const state::CameraState& state, const realtime::FramePipeline::Stats& stats) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0)
        << "ISO " << state.settings.iso
        << "  " << camera::CameraUtils::formatShutterSpeed(state.settings.shutterSeconds)
        << "  WB " << state.settings.whiteBalanceKelvin << "K"
        << std::setprecision(1)
        << "  EV " << std::showpos << state.settings.exposureBias << std::noshowpos
        << "  " << camera::CameraUtils::toString(state.settings.position) << "/"
        << camera::CameraUtils::toString(state.settings.lens);

    if (state.histogramEnabled && !state.histogram.empty()) {
        const float total = std::accumulate(state.histogram.begin(), state.histogram.end(), 0.0f);
        float weighted = 0.0f;
        for (std::size_t i = 0; i < state.histogram.size(); ++i) {
            weighted += static_cast<float>(i) * state.histogram[i];
        }
        oss << "  hist mean " << (total > 0.0f ? weighted / total : 0.0f);
    }
    if (state.peakingEnabled && !state.peakingOverlay.empty()) {
        cv::Mat alpha;
        cv::extractChannel(state.peakingOverlay, alpha, 3);
        oss << "  peaking " << 100.0 * cv::countNonZero(alpha) / static_cast<double>(alpha.total())
            << "%";
    }
    oss << "  dropped " << stats.frames_dropped << "/" << stats.frames_received;
    return oss.str();
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (auto exitCode = parseArguments(argc, argv, options)) {
        return *exitCode;
    }

    core::Configuration config;
    try {
        if (!options.configPath.empty()) {
            config = core::Configuration::fromFile(options.configPath);
        }
    } catch (const core::ConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitFailure;
    }

    if (options.logLevel) {
        config.logging.level = *options.logLevel;
    }
    if (options.front) {
        config.session.initialPosition = camera::DevicePosition::Front;
        config.session.initialLens = camera::LensClass::Wide;
    } else if (options.lens) {
        config.session.initialPosition = camera::DevicePosition::Back;
        config.session.initialLens = *options.lens;
    }
    if (options.peaking) {
        config.analysis.peaking = true;
    }

    // Logging first, everything below reports through it
    auto& logger = core::Logger::getInstance();
    logger.setLevel(config.logging.level);
    logger.setConsoleOutput(config.logging.console);
    if (!config.logging.directory.empty()) {
        if (logger.initializeWithTimestamp(config.logging.directory, config.logging.level)) {
            logger.info("Log file: " + logger.getCurrentLogFile());
        } else {
            std::cerr << "Warning: file logging unavailable, using console only" << std::endl;
        }
    }

    logger.info("=== Viewfinder " + std::to_string(VIEWFINDER_VERSION_MAJOR) + "."
                + std::to_string(VIEWFINDER_VERSION_MINOR) + "."
                + std::to_string(VIEWFINDER_VERSION_PATCH) + " ===");

    std::shared_ptr<camera::CaptureSession> session;
    try {
        session = createSession(config);
    } catch (const core::Exception& e) {
        logger.critical("Failed to create " + config.session.backend + " backend: " + e.what());
        logger.flush();
        return kExitFailure;
    }

    auto sink = std::make_shared<storage::FilePhotoSink>(config.capture.outputDirectory,
                                                         config.capture.writeMetadata);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    api::Viewfinder viewfinder(config, session, sink);
    viewfinder.addDiagnosticListener([](const state::DiagnosticEvent& event) {
        std::cerr << "[" << state::toString(event.kind) << "] " << event.message << std::endl;
    });

    viewfinder.start();
    viewfinder.waitUntilIdle();
    if (!viewfinder.isConfigured()) {
        logger.critical("Session could not be configured");
        viewfinder.shutdown();
        logger.flush();
        return kExitFailure;
    }

    const state::CameraState initial = viewfinder.state();
    if (options.iso || options.shutter) {
        viewfinder.setControlMode(api::ControlMode::Manual);
        viewfinder.setExposure(options.iso.value_or(initial.settings.iso),
                               options.shutter.value_or(initial.settings.shutterSeconds));
    }
    if (options.whiteBalance) {
        viewfinder.setControlMode(api::ControlMode::WhiteBalance);
        viewfinder.setWhiteBalance(*options.whiteBalance);
    }
    if (options.focus) {
        viewfinder.setControlMode(api::ControlMode::ManualFocus);
        viewfinder.setFocus(*options.focus);
    }
    if (options.exposureBias) {
        viewfinder.setExposureBias(*options.exposureBias);
    }

    for (int second = 0; second < options.seconds && !g_interrupted; ++second) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        std::cout << statusLine(viewfinder.state(), viewfinder.frameStats()) << std::endl;
    }

    if (options.capture && !g_interrupted) {
        std::promise<storage::SaveResult> done;
        std::future<storage::SaveResult> result = done.get_future();
        viewfinder.capturePhoto([&done](const storage::SaveResult& r) { done.set_value(r); });
        const storage::SaveResult saved = result.get();
        if (saved.ok) {
            std::cout << "Saved " << saved.path << std::endl;
        } else {
            std::cerr << "Capture failed: " << saved.reason << std::endl;
        }
    }

    viewfinder.shutdown();
    logger.info("=== Shutdown complete ===");
    logger.flush();
    return kExitOk;
}
