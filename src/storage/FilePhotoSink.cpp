#include "viewfinder/storage/PhotoSink.hpp"
#include "viewfinder/core/Logger.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace viewfinder {
namespace storage {

namespace {

std::string formatTime(std::chrono::system_clock::time_point tp, const char* format) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, format);
    return oss.str();
}

bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data,
               std::string& reason) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        reason = "cannot open " + path.string();
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        reason = "write failed for " + path.string();
        return false;
    }
    return true;
}

} // namespace

FilePhotoSink::FilePhotoSink(std::string directory, bool writeMetadata)
    : directory_(std::move(directory))
    , writeMetadata_(writeMetadata) {}

SaveResult FilePhotoSink::save(const EncodedPhoto& photo) {
    SaveResult result;
    if (photo.primary.empty()) {
        result.reason = "empty image payload";
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        result.reason = "cannot create " + directory_ + ": " + ec.message();
        return result;
    }

    const auto capturedAt = photo.metadata.capturedAt.time_since_epoch().count() != 0
        ? photo.metadata.capturedAt : std::chrono::system_clock::now();
    std::ostringstream stem;
    stem << "IMG_" << formatTime(capturedAt, "%Y%m%d_%H%M%S") << "_"
         << std::setw(4) << std::setfill('0') << ++sequence_;

    const std::filesystem::path base = std::filesystem::path(directory_) / stem.str();
    const std::filesystem::path primaryPath = base.string() + photo.primaryExtension;

    if (!writeFile(primaryPath, photo.primary, result.reason)) {
        return result;
    }

    if (!photo.preview.empty()) {
        const std::filesystem::path previewPath = base.string() + "_preview" + photo.previewExtension;
        if (!writeFile(previewPath, photo.preview, result.reason)) {
            return result;
        }
    }

    if (writeMetadata_) {
        const CaptureMetadata& m = photo.metadata;
        nlohmann::json meta;
        meta["file"] = primaryPath.filename().string();
        meta["captured_at"] = formatTime(capturedAt, "%Y-%m-%dT%H:%M:%S");
        meta["device_id"] = m.deviceId;
        meta["position"] = m.position;
        meta["lens"] = m.lens;
        meta["format"] = m.format;
        meta["width"] = m.width;
        meta["height"] = m.height;
        meta["iso"] = m.iso;
        meta["shutter_seconds"] = m.shutterSeconds;
        meta["focus_position"] = m.focusPosition;
        meta["white_balance_kelvin"] = m.whiteBalanceKelvin;
        meta["exposure_bias"] = m.exposureBias;
        if (!photo.preview.empty()) {
            meta["preview"] = stem.str() + "_preview" + photo.previewExtension;
        }

        const std::string text = meta.dump(2);
        if (!writeFile(base.string() + ".json", std::vector<uint8_t>(text.begin(), text.end()),
                       result.reason)) {
            return result;
        }
    }

    result.ok = true;
    result.path = primaryPath.string();
    VIEWFINDER_LOG_DEBUG("FilePhotoSink") << "Wrote " << result.path << " ("
                                          << photo.primary.size() << " bytes)";
    return result;
}

} // namespace storage
} // namespace viewfinder
