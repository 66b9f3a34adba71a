#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace viewfinder {
namespace storage {

/**
 * Camera state at the moment a still was taken
 */
struct CaptureMetadata {
    std::string deviceId;
    std::string position;
    std::string lens;
    float iso = 0.0f;
    double shutterSeconds = 0.0;
    float focusPosition = 0.0f;
    float whiteBalanceKelvin = 0.0f;
    float exposureBias = 0.0f;
    std::string format;         ///< "raw+jpeg" or "jpeg"
    int width = 0;
    int height = 0;
    std::chrono::system_clock::time_point capturedAt;
};

/**
 * Encoded still ready for persistence. preview is empty for single-file
 * captures.
 */
struct EncodedPhoto {
    std::vector<uint8_t> primary;
    std::string primaryExtension;       ///< Including the dot, e.g. ".tiff"
    std::vector<uint8_t> preview;
    std::string previewExtension;
    CaptureMetadata metadata;
};

struct SaveResult {
    bool ok = false;
    std::string reason;                 ///< Failure description when !ok
    std::string path;                   ///< Primary file location when ok
};

/**
 * Destination for captured stills. Implementations report failures in the
 * result instead of throwing.
 */
class PhotoSink {
public:
    virtual ~PhotoSink() = default;
    virtual SaveResult save(const EncodedPhoto& photo) = 0;
};

/**
 * Writes stills into a directory:
 *   IMG_<yyyyMMdd_HHmmss>_<seq><ext>          primary image
 *   IMG_<yyyyMMdd_HHmmss>_<seq>_preview.jpg   processed preview, when present
 *   IMG_<yyyyMMdd_HHmmss>_<seq>.json          capture metadata
 */
class FilePhotoSink : public PhotoSink {
public:
    explicit FilePhotoSink(std::string directory, bool writeMetadata = true);

    SaveResult save(const EncodedPhoto& photo) override;

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
    bool writeMetadata_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace storage
} // namespace viewfinder
