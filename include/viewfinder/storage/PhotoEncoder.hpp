#pragma once

#include "viewfinder/camera/CameraTypes.hpp"
#include "viewfinder/storage/PhotoSink.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace viewfinder {
namespace storage {

/**
 * Turns captured stills into file payloads: 16-bit raw data as lossless
 * TIFF with a JPEG preview, processed images as JPEG.
 */
class PhotoEncoder {
public:
    explicit PhotoEncoder(int jpegQuality = 95) : jpegQuality_(jpegQuality) {}

    /**
     * @throws core::StorageException (ERROR_ENCODING_FAILURE) if OpenCV
     *         cannot encode the image
     */
    EncodedPhoto encode(const camera::StillImage& still, CaptureMetadata metadata) const;

    std::vector<uint8_t> encodeJpeg(const cv::Mat& image) const;
    std::vector<uint8_t> encodeTiff(const cv::Mat& image) const;

private:
    int jpegQuality_;
};

} // namespace storage
} // namespace viewfinder
