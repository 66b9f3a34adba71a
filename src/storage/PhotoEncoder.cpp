#include "viewfinder/storage/PhotoEncoder.hpp"
#include "viewfinder/core/exception.h"

#include <opencv2/imgcodecs.hpp>

namespace viewfinder {
namespace storage {

std::vector<uint8_t> PhotoEncoder::encodeJpeg(const cv::Mat& image) const {
    if (image.empty()) {
        VIEWFINDER_THROW_CODE(core::StorageException, core::ResultCode::ERROR_ENCODING_FAILURE,
                              "Cannot encode an empty image as JPEG");
    }
    std::vector<uint8_t> buffer;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpegQuality_};
    if (!cv::imencode(".jpg", image, buffer, params) || buffer.empty()) {
        VIEWFINDER_THROW_CODE(core::StorageException, core::ResultCode::ERROR_ENCODING_FAILURE,
                              "JPEG encoding failed");
    }
    return buffer;
}

std::vector<uint8_t> PhotoEncoder::encodeTiff(const cv::Mat& image) const {
    if (image.empty()) {
        VIEWFINDER_THROW_CODE(core::StorageException, core::ResultCode::ERROR_ENCODING_FAILURE,
                              "Cannot encode an empty image as TIFF");
    }
    std::vector<uint8_t> buffer;
    if (!cv::imencode(".tiff", image, buffer) || buffer.empty()) {
        VIEWFINDER_THROW_CODE(core::StorageException, core::ResultCode::ERROR_ENCODING_FAILURE,
                              "TIFF encoding failed");
    }
    return buffer;
}

EncodedPhoto PhotoEncoder::encode(const camera::StillImage& still, CaptureMetadata metadata) const {
    EncodedPhoto photo;
    if (!still.raw.empty()) {
        photo.primary = encodeTiff(still.raw);
        photo.primaryExtension = ".tiff";
        if (!still.processed.empty()) {
            photo.preview = encodeJpeg(still.processed);
            photo.previewExtension = ".jpg";
        }
        metadata.format = "raw+jpeg";
        metadata.width = still.raw.cols;
        metadata.height = still.raw.rows;
    } else {
        photo.primary = encodeJpeg(still.processed);
        photo.primaryExtension = ".jpg";
        metadata.format = "jpeg";
        metadata.width = still.processed.cols;
        metadata.height = still.processed.rows;
    }
    photo.metadata = std::move(metadata);
    return photo;
}

} // namespace storage
} // namespace viewfinder
