#include "client/OpenCvFrameSource.h"

#include <spdlog/spdlog.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace portal::client {

OpenCvFrameSource::OpenCvFrameSource(int camera_index, int width, int height)
    : capture_(camera_index),
      width_(width),
      height_(height) {
    if (!capture_.isOpened()) {
        spdlog::error("[Camera] cannot open camera {}", camera_index);
    }
}

std::optional<Frame> OpenCvFrameSource::grab() {
    if (!capture_.isOpened()) return std::nullopt;

    cv::Mat image;
    if (!capture_.read(image) || image.empty()) return std::nullopt;

    cv::Mat small;
    cv::resize(image, small, cv::Size(width_, height_), 0, 0, cv::INTER_AREA);
    if (!small.isContinuous()) small = small.clone();

    Frame frame;
    frame.width = small.cols;
    frame.height = small.rows;
    frame.channels = small.channels();
    frame.pixels.assign(small.data, small.data + small.total() * small.elemSize());
    return frame;
}

} // namespace portal::client
