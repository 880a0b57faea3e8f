#pragma once

#include "client/FrameSource.hpp"

#include <opencv2/videoio.hpp>

namespace portal::client {

// Camera capture downsized to the sampling resolution. Colour cameras give
// BGR frames; the same frame feeds motion analysis and the video encoder.
class OpenCvFrameSource : public FrameSource {
public:
    OpenCvFrameSource(int camera_index, int width, int height);

    bool is_open() const { return capture_.isOpened(); }

    std::optional<Frame> grab() override;

private:
    cv::VideoCapture capture_;
    int width_;
    int height_;
};

} // namespace portal::client
