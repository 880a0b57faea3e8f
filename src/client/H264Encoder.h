#pragma once

#include "client/Frame.h"
#include "client/PeerConnection.hpp"

#include <cstdint>
#include <memory>
#include <optional>

struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace portal::client {

struct H264EncoderSettings {
    int fps = 10;
    int bitrate_kbps = 500;
    int keyframe_interval_s = 2;
};

// Camera frames to an H.264 Annex-B stream (FFmpeg, preferring libx264).
// The encoder opens on the first frame and reopens when the geometry changes.
// Failures throw std::runtime_error.
class H264Encoder {
public:
    explicit H264Encoder(H264EncoderSettings settings);
    ~H264Encoder();

    H264Encoder(const H264Encoder&) = delete;
    H264Encoder& operator=(const H264Encoder&) = delete;

    // nullopt while the encoder is still buffering.
    std::optional<EncodedVideoFrame> encode(const Frame& frame);

    // The next encoded frame is an IDR frame.
    void request_keyframe() noexcept { keyframe_requested_ = true; }

private:
    struct Deleter {
        void operator()(AVCodecContext* ctx) const;
        void operator()(AVFrame* frame) const;
        void operator()(AVPacket* packet) const;
        void operator()(SwsContext* sws) const;
    };

    void open(const Frame& frame);

    H264EncoderSettings settings_;
    std::unique_ptr<AVCodecContext, Deleter> codec_;
    std::unique_ptr<AVFrame, Deleter> picture_;
    std::unique_ptr<AVPacket, Deleter> packet_;
    std::unique_ptr<SwsContext, Deleter> scaler_;

    int src_width_ = 0;
    int src_height_ = 0;
    int src_channels_ = 0;
    std::int64_t next_pts_ = 0;
    bool keyframe_requested_ = true;
};

} // namespace portal::client
