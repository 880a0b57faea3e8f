#include "client/H264Encoder.h"

#include <spdlog/spdlog.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include <cerrno>
#include <stdexcept>
#include <string>

namespace portal::client {

namespace {

std::string av_error(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

AVPixelFormat source_format(int channels) {
    switch (channels) {
        case 1: return AV_PIX_FMT_GRAY8;
        case 3: return AV_PIX_FMT_BGR24;
        case 4: return AV_PIX_FMT_BGRA;
    }
    throw std::runtime_error("unsupported frame with " + std::to_string(channels) + " channels");
}

} // namespace

void H264Encoder::Deleter::operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
void H264Encoder::Deleter::operator()(AVFrame* frame) const { av_frame_free(&frame); }
void H264Encoder::Deleter::operator()(AVPacket* packet) const { av_packet_free(&packet); }
void H264Encoder::Deleter::operator()(SwsContext* sws) const { sws_freeContext(sws); }

H264Encoder::H264Encoder(H264EncoderSettings settings)
    : settings_(settings) {}

H264Encoder::~H264Encoder() = default;

void H264Encoder::open(const Frame& frame) {
    // yuv420p needs even dimensions
    const int width = frame.width & ~1;
    const int height = frame.height & ~1;
    if (width == 0 || height == 0) throw std::runtime_error("frame too small to encode");

    const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
    if (!codec) codec = avcodec_find_encoder(AV_CODEC_ID_H264);
    if (!codec) throw std::runtime_error("no H.264 encoder available");

    std::unique_ptr<AVCodecContext, Deleter> ctx(avcodec_alloc_context3(codec));
    if (!ctx) throw std::runtime_error("cannot allocate encoder context");

    ctx->width = width;
    ctx->height = height;
    ctx->pix_fmt = AV_PIX_FMT_YUV420P;
    ctx->time_base = AVRational{1, settings_.fps};
    ctx->framerate = AVRational{settings_.fps, 1};
    ctx->bit_rate = static_cast<std::int64_t>(settings_.bitrate_kbps) * 1000;
    ctx->gop_size = settings_.fps * settings_.keyframe_interval_s;
    ctx->max_b_frames = 0;
    // constrained baseline, matching profile-level-id 42e01f in the SDP
    av_opt_set(ctx->priv_data, "profile", "baseline", 0);
    av_opt_set(ctx->priv_data, "preset", "ultrafast", 0);
    av_opt_set(ctx->priv_data, "tune", "zerolatency", 0);

    if (int rc = avcodec_open2(ctx.get(), codec, nullptr); rc < 0) {
        throw std::runtime_error("cannot open " + std::string(codec->name) + ": " + av_error(rc));
    }

    std::unique_ptr<AVFrame, Deleter> picture(av_frame_alloc());
    if (!picture) throw std::runtime_error("cannot allocate frame");
    picture->format = ctx->pix_fmt;
    picture->width = width;
    picture->height = height;
    if (int rc = av_frame_get_buffer(picture.get(), 0); rc < 0) {
        throw std::runtime_error("cannot allocate frame buffer: " + av_error(rc));
    }

    std::unique_ptr<SwsContext, Deleter> scaler(sws_getContext(
        frame.width, frame.height, source_format(frame.channels),
        width, height, AV_PIX_FMT_YUV420P,
        SWS_BILINEAR, nullptr, nullptr, nullptr));
    if (!scaler) throw std::runtime_error("cannot create colour converter");

    std::unique_ptr<AVPacket, Deleter> packet(av_packet_alloc());
    if (!packet) throw std::runtime_error("cannot allocate packet");

    codec_ = std::move(ctx);
    picture_ = std::move(picture);
    scaler_ = std::move(scaler);
    packet_ = std::move(packet);
    src_width_ = frame.width;
    src_height_ = frame.height;
    src_channels_ = frame.channels;
    next_pts_ = 0;
    keyframe_requested_ = true;

    spdlog::info("[Encoder] {} {}x{} at {} fps, {} kbps", codec->name, width, height,
                 settings_.fps, settings_.bitrate_kbps);
}

std::optional<EncodedVideoFrame> H264Encoder::encode(const Frame& frame) {
    if (!frame.valid()) throw std::runtime_error("malformed frame");
    if (!codec_ || frame.width != src_width_ || frame.height != src_height_ || frame.channels != src_channels_) {
        open(frame);
    }

    if (int rc = av_frame_make_writable(picture_.get()); rc < 0) {
        throw std::runtime_error("frame not writable: " + av_error(rc));
    }

    const std::uint8_t* src[1] = {frame.pixels.data()};
    const int src_stride[1] = {frame.width * frame.channels};
    sws_scale(scaler_.get(), src, src_stride, 0, frame.height, picture_->data, picture_->linesize);

    picture_->pts = next_pts_++;
    picture_->pict_type = keyframe_requested_ ? AV_PICTURE_TYPE_I : AV_PICTURE_TYPE_NONE;
    keyframe_requested_ = false;

    if (int rc = avcodec_send_frame(codec_.get(), picture_.get()); rc < 0) {
        throw std::runtime_error("encode failed: " + av_error(rc));
    }

    EncodedVideoFrame out;
    for (;;) {
        const int rc = avcodec_receive_packet(codec_.get(), packet_.get());
        if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) break;
        if (rc < 0) throw std::runtime_error("encode failed: " + av_error(rc));

        const auto* bytes = reinterpret_cast<const std::byte*>(packet_->data);
        out.data.insert(out.data.end(), bytes, bytes + packet_->size);
        if (packet_->flags & AV_PKT_FLAG_KEY) out.keyframe = true;
        out.timestamp = std::chrono::duration<double>(
            static_cast<double>(packet_->pts) / static_cast<double>(settings_.fps));
        av_packet_unref(packet_.get());
    }

    if (out.data.empty()) return std::nullopt;
    return out;
}

} // namespace portal::client
