#include "client/RtcPeerConnection.h"

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <rtc/frameinfo.hpp>
#include <rtc/h264rtppacketizer.hpp>
#include <rtc/rtc.hpp>
#include <rtc/rtppacketizationconfig.hpp>

#include <cstdint>
#include <exception>
#include <random>
#include <utility>

namespace portal::client {

namespace asio = boost::asio;

namespace {

PeerState to_peer_state(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New:          return PeerState::New;
        case rtc::PeerConnection::State::Connecting:   return PeerState::Connecting;
        case rtc::PeerConnection::State::Connected:    return PeerState::Connected;
        case rtc::PeerConnection::State::Disconnected: return PeerState::Disconnected;
        case rtc::PeerConnection::State::Failed:       return PeerState::Failed;
        case rtc::PeerConnection::State::Closed:       return PeerState::Closed;
    }
    return PeerState::Failed;
}

class RtcRemoteMedia : public RemoteMedia {
public:
    explicit RtcRemoteMedia(std::shared_ptr<rtc::Track> track)
        : track_(std::move(track)) {}

    std::string mid() const override { return track_->mid(); }

private:
    std::shared_ptr<rtc::Track> track_;
};

// Everything the libdatachannel threads may touch. Handlers only run on the
// io_context and only while the connection is open.
struct Shared {
    asio::io_context& ioc;
    std::string peer_id;
    bool closed = false;

    PeerConnection::DescriptionCallback pending_description;
    PeerConnection::ErrorCallback pending_error;
    PeerConnection::CandidateCallback on_candidate;
    PeerConnection::StateCallback on_state;
    PeerConnection::MediaCallback on_media;
    PeerConnection::DoneCallback on_video_open;

    template <typename Fn>
    static void post(const std::shared_ptr<Shared>& self, Fn fn) {
        asio::post(self->ioc, [self, fn = std::move(fn)]() mutable {
            if (self->closed) return;
            fn(*self);
        });
    }
};

class RtcPeerConnection : public PeerConnection {
public:
    RtcPeerConnection(asio::io_context& ioc, const std::string& peer_id, const rtc::Configuration& config,
                      std::uint32_t ssrc)
        : shared_(std::make_shared<Shared>(Shared{ioc, peer_id})),
          pc_(std::make_shared<rtc::PeerConnection>(config)) {
        std::weak_ptr<Shared> weak = shared_;

        pc_->onLocalDescription([weak](rtc::Description desc) {
            auto self = weak.lock();
            if (!self) return;
            common::SessionDescription out{desc.typeString(), std::string(desc)};
            Shared::post(self, [out = std::move(out)](Shared& s) mutable {
                auto cb = std::move(s.pending_description);
                s.pending_description = nullptr;
                s.pending_error = nullptr;
                if (cb) cb(std::move(out));
            });
        });

        pc_->onLocalCandidate([weak](rtc::Candidate candidate) {
            auto self = weak.lock();
            if (!self) return;
            common::IceCandidate out{std::string(candidate), candidate.mid()};
            Shared::post(self, [out = std::move(out)](Shared& s) mutable {
                if (s.on_candidate) s.on_candidate(std::move(out));
            });
        });

        pc_->onStateChange([weak](rtc::PeerConnection::State state) {
            auto self = weak.lock();
            if (!self) return;
            Shared::post(self, [state](Shared& s) {
                if (s.on_state) s.on_state(to_peer_state(state));
            });
        });

        pc_->onTrack([weak](std::shared_ptr<rtc::Track> track) {
            auto self = weak.lock();
            if (!self) return;
            auto media = std::make_shared<RtcRemoteMedia>(std::move(track));
            Shared::post(self, [media](Shared& s) {
                if (s.on_media) s.on_media(media);
            });
        });

        // One bidirectional video m-line: we send the camera on it and the
        // peer's camera arrives on the same track.
        rtc::Description::Video video("video", rtc::Description::Direction::SendRecv);
        video.addH264Codec(kPayloadType, "profile-level-id=42e01f;packetization-mode=1;level-asymmetry-allowed=1");
        video.addSSRC(ssrc, "video", "portal", "video");
        local_video_ = pc_->addTrack(video);

        auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
            ssrc, "video", kPayloadType, rtc::H264RtpPacketizer::ClockRate);
        local_video_->setMediaHandler(std::make_shared<rtc::H264RtpPacketizer>(
            rtc::H264RtpPacketizer::Separator::LongStartSequence, rtp_config));

        std::weak_ptr<rtc::Track> weak_track = local_video_;
        local_video_->onOpen([weak, weak_track] {
            auto self = weak.lock();
            auto track = weak_track.lock();
            if (!self || !track) return;
            auto media = std::make_shared<RtcRemoteMedia>(std::move(track));
            Shared::post(self, [media](Shared& s) {
                if (s.on_video_open) s.on_video_open();
                if (s.on_media) s.on_media(media);
            });
        });
    }

    ~RtcPeerConnection() override { close(); }

    void create_offer(DescriptionCallback on_offer, ErrorCallback on_error) override {
        expect_description(std::move(on_offer), std::move(on_error));
        try {
            pc_->setLocalDescription(rtc::Description::Type::Offer);
        } catch (const std::exception& e) {
            fail(e.what());
        }
    }

    void accept_offer(const common::SessionDescription& offer,
                      DescriptionCallback on_answer, ErrorCallback on_error) override {
        expect_description(std::move(on_answer), std::move(on_error));
        try {
            // With auto-negotiation the answer is generated and reported
            // through onLocalDescription.
            pc_->setRemoteDescription(rtc::Description(offer.sdp, offer.type));
        } catch (const std::exception& e) {
            fail(e.what());
        }
    }

    void accept_answer(const common::SessionDescription& answer,
                       DoneCallback on_done, ErrorCallback on_error) override {
        try {
            pc_->setRemoteDescription(rtc::Description(answer.sdp, answer.type));
        } catch (const std::exception& e) {
            std::string what = e.what();
            Shared::post(shared_, [on_error = std::move(on_error), what](Shared&) {
                if (on_error) on_error(what);
            });
            return;
        }
        Shared::post(shared_, [on_done = std::move(on_done)](Shared&) {
            if (on_done) on_done();
        });
    }

    void add_remote_candidate(const common::IceCandidate& candidate) override {
        try {
            pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
        } catch (const std::exception& e) {
            spdlog::warn("[Rtc] error adding ICE candidate from {}: {}", shared_->peer_id, e.what());
        }
    }

    void send_video(const EncodedVideoFrame& frame) override {
        if (shared_->closed || frame.data.empty() || !local_video_->isOpen()) return;
        try {
            local_video_->sendFrame(frame.data.data(), frame.data.size(), rtc::FrameInfo(frame.timestamp));
        } catch (const std::exception& e) {
            spdlog::warn("[Rtc] video send to {} failed: {}", shared_->peer_id, e.what());
        }
    }

    void close() override {
        if (shared_->closed) return;
        shared_->closed = true;
        shared_->pending_description = nullptr;
        shared_->pending_error = nullptr;
        pc_->close();
    }

    void set_on_local_candidate(CandidateCallback cb) override { shared_->on_candidate = std::move(cb); }
    void set_on_state_change(StateCallback cb) override { shared_->on_state = std::move(cb); }
    void set_on_remote_media(MediaCallback cb) override { shared_->on_media = std::move(cb); }
    void set_on_video_open(DoneCallback cb) override { shared_->on_video_open = std::move(cb); }

private:
    static constexpr int kPayloadType = 96;

    void expect_description(DescriptionCallback on_description, ErrorCallback on_error) {
        shared_->pending_description = std::move(on_description);
        shared_->pending_error = std::move(on_error);
    }

    void fail(const std::string& what) {
        Shared::post(shared_, [what](Shared& s) {
            auto cb = std::move(s.pending_error);
            s.pending_description = nullptr;
            s.pending_error = nullptr;
            if (cb) cb(what);
        });
    }

    std::shared_ptr<Shared> shared_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> local_video_;
};

} // namespace

RtcPeerConnectionFactory::RtcPeerConnectionFactory(asio::io_context& ioc, std::vector<std::string> ice_servers)
    : ioc_(ioc),
      ice_servers_(std::move(ice_servers)),
      next_ssrc_(std::random_device{}()) {}

std::unique_ptr<PeerConnection> RtcPeerConnectionFactory::create(const std::string& peer_id) {
    rtc::Configuration config;
    for (const auto& url : ice_servers_) config.iceServers.emplace_back(url);
    return std::make_unique<RtcPeerConnection>(ioc_, peer_id, config, next_ssrc_++);
}

} // namespace portal::client
