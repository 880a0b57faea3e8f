#include "client/CallController.h"
#include "client/CredentialIssuer.h"
#include "client/FrameSampler.h"
#include "client/H264Encoder.h"
#include "client/MotionInferrer.h"
#include "client/OpenCvFrameSource.h"
#include "client/PeerMeshOrchestrator.h"
#include "client/RtcPeerConnection.h"
#include "common/AsioTimerService.h"
#include "common/Config.h"
#include "networking/WebSocketClient.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>

int main(int argc, char* argv[]) {
    using namespace portal;

    std::optional<common::DeviceConfig> config;
    try {
        config = common::load_device_config(argc, argv, [](const char* name) { return std::getenv(name); });
    } catch (const common::ConfigError& e) {
        spdlog::error("[Device] configuration error: {}", e.what());
        return 1;
    }
    if (!config) return 0;

    spdlog::set_level(*common::parse_log_level(config->log_level));

    boost::asio::io_context ioc;
    common::AsioTimerService timers(ioc);

    networking::WebSocketClient ws(ioc, config->server_host, config->server_port, config->server_path);

    client::RtcPeerConnectionFactory factory(ioc, config->ice_servers);
    client::PeerMeshOrchestrator mesh(config->device_id, factory,
                                      [&ws](const common::Envelope& env) { ws.send(common::serialize(env)); });
    mesh.set_media_observer([](const std::string& peer_id, std::shared_ptr<client::RemoteMedia> media) {
        if (media) {
            spdlog::info("[Device] showing video from {} (mid {})", peer_id, media->mid());
        } else {
            spdlog::info("[Device] video from {} ended", peer_id);
        }
    });

    client::LocalCredentialIssuer issuer;
    client::CallController controller({config->device_id, config->group_id, config->device_name},
                                      mesh, issuer,
                                      [&ws](const std::string& msg) { ws.send(msg); });

    client::MotionSettings motion;
    motion.pixel_threshold = config->motion_threshold;
    motion.motion_timeout = config->motion_timeout;
    motion.heartbeat_interval = config->effective_heartbeat();

    client::MotionInferrer inferrer(timers, motion,
                                    [&controller] { controller.report_motion_detected(); },
                                    [&controller] { controller.report_motion_stopped(); });
    controller.set_motion_check([&inferrer] { return inferrer.active(); });

    client::OpenCvFrameSource camera(config->camera_index, config->frame_width, config->frame_height);
    client::FrameSampler sampler(timers, camera, inferrer, config->sample_interval);

    client::H264EncoderSettings video;
    video.fps = std::max(1, static_cast<int>(1000 / sampler.interval().count()));
    video.bitrate_kbps = config->video_bitrate_kbps;
    client::H264Encoder encoder(video);

    mesh.set_keyframe_request([&encoder] { encoder.request_keyframe(); });
    sampler.set_frame_observer([&](const client::Frame& frame) {
        if (mesh.linked_peers().empty()) return;
        try {
            if (auto encoded = encoder.encode(frame)) mesh.send_video(*encoded);
        } catch (const std::exception& e) {
            spdlog::error("[Device] video encoding failed: {}", e.what());
        }
    });

    std::unique_ptr<common::Timer> reconnect;
    std::unique_ptr<common::Timer> shutdown_grace;
    bool stopping = false;

    ws.set_on_open([&controller] { controller.on_connected(); });
    ws.set_on_message([&controller](const std::string& msg) { controller.handle_message(msg); });
    ws.set_on_close([&](const std::string& reason) {
        spdlog::warn("[Device] signaling connection closed: {}", reason);
        controller.on_disconnected();
        if (stopping) return;
        reconnect = timers.schedule(config->reconnect_delay, [&ws] { ws.connect(); });
    });

    ws.connect();
    sampler.start();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        spdlog::info("[Device] shutting down...");
        stopping = true;
        reconnect.reset();
        sampler.stop();
        inferrer.set_enabled(false);
        mesh.close_all();
        ws.close();
        // Give the final MOTION_STOPPED and the close frame a moment to flush.
        shutdown_grace = timers.schedule(std::chrono::milliseconds(500), [&ioc] { ioc.stop(); });
    });

    spdlog::info("[Device] {} ({}) in group {}, hub {}:{}", config->device_id, config->device_name,
                 config->group_id, config->server_host, config->server_port);
    ioc.run();
    spdlog::info("[Device] exit.");
    return 0;
}
