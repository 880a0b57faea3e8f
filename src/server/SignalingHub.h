#pragma once

#include "common/Protocol.h"
#include "common/TimerService.hpp"
#include "networking/Session.hpp"
#include "server/BindingRegistry.h"
#include "server/DeviceStore.h"
#include "server/PresenceRegistry.h"

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace portal::server {

// Transport-independent signaling core. The transport feeds it frames and
// disconnects and gives it a way to write frames back to a connection.
class SignalingHub {
public:
    using SendFn = std::function<void(networking::ConnectionId, const std::string&)>;

    struct Options {
        std::chrono::milliseconds presence_timeout{70000};
        // Track per-group conferences and send CONFERENCE_START/END and
        // PEER_JOINED/LEFT. Clients apply the quorum rule themselves either way.
        bool announce_conferences = false;
    };

    SignalingHub(DeviceStore& store, common::TimerService& timers, Options options, SendFn send);

    SignalingHub(const SignalingHub&) = delete;
    SignalingHub& operator=(const SignalingHub&) = delete;

    void handle_connect(networking::ConnectionId connection);
    void handle_message(networking::ConnectionId connection, const std::string& text);
    void handle_disconnect(networking::ConnectionId connection);

    // Cancels every presence lease; nothing is broadcast.
    void shutdown();

    const PresenceRegistry& presence() const noexcept { return presence_; }
    const BindingRegistry& bindings() const noexcept { return bindings_; }

private:
    void dispatch(networking::ConnectionId connection, const common::Envelope& env);

    void on_register(networking::ConnectionId connection, const boost::json::object& payload);
    void on_motion_detected(networking::ConnectionId connection, const boost::json::object& payload);
    void on_motion_stopped(const boost::json::object& payload);
    void relay(networking::ConnectionId connection, const common::Envelope& env, bool report_missing);

    void on_presence_changed(const std::string& group_id);
    void update_conference(const std::string& group_id, const std::vector<common::Device>& present);

    common::Envelope presence_update(const std::string& group_id) const;
    std::string display_name(const std::string& device_id) const;

    void send(networking::ConnectionId connection, const common::Envelope& env);
    void send_to_device(const std::string& device_id, const common::Envelope& env);
    void send_error(networking::ConnectionId connection, std::string_view code, const std::string& message);
    void broadcast_to_group(const std::string& group_id, const common::Envelope& env);

    DeviceStore& store_;
    Options options_;
    SendFn send_;

    BindingRegistry bindings_;
    PresenceRegistry presence_;

    // group id -> sorted participant ids of the announced conference
    std::unordered_map<std::string, std::vector<std::string>> conferences_;
};

} // namespace portal::server
