#pragma once

#include "client/CredentialIssuer.h"
#include "client/PeerMeshOrchestrator.h"
#include "common/Protocol.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace portal::client {

// Device side of the signaling protocol: registers with the hub, reports
// motion edges, applies the quorum rule to presence updates and feeds the
// resulting roster to the mesh.
//
// Quorum: the device is in a call while at least two devices of its group are
// present and it is one of them.
class CallController {
public:
    using SendFn = std::function<void(const std::string&)>;
    using MotionCheck = std::function<bool()>;

    struct Identity {
        std::string device_id;
        std::string group_id;
        std::string device_name;
    };

    static constexpr std::size_t kQuorum = 2;

    CallController(Identity identity, PeerMeshOrchestrator& mesh, JoinCredentialIssuer& issuer, SendFn send);

    CallController(const CallController&) = delete;
    CallController& operator=(const CallController&) = delete;

    // Lets the controller re-announce ongoing motion after (re)registering.
    void set_motion_check(MotionCheck check) { motion_check_ = std::move(check); }

    void on_connected();
    void on_disconnected();
    void handle_message(const std::string& text);

    void report_motion_detected();
    void report_motion_stopped();

    bool registered() const noexcept { return registered_; }
    bool in_call() const noexcept { return in_call_; }
    const std::vector<std::string>& present_ids() const noexcept { return present_ids_; }
    const std::optional<std::string>& credential() const noexcept { return credential_; }
    const Identity& identity() const noexcept { return identity_; }

private:
    void dispatch(const common::Envelope& env);
    void on_presence_update(const boost::json::object& payload);
    void join_call();
    void leave_call(const char* reason);
    void send(const common::Envelope& env);

    Identity identity_;
    PeerMeshOrchestrator& mesh_;
    JoinCredentialIssuer& issuer_;
    SendFn send_;
    MotionCheck motion_check_;

    bool registered_ = false;
    bool in_call_ = false;
    std::vector<std::string> present_ids_;
    std::optional<std::string> credential_;
};

} // namespace portal::client
