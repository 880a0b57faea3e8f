#pragma once

#include "client/PeerConnection.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace portal::client {

// PeerConnectionFactory backed by libdatachannel. Each connection carries one
// bidirectional H.264 video track. Callbacks from the WebRTC threads are posted
// onto the io_context.
class RtcPeerConnectionFactory : public PeerConnectionFactory {
public:
    RtcPeerConnectionFactory(boost::asio::io_context& ioc, std::vector<std::string> ice_servers);

    std::unique_ptr<PeerConnection> create(const std::string& peer_id) override;

private:
    boost::asio::io_context& ioc_;
    std::vector<std::string> ice_servers_;
    std::uint32_t next_ssrc_;
};

} // namespace portal::client
