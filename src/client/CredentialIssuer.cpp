#include "client/CredentialIssuer.h"

#include <spdlog/spdlog.h>

namespace portal::client {

std::string LocalCredentialIssuer::issue(const std::string& room,
                                         const std::string& participant_name,
                                         const std::string& identity) {
    std::string token = idgen_.token() + "." + room + "." + identity;
    spdlog::debug("[Credentials] issued token for {} in {}", participant_name, room);
    return token;
}

} // namespace portal::client
