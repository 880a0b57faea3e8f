#pragma once

#include "common/IDGenerator.hpp"

#include <string>

namespace portal::client {

// Grants the credential a participant presents when joining a call room.
class JoinCredentialIssuer {
public:
    virtual ~JoinCredentialIssuer() = default;

    virtual std::string issue(const std::string& room,
                              const std::string& participant_name,
                              const std::string& identity) = 0;
};

// Opaque, locally generated tokens. Stands in where no media relay is deployed.
class LocalCredentialIssuer : public JoinCredentialIssuer {
public:
    std::string issue(const std::string& room,
                      const std::string& participant_name,
                      const std::string& identity) override;

private:
    common::IDGenerator idgen_;
};

} // namespace portal::client
