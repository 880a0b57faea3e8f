#pragma once

#include "client/Frame.h"

#include <optional>

namespace portal::client {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Latest downsized frame, or nullopt when the camera has nothing ready.
    virtual std::optional<Frame> grab() = 0;
};

} // namespace portal::client
