#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace portal::client {

// Tightly packed 8-bit image, row-major, `channels` interleaved bytes per pixel.
struct Frame {
    int width = 0;
    int height = 0;
    int channels = 1;
    std::vector<std::uint8_t> pixels;

    std::size_t pixel_count() const noexcept {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }

    bool valid() const noexcept {
        return width > 0 && height > 0 && channels > 0 &&
               pixels.size() == pixel_count() * static_cast<std::size_t>(channels);
    }

    bool same_geometry(const Frame& other) const noexcept {
        return width == other.width && height == other.height && channels == other.channels;
    }
};

} // namespace portal::client
