#pragma once

#include "io/photo/image_decoder.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cphoto
{
// stb_image backed decoder.
// - supports common formats (PNG/JPG/GIF/BMP/PNM/...)
// - output is always RGBA8
class StbImageDecoder : public ImageDecoder
{
public:
    // Streams larger than this are rejected before decoding (0 = unlimited).
    explicit StbImageDecoder(std::size_t max_bytes = 32u * 1024u * 1024u) : m_max_bytes(max_bytes) {}

    bool Decode(std::istream& stream,
                const std::string& hint,
                ImageHandle& out,
                std::string& err) override;

    // Decode from an in-memory buffer.
    static bool DecodeBytes(const std::vector<std::uint8_t>& bytes,
                            const std::string& hint,
                            ImageHandle& out,
                            std::string& err);

private:
    std::size_t m_max_bytes = 0;
};
} // namespace cphoto
