#include "io/photo/stb_image_decoder.h"

#include <cstring>
#include <limits>
#include <memory>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace cphoto
{
bool StbImageDecoder::Decode(std::istream& stream,
                             const std::string& hint,
                             ImageHandle& out,
                             std::string& err)
{
    err.clear();
    out.reset();

    std::vector<std::uint8_t> bytes;
    char buf[16 * 1024];
    while (stream)
    {
        stream.read(buf, sizeof(buf));
        const std::streamsize n = stream.gcount();
        if (n <= 0)
            break;
        bytes.insert(bytes.end(), (const std::uint8_t*)buf, (const std::uint8_t*)buf + n);
        if (m_max_bytes != 0 && bytes.size() > m_max_bytes)
        {
            err = "Photo stream exceeds " + std::to_string(m_max_bytes) + " bytes: " + hint;
            return false;
        }
    }
    if (stream.bad())
    {
        err = "Read error on photo stream: " + hint;
        return false;
    }

    return DecodeBytes(bytes, hint, out, err);
}

bool StbImageDecoder::DecodeBytes(const std::vector<std::uint8_t>& bytes,
                                  const std::string& hint,
                                  ImageHandle& out,
                                  std::string& err)
{
    err.clear();
    out.reset();

    if (bytes.empty())
    {
        err = "Empty photo stream: " + hint;
        return false;
    }
    if (bytes.size() > (size_t)std::numeric_limits<int>::max())
    {
        err = "Photo stream too large: " + hint;
        return false;
    }

    int w = 0;
    int h = 0;
    int channels_in_file = 0;

    // Force 4 channels so we always get RGBA8.
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels_in_file, 4);
    if (!data)
    {
        err = std::string("Failed to decode photo: ") + (stbi_failure_reason() ? stbi_failure_reason() : "unknown error");
        return false;
    }

    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        err = "Invalid image dimensions.";
        return false;
    }

    auto img = std::make_shared<DecodedImage>();
    img->width = w;
    img->height = h;
    img->source_hint = hint;

    const size_t pixel_bytes = static_cast<size_t>(w) * static_cast<size_t>(h) * 4u;
    img->pixels.resize(pixel_bytes);
    std::memcpy(img->pixels.data(), data, pixel_bytes);

    stbi_image_free(data);
    out = std::move(img);
    return true;
}
} // namespace cphoto
