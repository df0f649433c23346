#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cphoto
{
// Decoded photo pixels, RGBA8 row-major (width * height * 4 bytes).
struct DecodedImage
{
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;

    // Locator (or file name) the pixels were decoded from.
    std::string source_hint;
};

// Shared, immutable once published. A null handle is the "absent" outcome:
// the resource could not be opened, could not be decoded, or held nothing.
using ImageHandle = std::shared_ptr<const DecodedImage>;

inline bool IsAbsent(const ImageHandle& image) { return image == nullptr; }
} // namespace cphoto
