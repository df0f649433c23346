#pragma once

#include "core/loader/image.h"

#include <istream>
#include <string>

namespace cphoto
{
// Decodes an opened photo stream. `hint` is the locator the stream came from and is only
// used for diagnostics. Same threading and error rules as ResourceProvider.
class ImageDecoder
{
public:
    virtual ~ImageDecoder() = default;

    virtual bool Decode(std::istream& stream,
                        const std::string& hint,
                        ImageHandle& out,
                        std::string& err) = 0;
};
} // namespace cphoto
