#pragma once

#include "core/loader/image.h"
#include "core/loader/target_registry.h"

#include <any>
#include <functional>
#include <string>

namespace cphoto
{
// Invoked on the delivery thread, exactly once per accepted request.
// `image` is null when nothing could be loaded; treat that as "show the default".
using LoadCompleteListener = std::function<void(int token, const std::any& cookie, const ImageHandle& image)>;

struct LoadRequest
{
    int token = 0;
    TargetHandle target;
    std::string locator;
    std::any cookie;
    LoadCompleteListener listener; // may be empty
};

struct LoadResult
{
    int token = 0;
    std::any cookie;
    TargetHandle target;
    ImageHandle image; // null => absent
    LoadRequest request;
};
} // namespace cphoto
