#pragma once

#include <istream>
#include <memory>
#include <string>

namespace cphoto
{
// Opens the byte stream behind a photo locator.
// Called from dispatcher worker threads; implementations must be safe to call concurrently
// and report failures through `err` rather than throwing.
class ResourceProvider
{
public:
    virtual ~ResourceProvider() = default;

    virtual bool OpenResourceStream(const std::string& locator,
                                    std::unique_ptr<std::istream>& out,
                                    std::string& err) = 0;
};
} // namespace cphoto
