#pragma once

#include "io/photo/resource_provider.h"

#include <cstdint>
#include <string>

namespace cphoto
{
// File-backed contact photo provider.
//
// Accepted locators:
// - content://contacts/<id>/photo
// - content://com.android.contacts/contacts/<id>[/photo]
// - file://<path>, or a plain filesystem path
//
// Contact ids resolve inside `photo_dir`: "<id>.display.<ext>" is the high-res photo,
// "<id>.<ext>" the thumbnail. With prefer_high_res the display photo wins when both exist.
class ContactPhotoStore : public ResourceProvider
{
public:
    ContactPhotoStore(std::string photo_dir, bool prefer_high_res);

    bool OpenResourceStream(const std::string& locator,
                            std::unique_ptr<std::istream>& out,
                            std::string& err) override;

    // Resolves a locator to an existing file path without opening it.
    bool ResolvePath(const std::string& locator, std::string& out_path, std::string& err) const;

    // Parses a contact locator; false for file locators or malformed ids.
    static bool ParseContactId(const std::string& locator, std::int64_t& out_id);

    const std::string& PhotoDir() const { return m_photo_dir; }

private:
    bool FindContactPhoto(std::int64_t id, std::string& out_path) const;

    std::string m_photo_dir;
    bool m_prefer_high_res = true;
};
} // namespace cphoto
