#include "io/photo/contact_photo_store.h"

#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace cphoto
{
namespace
{
static constexpr std::array<const char*, 7> kPhotoExtensions = {
    "png", "jpg", "jpeg", "bmp", "gif", "ppm", "pgm",
};

static bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ParseId(std::string_view s, std::int64_t& out)
{
    if (s.empty() || s.size() > 18)
        return false;
    std::int64_t v = 0;
    for (char c : s)
    {
        if (!std::isdigit((unsigned char)c))
            return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

static bool RegularFileExists(const fs::path& p)
{
    std::error_code ec;
    return fs::is_regular_file(p, ec) && !ec;
}
} // namespace

ContactPhotoStore::ContactPhotoStore(std::string photo_dir, bool prefer_high_res)
    : m_photo_dir(std::move(photo_dir))
    , m_prefer_high_res(prefer_high_res)
{
}

bool ContactPhotoStore::ParseContactId(const std::string& locator, std::int64_t& out_id)
{
    std::string_view rest(locator);
    if (StartsWith(rest, "content://contacts/"))
        rest.remove_prefix(std::string_view("content://contacts/").size());
    else if (StartsWith(rest, "content://com.android.contacts/contacts/"))
        rest.remove_prefix(std::string_view("content://com.android.contacts/contacts/").size());
    else
        return false;

    // Optional "/photo" suffix.
    const size_t slash = rest.find('/');
    if (slash != std::string_view::npos)
    {
        if (rest.substr(slash) != "/photo")
            return false;
        rest = rest.substr(0, slash);
    }
    return ParseId(rest, out_id);
}

bool ContactPhotoStore::FindContactPhoto(std::int64_t id, std::string& out_path) const
{
    const fs::path dir(m_photo_dir);
    const std::string base = std::to_string(id);

    auto find_variant = [&](const std::string& stem) -> bool {
        for (const char* ext : kPhotoExtensions)
        {
            const fs::path p = dir / (stem + "." + ext);
            if (RegularFileExists(p))
            {
                out_path = p.string();
                return true;
            }
        }
        return false;
    };

    const std::string display = base + ".display";
    if (m_prefer_high_res)
        return find_variant(display) || find_variant(base);
    return find_variant(base) || find_variant(display);
}

bool ContactPhotoStore::ResolvePath(const std::string& locator, std::string& out_path, std::string& err) const
{
    err.clear();
    out_path.clear();

    if (locator.empty())
    {
        err = "Empty locator.";
        return false;
    }

    if (StartsWith(locator, "content://"))
    {
        std::int64_t id = 0;
        if (!ParseContactId(locator, id))
        {
            err = "Unsupported content locator: " + locator;
            return false;
        }
        if (!FindContactPhoto(id, out_path))
        {
            err = "No photo for contact " + std::to_string(id) + " in " + m_photo_dir;
            return false;
        }
        return true;
    }

    std::string path = locator;
    if (StartsWith(path, "file://"))
        path = path.substr(std::string_view("file://").size());
    else if (path.find("://") != std::string::npos)
    {
        err = "Unsupported locator scheme: " + locator;
        return false;
    }

    if (!RegularFileExists(path))
    {
        err = "Photo file not found: " + path;
        return false;
    }
    out_path = std::move(path);
    return true;
}

bool ContactPhotoStore::OpenResourceStream(const std::string& locator,
                                           std::unique_ptr<std::istream>& out,
                                           std::string& err)
{
    out.reset();

    std::string path;
    if (!ResolvePath(locator, path, err))
        return false;

    auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*f)
    {
        err = "Failed to open photo file: " + path;
        return false;
    }
    out = std::move(f);
    return true;
}
} // namespace cphoto
