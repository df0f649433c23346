#include "core/loader/loader_config.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cphoto
{
namespace
{
static constexpr int kSchemaVersion = 1;
static constexpr int kMaxWorkers = 8;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

static json ToJson(const LoaderConfig& cfg)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    j["worker_count"] = cfg.worker_count;
    j["photo_dir"] = cfg.photo_dir;
    j["prefer_high_res"] = cfg.prefer_high_res;
    j["debug_logging"] = cfg.debug_logging;
    return j;
}

static void FromJson(const json& j, LoaderConfig& out)
{
    // Defaults are already in out; only override what we recognize.
    if (j.contains("worker_count") && j["worker_count"].is_number_integer())
        out.worker_count = std::clamp(j["worker_count"].get<int>(), 1, kMaxWorkers);
    if (j.contains("photo_dir") && j["photo_dir"].is_string())
        out.photo_dir = j["photo_dir"].get<std::string>();
    if (j.contains("prefer_high_res") && j["prefer_high_res"].is_boolean())
        out.prefer_high_res = j["prefer_high_res"].get<bool>();
    if (j.contains("debug_logging") && j["debug_logging"].is_boolean())
        out.debug_logging = j["debug_logging"].get<bool>();
}
} // namespace

std::string GetContactPhotoConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/contact_photo";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/contact_photo";

    return ".";
}

std::string GetLoaderConfigPath()
{
    return (fs::path(GetContactPhotoConfigDir()) / "loader.json").string();
}

LoaderConfig DefaultLoaderConfig()
{
    LoaderConfig cfg;
    cfg.photo_dir = (fs::path(GetContactPhotoConfigDir()) / "photos").string();
    return cfg;
}

bool LoadLoaderConfig(const std::string& path, LoaderConfig& out, std::string& err)
{
    err.clear();

    std::ifstream f(path);
    if (!f)
    {
        std::error_code ec;
        const bool exists = fs::exists(path, ec);
        if (exists && !ec)
        {
            err = std::string("Failed to open loader config for reading: ") + path;
            return false;
        }
        return true; // first run; keep defaults
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse loader config (") + path + "): " + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = std::string("Loader config is not a JSON object: ") + path;
        return false;
    }

    // Unknown schema: ignore file rather than failing startup.
    if (j.contains("schema_version") && j["schema_version"].is_number_integer())
    {
        if (j["schema_version"].get<int>() != kSchemaVersion)
            return true;
    }

    FromJson(j, out);
    return true;
}

bool SaveLoaderConfig(const std::string& path, const LoaderConfig& cfg, std::string& err)
{
    err.clear();

    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to create config directory: ") + e.what();
        return false;
    }

    // Atomic write: write to a temp file in the same directory then rename over the original.
    const std::string tmp_path = path + ".tmp";

    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "Failed to open temp loader config file for writing.";
        return false;
    }

    try
    {
        out << ToJson(cfg).dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write loader config: ") + e.what();
        return false;
    }

    out.close();
    if (!out)
    {
        err = "Failed to finalize loader config temp file write.";
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = std::string("Failed to replace loader config: ") + ec.message();
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}
} // namespace cphoto
