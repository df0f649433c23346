#pragma once

#include <string>

namespace cphoto
{
// Persistent loader settings (JSON).
struct LoaderConfig
{
    int worker_count = 1;     // 1 keeps strict submission order
    std::string photo_dir;    // defaults to "<config_dir>/photos"
    bool prefer_high_res = true;
    bool debug_logging = false;
};

// "$XDG_CONFIG_HOME/contact_photo", else "$HOME/.config/contact_photo", else ".".
std::string GetContactPhotoConfigDir();

// "<config_dir>/loader.json"
std::string GetLoaderConfigPath();

LoaderConfig DefaultLoaderConfig();

// A missing file is not an error: `out` keeps its values and true is returned.
// Unknown keys and mistyped values are ignored.
bool LoadLoaderConfig(const std::string& path, LoaderConfig& out, std::string& err);

bool SaveLoaderConfig(const std::string& path, const LoaderConfig& cfg, std::string& err);
} // namespace cphoto
