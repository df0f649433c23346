// photo_fetch: loads contact photos through AsyncPhotoLoader and reports what each slot got.

#include "core/loader/loader_config.h"
#include "core/loader/photo_loader.h"
#include "core/loader/request_tracker.h"
#include "io/photo/contact_photo_store.h"
#include "io/photo/stb_image_decoder.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using namespace cphoto;

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--config <file>] [--photos <dir>] [--workers N] [--slots N]\n"
              << "               [--timeout-ms N] [--debug] <contact-id|locator>...\n"
              << "\n"
              << "Loads each photo asynchronously and prints one line per request once it is delivered.\n"
              << "Arguments are assigned round-robin to N display slots; repeating the argument that a\n"
              << "slot already shows is reported as skipped instead of reloading.\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>  Loader config JSON (default: <config_dir>/loader.json)\n"
              << "  --photos <dir>   Contact photo directory (overrides config)\n"
              << "  --workers N      Worker threads (overrides config)\n"
              << "  --slots N        Display slots (default: 1)\n"
              << "  --timeout-ms N   Give up waiting after N ms (default: 10000)\n"
              << "  --debug          Trace requests and completions on stderr\n";
}

static bool ParsePositiveInt(std::string_view s, int& out)
{
    if (s.empty() || s.size() > 9)
        return false;
    int v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
        v = v * 10 + (c - '0');
    }
    if (v <= 0)
        return false;
    out = v;
    return true;
}

static bool IsContactId(std::string_view s)
{
    if (s.empty() || s.size() > 18)
        return false;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}
} // namespace

int main(int argc, char** argv)
{
    std::string config_path = GetLoaderConfigPath();
    std::string photos_override;
    int workers_override = 0;
    int slot_count = 1;
    int timeout_ms = 10000;
    bool debug = false;
    std::vector<std::string> targets;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--config")
        {
            config_path = std::string(need("--config"));
        }
        else if (a == "--photos")
        {
            photos_override = std::string(need("--photos"));
        }
        else if (a == "--workers" || a == "--slots" || a == "--timeout-ms")
        {
            const std::string opt(a);
            int v = 0;
            if (!ParsePositiveInt(need(opt.c_str()), v))
            {
                std::cerr << "Invalid " << opt << " value (expected a positive integer)\n";
                return 2;
            }
            if (a == "--workers")
                workers_override = v;
            else if (a == "--slots")
                slot_count = v;
            else
                timeout_ms = v;
        }
        else if (a == "--debug")
        {
            debug = true;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else
        {
            targets.emplace_back(a);
        }
    }

    if (targets.empty())
    {
        PrintUsage(argv[0]);
        return 2;
    }

    LoaderConfig cfg = DefaultLoaderConfig();
    std::string err;
    if (!LoadLoaderConfig(config_path, cfg, err))
        std::fprintf(stderr, "[config] %s (using defaults)\n", err.c_str());
    if (!photos_override.empty())
        cfg.photo_dir = photos_override;
    if (workers_override > 0)
        cfg.worker_count = workers_override;
    if (debug)
        cfg.debug_logging = true;

    ContactPhotoStore store(cfg.photo_dir, cfg.prefer_high_res);
    StbImageDecoder decoder;
    TargetRegistry registry;
    DeliveryQueue delivery;
    AsyncPhotoLoader loader(cfg, store, decoder, registry, delivery);
    loader.Start();

    // The same argument text stands for the same live entity.
    std::unordered_map<std::string, TargetHandle> entities;
    std::vector<RequestTracker> slots((size_t)slot_count);

    int outstanding = 0;
    for (size_t i = 0; i < targets.size(); ++i)
    {
        const std::string& t = targets[i];
        auto it = entities.find(t);
        if (it == entities.end())
        {
            CallerInfo info;
            info.name = t;
            if (IsContactId(t))
                info.person_id = std::strtoll(t.c_str(), nullptr, 10);
            else
                info.photo_locator = t;
            it = entities.emplace(t, registry.Create(std::move(info))).first;
        }

        const TargetHandle caller = it->second;
        const int token = (int)i + 1;
        const size_t slot_index = i % slots.size();
        RequestTracker& slot = slots[slot_index];
        const std::string locator = registry.PhotoLocatorFor(caller);

        if (!slot.ShouldLoad(caller))
        {
            std::cout << "token=" << token << " slot=" << slot_index << " locator=" << locator << " skipped\n";
            continue;
        }
        slot.SetIdentity(caller);
        slot.SetDisplayMode(RequestTracker::DisplayMode::ShowingDefault);

        ++outstanding;
        loader.RequestLoad(caller, token, locator, slot_index,
                           [&outstanding, &slots, caller, locator](int tok, const std::any& cookie, const ImageHandle& image)
        {
            --outstanding;
            const size_t s = std::any_cast<size_t>(cookie);
            // A slot that moved on keeps showing its newer request.
            if (slots[s].CurrentIdentity() == caller && image)
                slots[s].SetDisplayMode(RequestTracker::DisplayMode::ShowingImage);

            std::cout << "token=" << tok << " slot=" << s << " locator=" << locator << " image=";
            if (image)
                std::cout << image->width << "x" << image->height << "\n";
            else
                std::cout << "absent\n";
        });
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (outstanding > 0 && std::chrono::steady_clock::now() < deadline)
        delivery.WaitAndRunPending(std::chrono::milliseconds(50));

    loader.Stop();
    delivery.RunPending();

    if (outstanding > 0)
    {
        std::cerr << "Timed out with " << outstanding << " request(s) outstanding\n";
        return 1;
    }
    return 0;
}
