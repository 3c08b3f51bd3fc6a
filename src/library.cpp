#include "library.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <spdlog/spdlog.h>

namespace modtui {

namespace {

const std::vector<std::string> kModuleExtensions = {
    ".mod", ".xm", ".s3m", ".it", ".mptm", ".stm", ".nst", ".m15", ".stk",
    ".wow", ".ult", ".669", ".mtm", ".med", ".far", ".mdl", ".ams", ".dsm",
    ".amf", ".okt", ".dmf", ".ptm", ".psm", ".mt2", ".dbm", ".digi", ".imf",
    ".j2b", ".gdm", ".umx", ".plm", ".mo3", ".xpk", ".ppm", ".mmcmp"
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}

bool is_module_file(const std::filesystem::path &path) {
    if (!path.has_extension()) {
        return false;
    }
    std::string ext = to_lower(path.extension().string());
    return std::find(kModuleExtensions.begin(), kModuleExtensions.end(), ext) != kModuleExtensions.end();
}

Playlist scan_playlist(const std::string &name, const std::filesystem::path &dir) {
    Playlist playlist;
    playlist.name = name;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", dir.string(), ec.message());
        return playlist;
    }

    for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("Skipping entry under {}: {}", dir.string(), ec.message());
            ec.clear();
            continue;
        }
        const auto &path = it->path();
        if (!it->is_regular_file(ec) || !is_module_file(path)) {
            continue;
        }
        playlist.tracks.push_back({path, path.stem().string()});
    }

    std::sort(playlist.tracks.begin(), playlist.tracks.end(), [](const Track &a, const Track &b) {
        return to_lower(a.path.filename().string()) < to_lower(b.path.filename().string());
    });

    spdlog::debug("Scanned {} tracks for playlist '{}'", playlist.tracks.size(), name);
    return playlist;
}

}
