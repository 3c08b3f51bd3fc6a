#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace modtui {

struct Track {
    std::filesystem::path path;
    std::string title;

    bool operator==(const Track &other) const = default;
};

struct Playlist {
    std::string name;
    std::vector<Track> tracks;
};

bool is_module_file(const std::filesystem::path &path);

// Recursive scan of dir for playable files, sorted by file name ignoring case.
Playlist scan_playlist(const std::string &name, const std::filesystem::path &dir);

}
