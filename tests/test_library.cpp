#include "library.hpp"
#include "local_api_client.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

void touch(const fs::path &path) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path);
    file << "x";
}

std::string read_first_line(const fs::path &path) {
    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    return line;
}

}

int main() {
    const fs::path root = fs::temp_directory_path() / ("modtui_library_test_" + std::to_string(getpid()));
    fs::remove_all(root);

    const fs::path library = root / "library";
    touch(library / "alice" / "B.xm");
    touch(library / "alice" / "a.MOD");
    touch(library / "alice" / "sub" / "c.it");
    touch(library / "alice" / "notes.txt");
    fs::create_directories(library / "bob");

    assert(modtui::is_module_file("song.xm"));
    assert(modtui::is_module_file("SONG.S3M"));
    assert(!modtui::is_module_file("song.mp3"));
    assert(!modtui::is_module_file("README"));

    auto playlist = modtui::scan_playlist("mix", library / "alice");
    assert(playlist.name == "mix");
    assert(playlist.tracks.size() == 3);
    assert(playlist.tracks[0].title == "a");
    assert(playlist.tracks[1].title == "B");
    assert(playlist.tracks[2].title == "c");

    auto missing = modtui::scan_playlist("none", root / "does-not-exist");
    assert(missing.tracks.empty());

    const fs::path session = root / "session";
    {
        modtui::LocalApiClient client(library, session);
        assert(!client.is_login());
        assert(!client.user_favorite_songlist());

        auto accounts = client.available_accounts();
        assert(accounts.size() == 2);
        assert(accounts[0] == "alice");
        assert(accounts[1] == "bob");

        std::string error;
        assert(!client.login("carol", error));
        assert(error.find("carol") != std::string::npos);
        assert(!client.is_login());

        assert(client.login("alice", error));
        assert(client.is_login());
        assert(read_first_line(session) == "alice");

        auto favorite = client.user_favorite_songlist();
        assert(favorite);
        assert(favorite->first == "alice's favorites");
        assert(favorite->second.tracks.size() == 3);
    }
    {
        modtui::LocalApiClient client(library, session);
        assert(client.is_login());
        assert(client.account() == std::optional<std::string>("alice"));
        client.logout();
        assert(!client.is_login());
        assert(!fs::exists(session));
    }
    {
        std::ofstream(session) << "mallory\n";
        modtui::LocalApiClient client(library, session);
        assert(!client.is_login());
    }

    const fs::path flat = root / "flat";
    touch(flat / "one.mod");
    {
        modtui::LocalApiClient client(flat, root / "flat_session");
        auto accounts = client.available_accounts();
        assert(accounts.size() == 1);
        assert(accounts[0] == "flat");

        std::string error;
        assert(client.login("flat", error));
        auto favorite = client.user_favorite_songlist();
        assert(favorite && favorite->second.tracks.size() == 1);
    }

    fs::remove_all(root);
    std::cout << "All library tests passed." << std::endl;
    return 0;
}
