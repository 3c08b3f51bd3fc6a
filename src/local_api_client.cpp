#include "local_api_client.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace modtui {

LocalApiClient::LocalApiClient(std::filesystem::path library_root, std::filesystem::path session_file)
    : library_root_(std::move(library_root)), session_file_(std::move(session_file)) {
    if (!library_root_.has_filename() && library_root_.has_parent_path()) {
        library_root_ = library_root_.parent_path();
    }
    restore_session();
}

void LocalApiClient::restore_session() {
    std::ifstream file(session_file_);
    if (!file) {
        return;
    }
    std::string account;
    std::getline(file, account);
    auto accounts = available_accounts();
    if (std::find(accounts.begin(), accounts.end(), account) == accounts.end()) {
        spdlog::warn("Ignoring stale session for account '{}'", account);
        return;
    }
    account_ = account;
    spdlog::info("Restored session for '{}'", account);
}

std::vector<std::string> LocalApiClient::available_accounts() const {
    std::vector<std::string> accounts;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(library_root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            accounts.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        spdlog::warn("Cannot list library {}: {}", library_root_.string(), ec.message());
    }
    std::sort(accounts.begin(), accounts.end());
    if (accounts.empty() && std::filesystem::is_directory(library_root_, ec)) {
        accounts.push_back(library_root_.filename().string());
    }
    return accounts;
}

std::filesystem::path LocalApiClient::account_dir(const std::string &account) const {
    auto dir = library_root_ / account;
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return dir;
    }
    return library_root_;
}

bool LocalApiClient::login(const std::string &account, std::string &error_message) {
    auto accounts = available_accounts();
    if (std::find(accounts.begin(), accounts.end(), account) == accounts.end()) {
        error_message = "No such account: " + account;
        return false;
    }

    std::ofstream file(session_file_, std::ios::trunc);
    if (!file) {
        error_message = "Cannot write session file: " + session_file_.string();
        return false;
    }
    file << account << '\n';

    account_ = account;
    spdlog::info("Logged in as '{}'", account);
    return true;
}

void LocalApiClient::logout() {
    if (!account_) {
        return;
    }
    spdlog::info("Logging out '{}'", *account_);
    account_.reset();
    std::error_code ec;
    std::filesystem::remove(session_file_, ec);
    if (ec) {
        spdlog::warn("Cannot remove session file {}: {}", session_file_.string(), ec.message());
    }
}

std::optional<std::pair<std::string, Playlist>> LocalApiClient::user_favorite_songlist() const {
    if (!account_) {
        return std::nullopt;
    }
    std::string name = *account_ + "'s favorites";
    return std::make_pair(name, scan_playlist(name, account_dir(*account_)));
}

}
