#pragma once

#include "api_client.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace modtui {

// Accounts are the sub-directories of a library root; the session file
// remembers the account that is logged in between runs.
class LocalApiClient : public ApiClient {
public:
    LocalApiClient(std::filesystem::path library_root, std::filesystem::path session_file);

    bool is_login() const override { return account_.has_value(); }
    void logout() override;
    bool login(const std::string &account, std::string &error_message) override;
    std::vector<std::string> available_accounts() const override;
    std::optional<std::pair<std::string, Playlist>> user_favorite_songlist() const override;

    const std::optional<std::string> &account() const noexcept { return account_; }

private:
    std::filesystem::path account_dir(const std::string &account) const;
    void restore_session();

    std::filesystem::path library_root_;
    std::filesystem::path session_file_;
    std::optional<std::string> account_;
};

}
