#pragma once

#include "library.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace modtui {

class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual bool is_login() const = 0;
    virtual void logout() = 0;
    virtual bool login(const std::string &account, std::string &error_message) = 0;
    virtual std::vector<std::string> available_accounts() const = 0;
    virtual std::optional<std::pair<std::string, Playlist>> user_favorite_songlist() const = 0;
};

}
