#pragma once

#include "command.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace modtui {

class CommandQueue {
public:
    void push(Command command);
    std::optional<Command> pop();

    std::size_t size() const noexcept { return commands_.size(); }

private:
    std::deque<Command> commands_;
};

}
