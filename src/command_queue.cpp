#include "command_queue.hpp"

#include <utility>

namespace modtui {

void CommandQueue::push(Command command) {
    commands_.push_back(std::move(command));
}

std::optional<Command> CommandQueue::pop() {
    if (commands_.empty()) {
        return std::nullopt;
    }
    Command command = std::move(commands_.front());
    commands_.pop_front();
    return command;
}

}
