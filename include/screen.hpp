#pragma once

#include "command.hpp"
#include "theme.hpp"

#include <ftxui/dom/elements.hpp>

namespace modtui {

// A screen owns a model and a cached view. update_model and handle_event
// return true when the view has to be rebuilt; collaborator failures are
// thrown.
class Screen {
public:
    virtual ~Screen() = default;

    virtual bool update_model() = 0;
    virtual bool handle_event(const Command &command) = 0;
    virtual void update_view(const Theme &theme) = 0;
    virtual ftxui::Element draw() const = 0;
};

}
