#include "core/types.h"

namespace gridq {

std::string to_string(const Coordinate& c) {
    return "(" + std::to_string(c.row) + ", " + std::to_string(c.column) + ")";
}

const char* action_name(Action a) {
    switch (a) {
        case Action::UP:    return "UP";
        case Action::DOWN:  return "DOWN";
        case Action::LEFT:  return "LEFT";
        case Action::RIGHT: return "RIGHT";
    }
    return "?";
}

bool parse_action(const std::string& name, Action& out) {
    for (Action a : kAllActions) {
        if (name == action_name(a)) {
            out = a;
            return true;
        }
    }
    return false;
}

} // namespace gridq
