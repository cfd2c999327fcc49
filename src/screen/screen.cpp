#include "navstack/screen.hpp"

namespace navstack {

std::string to_string(const Screen& screen) {
    if (screen.params.empty()) {
        return screen.name;
    }

    std::string out = screen.name + "{";
    bool first = true;
    for (const auto& [k, v] : screen.params) {
        if (!first) {
            out += ",";
        }
        out += k + "=" + v;
        first = false;
    }
    out += "}";
    return out;
}

} // namespace navstack
