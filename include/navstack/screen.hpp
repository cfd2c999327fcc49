#pragma once

#include "navstack/back_stack.hpp"
#include "navstack/export.hpp"
#include "navstack/record.hpp"

#include <map>
#include <string>

namespace navstack {

/**
 * @brief Named destination with string parameters.
 *
 * The stack never looks inside a Screen. The CLI and the JSON layer use it
 * as a concrete destination descriptor.
 */
struct Screen {
    std::string name;
    std::map<std::string, std::string> params;

    Screen() = default;
    explicit Screen(std::string n, std::map<std::string, std::string> p = {})
        : name(std::move(n)), params(std::move(p)) {}

    friend bool operator==(const Screen& a, const Screen& b) {
        return a.name == b.name && a.params == b.params;
    }
    friend bool operator!=(const Screen& a, const Screen& b) {
        return !(a == b);
    }
};

/// "name" or "name{k=v,k2=v2}"
NAVSTACK_API std::string to_string(const Screen& screen);

using ScreenRecord = BasicRecord<Screen>;
using ScreenBackStack = BackStack<ScreenRecord>;

} // namespace navstack
