#ifndef AETHER_BUILTINS_H
#define AETHER_BUILTINS_H

#include <aether_common.h>
#include <string>
#include <string_view>
#include <vector>

namespace Aether {

namespace Code {

struct Builtin {
    std::string_view name;
    std::string_view signature;
    std::string_view description;
    std::string_view category;
    std::vector<std::string_view> examples;

    std::string detail() const alloc_except;
    std::string documentation() const alloc_except;
};

const std::vector<Builtin>& builtins() noexcept;
const Builtin* findBuiltin(std::string_view name) noexcept;

}

}

#endif // AETHER_BUILTINS_H
