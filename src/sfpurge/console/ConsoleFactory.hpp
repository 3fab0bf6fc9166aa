#pragma once

#include "IConsoleSink.hpp"
#include <memory>

namespace sfpurge {

enum class ConsoleMode {
    Color,
    Plain,
    Silent
};

class ConsoleFactory {
public:
    static ConsolePtr Create(ConsoleMode mode);
};

} // namespace sfpurge
