#include "ConsoleFactory.hpp"
#include "AnsiConsole.hpp"
#include "ConsoleNull.hpp"

#include <iostream>

namespace sfpurge
{

ConsolePtr ConsoleFactory::Create(ConsoleMode mode)
{
    switch (mode)
    {
    case ConsoleMode::Silent:
        return std::make_shared<ConsoleNull>();
    case ConsoleMode::Plain:
        return std::make_shared<AnsiConsole>(std::cout, false);
    case ConsoleMode::Color:
        break;
    }
    return std::make_shared<AnsiConsole>(std::cout, true);
}

} // namespace sfpurge
