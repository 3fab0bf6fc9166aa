#pragma once

#include "IConsoleSink.hpp"

namespace sfpurge {

class ConsoleNull : public IConsoleSink {
public:
    ~ConsoleNull() override = default;
    void Header(const std::string&) override {}
    void Info(const std::string&) override {}
    void Success(const std::string&) override {}
    void Warning(const std::string&) override {}
    void Error(const std::string&) override {}
    void Item(const std::string&) override {}
};

} // namespace sfpurge
