#pragma once

#include "IConsoleSink.hpp"

#include <ostream>
#include <string>

namespace sfpurge
{

class AnsiConsole : public IConsoleSink
{
public:
    AnsiConsole(std::ostream& out, bool use_color);
    ~AnsiConsole() override = default;

    void Header(const std::string& line) override;
    void Info(const std::string& line) override;
    void Success(const std::string& line) override;
    void Warning(const std::string& line) override;
    void Error(const std::string& line) override;
    void Item(const std::string& line) override;

private:
    void Write(const char* color, bool bold, const std::string& line);

    std::ostream& out_;
    bool use_color_;
};

} // namespace sfpurge
