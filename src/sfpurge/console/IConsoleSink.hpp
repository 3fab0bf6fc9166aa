#pragma once

#include <string>
#include <memory>

namespace sfpurge {

// Operator-facing output. Distinct from the log file: every line here is meant
// to be read live by whoever runs the tool.
class IConsoleSink {
public:
    virtual ~IConsoleSink() = default;
    virtual void Header(const std::string& line) = 0;
    virtual void Info(const std::string& line) = 0;
    virtual void Success(const std::string& line) = 0;
    virtual void Warning(const std::string& line) = 0;
    virtual void Error(const std::string& line) = 0;
    // Indented list entry under the previous line
    virtual void Item(const std::string& line) = 0;
};

using ConsolePtr = std::shared_ptr<IConsoleSink>;

} // namespace sfpurge
