#pragma once

#include "../control/ICommandRunner.hpp"

namespace sfpurge
{

/// Runs a program synchronously with stdout and stderr captured through one
/// pipe. Windows output is decoded from the OEM code page to UTF-8.
class CommandRunner : public ICommandRunner
{
public:
    CommandResult Run(const std::string& program, const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout) override;
};

} // namespace sfpurge
