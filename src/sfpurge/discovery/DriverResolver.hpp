#pragma once

#include "../core/EngineContext.hpp"

namespace sfpurge
{

// Name match only. Driver image paths usually live under System32\drivers,
// not under the product directory, so they are not probed.
class DriverResolver
{
public:
    explicit DriverResolver(EngineContext& ctx);

    size_t Resolve();

private:
    EngineContext& ctx_;
};

} // namespace sfpurge
