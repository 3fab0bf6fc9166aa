#pragma once

#include "../control/ICommandRunner.hpp"
#include "../control/IProcessControl.hpp"
#include "../control/IServiceControl.hpp"
#include "../control/ITaskScheduler.hpp"
#include "../control/MarkerTable.hpp"
#include "../discovery/IVolumeEnumerator.hpp"

#include <memory>

namespace sfpurge
{

struct EngineContext;

/// Owns the host collaborators for one run.
struct PlatformServices
{
    std::unique_ptr<ICommandRunner> command_runner;
    std::unique_ptr<IVolumeEnumerator> volume_enumerator;
    std::unique_ptr<IServiceControl> service_control;
    std::unique_ptr<ITaskScheduler> task_scheduler;
    std::unique_ptr<IProcessControl> process_control;

    /// Points the context's borrowed collaborator pointers at these objects.
    void Attach(EngineContext& ctx) const;
};

class PlatformFactory
{
public:
    /// sc.exe / schtasks.exe backed controls on Windows, null controls elsewhere.
    static PlatformServices Create(const MarkerTable& markers);
};

} // namespace sfpurge
