#include "PlatformFactory.hpp"
#include "CommandRunner.hpp"
#include "ProcessControl.hpp"
#include "VolumeEnumerator.hpp"
#include "../core/EngineContext.hpp"

#ifdef _WIN32
#include "../control/ScServiceControl.hpp"
#include "../control/SchtasksScheduler.hpp"
#else
#include "../control/NullControls.hpp"
#endif

#include <plog/Log.h>

namespace sfpurge
{

void PlatformServices::Attach(EngineContext& ctx) const
{
    ctx.volume_enumerator = volume_enumerator.get();
    ctx.service_control = service_control.get();
    ctx.task_scheduler = task_scheduler.get();
    ctx.process_control = process_control.get();
}

PlatformServices PlatformFactory::Create(const MarkerTable& markers)
{
    PlatformServices services;
    services.command_runner = std::make_unique<CommandRunner>();
    services.volume_enumerator = std::make_unique<VolumeEnumerator>();
    services.process_control = std::make_unique<ProcessControl>();

#ifdef _WIN32
    services.service_control = std::make_unique<ScServiceControl>(*services.command_runner, markers);
    services.task_scheduler = std::make_unique<SchtasksScheduler>(*services.command_runner, markers);
#else
    (void)markers;
    PLOG_INFO << "No Windows service manager on this host, service and task control disabled";
    services.service_control = std::make_unique<NullServiceControl>();
    services.task_scheduler = std::make_unique<NullTaskScheduler>();
#endif

    return services;
}

} // namespace sfpurge
