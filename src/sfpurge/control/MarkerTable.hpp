#pragma once

#include <string>
#include <vector>

namespace sfpurge
{

using MarkerList = std::vector<std::string>;

// Marker tokens recognized in sc.exe / schtasks.exe output. Each entry holds
// alternatives because the wording depends on the system display language.
// Defaults cover English and Simplified Chinese; configuration can replace them.
struct MarkerTable
{
    MarkerList service_name{ "SERVICE_NAME" };
    MarkerList binary_path{ "BINARY_PATH_NAME" };
    MarkerList running_state{ "RUNNING" };
    MarkerList stop_confirm{ "STOP_PENDING", "STOPPED", "已发送停止控制" };
    MarkerList success{ "SUCCESS", "成功" };
    MarkerList task_name{ "TaskName:", "任务名:" };
    MarkerList task_program{ "Task To Run:", "要运行的程序:" };
    MarkerList access_denied{ "Access is denied", "拒绝访问" };
    MarkerList not_found{ "does not exist", "cannot find", "不存在", "找不到" };
};

} // namespace sfpurge
