#pragma once

#define SFPURGE_VERSION_MAJOR 1
#define SFPURGE_VERSION_MINOR 0
#define SFPURGE_VERSION_PATCH 0
#define SFPURGE_VERSION_STRING "1.0.0"

#define SFPURGE_APP_NAME "sfpurge"
