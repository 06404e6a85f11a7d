#pragma once

#define BUILDDECK_VERSION_MAJOR 1
#define BUILDDECK_VERSION_MINOR 2
#define BUILDDECK_VERSION_PATCH 0
