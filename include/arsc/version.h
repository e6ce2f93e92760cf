#pragma once

#define ARSC_VERSION_MAJOR 1
#define ARSC_VERSION_MINOR 2
#define ARSC_VERSION_PATCH 0
#define ARSC_VERSION "1.2.0"
