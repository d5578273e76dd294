#pragma once

// Overridden by the build (project version)
#ifndef ADMUTE_VERSION_STRING
#define ADMUTE_VERSION_STRING "0.1.0"
#endif
