#pragma once

// Overridden by the build from the CMake project version.
#ifndef LEXGATE_VERSION_STRING
#define LEXGATE_VERSION_STRING "0.1.0"
#endif
