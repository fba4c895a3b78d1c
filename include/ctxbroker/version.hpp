/*
 * Fallback version header for ctxbroker
 *
 * The build system passes CTXBROKER_VERSION_* definitions on the compiler command line;
 * these defaults keep the headers usable when it does not.
 */

#pragma once

#ifndef CTXBROKER_VERSION_MAJOR
#define CTXBROKER_VERSION_MAJOR 0
#endif

#ifndef CTXBROKER_VERSION_MINOR
#define CTXBROKER_VERSION_MINOR 0
#endif

#ifndef CTXBROKER_VERSION_PATCH
#define CTXBROKER_VERSION_PATCH 0
#endif

#ifndef CTXBROKER_VERSION_STRING
#define CTXBROKER_VERSION_STRING "0.0.0+dev"
#endif
