#pragma once

// Set STOA_DEBUG=1 to compile in per-operation trace output
#ifndef STOA_DEBUG
#define STOA_DEBUG 0
#endif

// Per-step timeout for the kTLS handshake poll
#ifndef STOA_KTLS_HANDSHAKE_TIMEOUT_MS
#define STOA_KTLS_HANDSHAKE_TIMEOUT_MS 5000
#endif

#if STOA_DEBUG
#include "stoa/logger/Logger.hpp"
#include <sstream>
#define STOA_DEBUG_LOG(msg) \
    do { \
        std::ostringstream oss; \
        oss << msg; \
        stoa::Logger::getInstance().logMessage(oss.str()); \
    } while(0)
#else
#define STOA_DEBUG_LOG(msg) ((void)0)
#endif
