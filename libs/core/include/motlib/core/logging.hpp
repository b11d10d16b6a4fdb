#pragma once

#ifndef MOTLIB_LOGGING_VERBOSITY
#define MOTLIB_LOGGING_VERBOSITY 2
#endif

#if MOTLIB_LOGGING_VERBOSITY < 1

#define MOTLIB_LOG_ERR(str)

#else

#include <iostream>

#define MOTLIB_LOG_ERR(str) std::cerr << "Error: " << str << std::endl;

#endif

#if MOTLIB_LOGGING_VERBOSITY < 2

#define MOTLIB_LOG_WARN(str)

#else

#define MOTLIB_LOG_WARN(str) std::cerr << "Warning: " << str << std::endl;

#endif

#if MOTLIB_LOGGING_VERBOSITY < 3

#define MOTLIB_LOG_MSG(str)

#else

#define MOTLIB_LOG_MSG(str) std::cerr << "Message: " << str << std::endl;

#endif
