/**
 * @file weft/logger.h
 * @brief Logging macros used throughout the weft routing engine.
 *
 * The macros route to qb's nanolog backend when `QB_LOGGER` is defined, to
 * `qb::io::cout()` / `qb::io::cerr()` when `QB_STDOUT_LOG` is defined, and
 * compile to no-ops otherwise.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#ifndef WEFT_LOGGER_H_
#define WEFT_LOGGER_H_

#include <qb/io.h> // For qb::io::cout, qb::io::cerr and nanolog under QB_LOGGER

// Every weft log line starts with this prefix.
#define WEFT_LOG_PREFIX "[weft] "

#ifdef QB_LOGGER

#define LOG_WEFT_TRACE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << WEFT_LOG_PREFIX << "TRACE: " << X)

#define LOG_WEFT_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << WEFT_LOG_PREFIX << "DEBUG: " << X)

#define LOG_WEFT_VERBOSE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::VERBOSE) && \
           NANO_LOG(nanolog::LogLevel::VERBOSE) << WEFT_LOG_PREFIX << "VERBOSE: " << X)

#define LOG_WEFT_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << WEFT_LOG_PREFIX << "INFO: " << X)

#define LOG_WEFT_WARN(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::WARN) && \
           NANO_LOG(nanolog::LogLevel::WARN) << WEFT_LOG_PREFIX << "WARN: " << X)

// nanolog has no ERROR level, CRIT keeps recovered faults visible.
#define LOG_WEFT_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << WEFT_LOG_PREFIX << "ERROR: " << X)

#define LOG_WEFT_CRIT(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << WEFT_LOG_PREFIX << "CRITICAL: " << X)

#else // QB_LOGGER

#ifdef QB_STDOUT_LOG
#define LOG_WEFT_TRACE(X)   qb::io::cout() << WEFT_LOG_PREFIX << "TRACE: " << X << std::endl
#define LOG_WEFT_DEBUG(X)   qb::io::cout() << WEFT_LOG_PREFIX << "DEBUG: " << X << std::endl
#define LOG_WEFT_VERBOSE(X) qb::io::cout() << WEFT_LOG_PREFIX << "VERBOSE: " << X << std::endl
#define LOG_WEFT_INFO(X)    qb::io::cout() << WEFT_LOG_PREFIX << "INFO: " << X << std::endl
#define LOG_WEFT_WARN(X)    qb::io::cout() << WEFT_LOG_PREFIX << "WARN: " << X << std::endl
#define LOG_WEFT_ERROR(X)   qb::io::cerr() << WEFT_LOG_PREFIX << "ERROR: " << X << std::endl
#define LOG_WEFT_CRIT(X)    qb::io::cerr() << WEFT_LOG_PREFIX << "CRITICAL: " << X << std::endl
#else // QB_STDOUT_LOG
#define LOG_WEFT_TRACE(X)   do {} while (false)
#define LOG_WEFT_DEBUG(X)   do {} while (false)
#define LOG_WEFT_VERBOSE(X) do {} while (false)
#define LOG_WEFT_INFO(X)    do {} while (false)
#define LOG_WEFT_WARN(X)    do {} while (false)
#define LOG_WEFT_ERROR(X)   do {} while (false)
#define LOG_WEFT_CRIT(X)    do {} while (false)
#endif // QB_STDOUT_LOG

#endif // QB_LOGGER

#endif // WEFT_LOGGER_H_
