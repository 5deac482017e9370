/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("gesture closed, " + std::to_string(n) + " samples", "TouchAgent");
 */

#pragma once

#include "Logger.h"

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::BehaviorSentinel::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::BehaviorSentinel::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::BehaviorSentinel::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::BehaviorSentinel::Logger::instance().error(msg, component)
