/**
 * @file connection_settings.hpp
 * @brief Client side settings for connecting to and browsing an OPC UA server.
 */
#ifndef CONNECTION_SETTINGS_HPP
#define CONNECTION_SETTINGS_HPP

#include <open62541/plugin/log.h>
#include <string>
#include "types.hpp"

using namespace opcua_enum;

#define DEFAULT_TIMEOUT_MS 5000

/**
 * @brief Settings applied to the client before connecting.
 */
struct connection_settings {
    timeout_ms_t timeout_ms_ = DEFAULT_TIMEOUT_MS; /**< request timeout of the client */
    retry_s_t connect_retry_s_ = 0; /**< window in which failed connects are retried, 0 disables retries */
    std::string username_; /**< user name, anonymous session if empty */
    std::string password_; /**< password for the user name */
    UA_LogLevel log_level_ = UA_LOGLEVEL_WARNING; /**< minimum level of library internal messages */
    UA_UInt32 max_references_per_node_ = 0; /**< references per browse request, 0 leaves it to the server */
};

#endif // CONNECTION_SETTINGS_HPP
