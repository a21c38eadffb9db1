/**
 * @file client_connection_establisher.hpp
 * @brief Utilities to establish client connections to OPC UA endpoints.
 */
#ifndef CLIENT_CONNECTION_ESTABLISHER_HPP
#define CLIENT_CONNECTION_ESTABLISHER_HPP

#include <open62541/client.h>
#include <atomic>
#include <string>
#include "connection_settings.hpp"

/**
 * @brief Helper class encapsulating client configuration and retry logic.
 *
 * Methods allocate and initialize a new UA_Client instance on success and assign
 * it to the caller-provided pointer. On failure the pointer is set to nullptr.
 */
class client_connection_establisher {
private:
    connection_settings settings_; /**< the settings applied to every new client */
    const UA_Logger* logger_; /**< logger for connection diagnostics */
    UA_StatusCode last_status_; /**< status of the last connection attempt */
    std::atomic<bool> running_; /**< cleared by stop() */

    /**
     * @brief Creates a new client configured from the settings.
     *
     * @return UA_Client* the new client, nullptr if the configuration could not be applied.
     */
    UA_Client*
    create_client();
public:
    /**
     * @brief Constructs a connection establisher.
     *
     * @param _settings the connection settings.
     * @param _logger the logger for connection diagnostics.
     */
    client_connection_establisher(connection_settings _settings, const UA_Logger* _logger);

    /**
     * @brief Destructor (does not close any externally managed client).
     */
    ~client_connection_establisher();

    /**
     * @brief Establishes a connection to a server with a new client. You must ensure that the pointer is deleted and is null.
     *
     * Failed attempts are repeated once per second while the retry window of the settings is open.
     *
     * @param _client the client pointer where the new created one's adress is stored.
     * @param _server_endpoint the server endpoint.
     * @return true if connection is established successfully.
     * @return false if connection could not be established, _client is set to nullptr.
     */
    bool establish_connection(UA_Client*& _client, std::string _server_endpoint);

    /**
     * @brief Returns the status code of the last connection attempt.
     *
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode get_last_status() const;

    /**
     * @brief Ends a running retry loop before its next attempt. Safe to call from a signal handler.
     *
     */
    void stop();

    bool is_running() const;
};

#endif // CLIENT_CONNECTION_ESTABLISHER_HPP
