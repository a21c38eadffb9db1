#include "../include/client_connection_establisher.hpp"
#include <open62541/client_config_default.h>
#include <chrono>
#include <unistd.h>
#include "../include/filtered_logger.hpp"

client_connection_establisher::client_connection_establisher(connection_settings _settings, const UA_Logger* _logger)
    : settings_(_settings), logger_(_logger), last_status_(UA_STATUSCODE_GOOD), running_(true) {
}

client_connection_establisher::~client_connection_establisher() {
}

UA_Client*
client_connection_establisher::create_client() {
    UA_Client* client = UA_Client_new();
    UA_ClientConfig* client_config = UA_Client_getConfig(client);
    UA_ClientConfig_setDefault(client_config);
    client_config->securityMode = UA_MESSAGESECURITYMODE_NONE;
    client_config->timeout = settings_.timeout_ms_;
    *client_config->logging = filtered_logger().create_filtered_logger(settings_.log_level_);

    if (!settings_.username_.empty()) {
        last_status_ = UA_ClientConfig_setAuthenticationUsername(client_config, settings_.username_.c_str(), settings_.password_.c_str());
        if (last_status_ != UA_STATUSCODE_GOOD) {
            UA_LOG_ERROR(logger_, UA_LOGCATEGORY_USERLAND, "%s: Could not set user authentication: %s", __FUNCTION__, UA_StatusCode_name(last_status_));
            UA_Client_delete(client);
            return nullptr;
        }
    }
    return client;
}

bool
client_connection_establisher::establish_connection(UA_Client*& _client, std::string _server_endpoint) {
    if (_client != nullptr)
        UA_LOG_WARNING(logger_, UA_LOGCATEGORY_USERLAND, "%s: If passed client pointer is not deleted then memory leaks will occur!", __FUNCTION__);
    _client = create_client();
    if (_client == nullptr)
        return false;

    auto start = std::chrono::steady_clock::now();
    last_status_ = UA_Client_connect(_client, _server_endpoint.c_str());
    while (last_status_ != UA_STATUSCODE_GOOD && settings_.connect_retry_s_ > 0 && running_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start).count();
        if (elapsed >= settings_.connect_retry_s_) {
            UA_LOG_ERROR(logger_, UA_LOGCATEGORY_USERLAND, "%s: Connection attempt timed out after %u seconds", __FUNCTION__, settings_.connect_retry_s_);
            break;
        }
        UA_LOG_INFO(logger_, UA_LOGCATEGORY_USERLAND, "%s: Connection attempt failed (%s). Retrying to connect in 1 second", __FUNCTION__, UA_StatusCode_name(last_status_));
        sleep(1);
        if (!running_)
            break;
        last_status_ = UA_Client_connect(_client, _server_endpoint.c_str());
    }
    if (last_status_ != UA_STATUSCODE_GOOD) {
        UA_LOG_ERROR(logger_, UA_LOGCATEGORY_USERLAND, "%s: Connection attempt failed: %s", __FUNCTION__, UA_StatusCode_name(last_status_));
        UA_Client_delete(_client);
        _client = nullptr;
    }
    return last_status_ == UA_STATUSCODE_GOOD;
}

UA_StatusCode
client_connection_establisher::get_last_status() const {
    return last_status_;
}

void
client_connection_establisher::stop() {
    running_ = false;
}

bool
client_connection_establisher::is_running() const {
    return running_;
}
