#include "../include/settings_parser.hpp"
#include "filtered_logger.hpp"

#include <jsoncpp/json/json.h>
#include <fstream>
#include <stdexcept>

#define TIMEOUT_MS_KEY "timeout_ms"
#define CONNECT_RETRY_S_KEY "connect_retry_s"
#define USERNAME_KEY "username"
#define PASSWORD_KEY "password"
#define LOG_LEVEL_KEY "log_level"
#define MAX_REFERENCES_PER_NODE_KEY "max_references_per_node"

settings_parser::settings_parser(std::string _settings_file_path) {
    std::ifstream ifs_settings(_settings_file_path);
    if (!ifs_settings.is_open())
        throw std::invalid_argument("Could not open settings file " + _settings_file_path);
    Json::Value settings;
    Json::Reader reader;
    if (!reader.parse(ifs_settings, settings))
        throw std::invalid_argument("Could not parse settings file " + _settings_file_path + ": " + reader.getFormattedErrorMessages());
    if (!settings.isObject())
        throw std::invalid_argument("The settings file " + _settings_file_path + " must hold a JSON object");

    if (settings.isMember(TIMEOUT_MS_KEY)) {
        if (!settings[TIMEOUT_MS_KEY].isUInt() || settings[TIMEOUT_MS_KEY].asUInt() == 0)
            throw std::invalid_argument(std::string(TIMEOUT_MS_KEY) + " must be a positive integer");
        settings_.timeout_ms_ = settings[TIMEOUT_MS_KEY].asUInt();
    }
    if (settings.isMember(CONNECT_RETRY_S_KEY)) {
        if (!settings[CONNECT_RETRY_S_KEY].isUInt())
            throw std::invalid_argument(std::string(CONNECT_RETRY_S_KEY) + " must be a non-negative integer");
        settings_.connect_retry_s_ = settings[CONNECT_RETRY_S_KEY].asUInt();
    }
    if (settings.isMember(USERNAME_KEY)) {
        if (!settings[USERNAME_KEY].isString())
            throw std::invalid_argument(std::string(USERNAME_KEY) + " must be a string");
        settings_.username_ = settings[USERNAME_KEY].asString();
    }
    if (settings.isMember(PASSWORD_KEY)) {
        if (!settings[PASSWORD_KEY].isString())
            throw std::invalid_argument(std::string(PASSWORD_KEY) + " must be a string");
        settings_.password_ = settings[PASSWORD_KEY].asString();
    }
    if (settings.isMember(LOG_LEVEL_KEY)) {
        if (!settings[LOG_LEVEL_KEY].isString() || !filtered_logger::parse_level(settings[LOG_LEVEL_KEY].asString(), settings_.log_level_))
            throw std::invalid_argument(std::string(LOG_LEVEL_KEY) + " must be one of trace, debug, info, warning, error, fatal");
    }
    if (settings.isMember(MAX_REFERENCES_PER_NODE_KEY)) {
        if (!settings[MAX_REFERENCES_PER_NODE_KEY].isUInt())
            throw std::invalid_argument(std::string(MAX_REFERENCES_PER_NODE_KEY) + " must be a non-negative integer");
        settings_.max_references_per_node_ = settings[MAX_REFERENCES_PER_NODE_KEY].asUInt();
    }
}

settings_parser::~settings_parser() {
}

connection_settings settings_parser::get_settings() const {
    return settings_;
}
