/**
 * @file settings_parser.hpp
 * @brief Declares the settings_parser for loading connection settings from a JSON file.
 *
 * @details
 * Recognized keys: timeout_ms, connect_retry_s, username, password, log_level
 * (trace, debug, info, warning, error, fatal) and max_references_per_node.
 * Other keys are ignored, missing keys keep their defaults.
 */
#ifndef SETTINGS_PARSER_HPP
#define SETTINGS_PARSER_HPP

#include <string>
#include "connection_settings.hpp"

class settings_parser {
private:
    connection_settings settings_; /**< the parsed settings */
public:
    /**
     * @brief Constructs a new settings parser object
     *
     * @param _settings_file_path the path of the settings file
     * @throws std::invalid_argument if the file cannot be read or holds malformed values
     */
    settings_parser(std::string _settings_file_path);

    /**
     * @brief Destroys the settings parser object
     *
     */
    ~settings_parser();

    /**
     * @brief Returns a copy of the parsed settings
     *
     * @return connection_settings the settings
     */
    connection_settings get_settings() const;
};

#endif // SETTINGS_PARSER_HPP
