/**
 * @file enum_options.hpp
 * @brief Options of a single enumeration run as given on the command line.
 */
#ifndef ENUM_OPTIONS_HPP
#define ENUM_OPTIONS_HPP

#include <string>
#include "types.hpp"

using namespace opcua_enum;

/**
 * @brief The browsing modes
 *
 */
enum class enum_mode {
    ALL,
    ENUM_OBJECTS,
    SHOW_OBJECT
};

/**
 * @brief The output formats
 *
 */
enum class output_format {
    TEXT,
    JSON
};

/**
 * @brief Returns the command line name of the given mode
 *
 * @param _mode the mode
 * @return const char* the mode name
 */
static inline const char* enum_mode_to_string(enum_mode _mode) {
    switch (_mode) {
    case enum_mode::ALL: return "all";
    case enum_mode::ENUM_OBJECTS: return "enum-objects";
    case enum_mode::SHOW_OBJECT: return "show-object";
    default: return "Unimplemented mode";
    }
}

struct enum_options {
    std::string host_; /**< server host or ip address */
    port_t port_ = 0; /**< server port */
    enum_mode mode_ = enum_mode::ALL; /**< the browsing mode */
    depth_t depth_ = 0; /**< depth limit of enum-objects */
    std::string node_id_; /**< node id or object browse name for show-object */
    output_format format_ = output_format::TEXT; /**< the output format */
    std::string config_file_; /**< optional settings file */
    bool show_help_ = false; /**< print usage and exit */

    /**
     * @brief Returns the endpoint url opc.tcp://<host>:<port>.
     *
     * @return std::string the endpoint url.
     */
    std::string get_endpoint_url() const {
        return "opc.tcp://" + host_ + ":" + std::to_string(port_);
    }
};

#endif // ENUM_OPTIONS_HPP
