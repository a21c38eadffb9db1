#include <open62541/client.h>
#include <open62541/plugin/log_stdout.h>

#include <signal.h>
#include <iostream>
#include <memory>

#include "option_parser.hpp"
#include "settings_parser.hpp"
#include "client_connection_establisher.hpp"
#include "filtered_logger.hpp"
#include "remote_address_space.hpp"
#include "address_space_enumerator.hpp"
#include "text_printer.hpp"
#include "json_tree_writer.hpp"

client_connection_establisher* establisher_instance_ = nullptr;
address_space_enumerator* enumerator_instance_ = nullptr;

static void stop_handler(int sig) {
    if (establisher_instance_ != nullptr)
        establisher_instance_->stop();
    if (enumerator_instance_ != nullptr)
        enumerator_instance_->stop();
}

/* Runs the selected mode, returns whether it completed */
static bool run_mode(address_space_enumerator& _enumerator, const enum_options& _options) {
    switch (_options.mode_) {
    case enum_mode::ALL:
        _enumerator.browse_all();
        return true;
    case enum_mode::ENUM_OBJECTS:
        _enumerator.enumerate_objects(_options.depth_);
        return true;
    case enum_mode::SHOW_OBJECT:
        return _enumerator.browse_specific_object(_options.node_id_);
    default:
        return false;
    }
}

int main(int argc, char* argv[]) {
    option_parser parser;
    enum_options options;
    try {
        options = parser.parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", e.what());
        parser.print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }
    if (options.show_help_) {
        parser.print_usage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }

    connection_settings settings;
    if (!options.config_file_.empty()) {
        try {
            settings = settings_parser(options.config_file_).get_settings();
        } catch (const std::invalid_argument& e) {
            UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_USERLAND, "%s", e.what());
            return EXIT_FAILURE;
        }
    }

    /* Keep stdout for the document when writing JSON */
    UA_Logger stderr_logger = filtered_logger().create_filtered_logger(UA_LOGLEVEL_INFO);
    const UA_Logger* logger = options.format_ == output_format::JSON ? &stderr_logger : UA_Log_Stdout;

    std::string endpoint_url = options.get_endpoint_url();
    UA_LOG_INFO(logger, UA_LOGCATEGORY_USERLAND, "Connecting to OPC UA server at %s...", endpoint_url.c_str());
    UA_Client* client = nullptr;
    client_connection_establisher cce(settings, logger);
    establisher_instance_ = &cce;
    signal(SIGINT, stop_handler);
    signal(SIGTERM, stop_handler);
    bool connected = cce.establish_connection(client, endpoint_url);
    establisher_instance_ = nullptr;
    if (!connected) {
        if (!cce.is_running())
            UA_LOG_WARNING(logger, UA_LOGCATEGORY_USERLAND, "Connecting interrupted");
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        stderr_logger.clear(&stderr_logger);
        return EXIT_FAILURE;
    }
    UA_LOG_INFO(logger, UA_LOGCATEGORY_USERLAND, "Connected successfully.");

    std::unique_ptr<enumeration_sink> sink;
    if (options.format_ == output_format::JSON)
        sink = std::make_unique<json_tree_writer>(std::cout, endpoint_url);
    else
        sink = std::make_unique<text_printer>(std::cout);

    bool succeeded = false;
    try {
        remote_address_space space(client, settings.max_references_per_node_);
        /* walk diagnostics never interleave with the printed tree */
        address_space_enumerator enumerator(space, *sink, &stderr_logger);
        enumerator_instance_ = &enumerator;
        succeeded = run_mode(enumerator, options);
        enumerator_instance_ = nullptr;
        if (!enumerator.is_running()) {
            UA_LOG_WARNING(logger, UA_LOGCATEGORY_USERLAND, "Enumeration interrupted");
            succeeded = false;
        }
        sink->on_finished();
    } catch (const std::exception& e) {
        enumerator_instance_ = nullptr;
        UA_LOG_ERROR(logger, UA_LOGCATEGORY_USERLAND, "Failed during browsing: %s", e.what());
        succeeded = false;
    }

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    /* Clean up */
    UA_Client_disconnect(client);
    UA_Client_delete(client);
    stderr_logger.clear(&stderr_logger);
    return succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
}
