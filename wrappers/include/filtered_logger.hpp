/**
 * @file filtered_logger.hpp
 * @brief Create open62541 logger instances filtered by level.
 */
#ifndef FILTERED_LOGGER_HPP
#define FILTERED_LOGGER_HPP

#include <open62541/plugin/log.h>
#include <stdarg.h>
#include <string>

/**
 * @brief Context object specifying the minimal log level.
 */
typedef struct {
    UA_LogLevel min_level_; /**< minimum log level forwarded to stderr. */
} custom_log_context;

/**
 * @brief Factory for level filtered UA_Logger objects.
 *
 * Messages are written to stderr.
 */
class filtered_logger {
private:
    /**
     * @brief Filters the print function.
     *
     * @param _log_context the log context.
     * @param _level the log level.
     * @param _category the log category.
     * @param _msg the message.
     * @param _args the message format args.
     */
    static void
    print_log(void* _log_context, UA_LogLevel _level, UA_LogCategory _category, const char* _msg, va_list _args);

    /**
     * @brief Cleanup hook for allocated context.
     *
     * @param _logger the logger to be cleared.
     */
    static void
    clear_logger(struct UA_Logger* _logger);
public:
    /**
     * @brief Constructs a new filtered logger object.
     *
     */
    filtered_logger();

    /**
     * @brief Destroys the filtered logger object.
     *
     */
    ~filtered_logger();

    /**
     * @brief Creates a filtered logger instance.
     * @param _level minimum log level, messages below are dropped.
     * @return UA_Logger struct suitable for UA_ClientConfig.
     */
    UA_Logger create_filtered_logger(UA_LogLevel _level);

    /**
     * @brief Maps a level name to the log level.
     *
     * @param _name one of trace, debug, info, warning, error, fatal.
     * @param _level where the level is stored.
     * @return true if the name is known.
     * @return false if the name is unknown, _level is left untouched.
     */
    static bool
    parse_level(const std::string& _name, UA_LogLevel& _level);
};

#endif // FILTERED_LOGGER_HPP
