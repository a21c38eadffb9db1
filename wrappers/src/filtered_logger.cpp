
#include "../include/filtered_logger.hpp"
#include <open62541/types.h>
#include <stdio.h>

static const char* level_names[] = {"trace", "debug", "info", "warning", "error", "fatal"};
static const UA_LogLevel levels[] = {UA_LOGLEVEL_TRACE, UA_LOGLEVEL_DEBUG, UA_LOGLEVEL_INFO,
                                     UA_LOGLEVEL_WARNING, UA_LOGLEVEL_ERROR, UA_LOGLEVEL_FATAL};

filtered_logger::filtered_logger() {
}

filtered_logger::~filtered_logger() {
}

void
filtered_logger::print_log(void* _log_context, UA_LogLevel _level, UA_LogCategory _category,
                    const char* _msg, va_list _args) {
    custom_log_context* ctx = (custom_log_context *)_log_context;

    if (_level >= ctx->min_level_) {
        vfprintf(stderr, _msg, _args);
        fprintf(stderr, "\n");
    }
}

void
filtered_logger::clear_logger(struct UA_Logger *logger) {
    UA_free(logger->context);
    logger->context = NULL;
}

UA_Logger
filtered_logger::create_filtered_logger(UA_LogLevel _level) {
    UA_Logger logger;
    custom_log_context* ctx = (custom_log_context *)UA_malloc(sizeof(custom_log_context));
    ctx->min_level_ = _level;

    logger.log = print_log;
    logger.context = ctx;
    logger.clear = clear_logger;
    return logger;
}

bool
filtered_logger::parse_level(const std::string& _name, UA_LogLevel& _level) {
    for (size_t i = 0; i < sizeof(levels) / sizeof(levels[0]); i++) {
        if (!_name.compare(level_names[i])) {
            _level = levels[i];
            return true;
        }
    }
    return false;
}
