#ifndef RECORDING_LOGGER_HPP
#define RECORDING_LOGGER_HPP

#include <open62541/plugin/log.h>
#include <stdio.h>
#include <string>
#include <vector>

/**
 * @brief Logger collecting formatted messages instead of printing them.
 */
class recording_logger {
private:
    UA_Logger logger_;

    static void record(void* _log_context, UA_LogLevel _level, UA_LogCategory _category,
                       const char* _msg, va_list _args) {
        char buffer[512];
        vsnprintf(buffer, sizeof(buffer), _msg, _args);
        recording_logger* self = (recording_logger*) _log_context;
        self->messages_.push_back(buffer);
        self->levels_.push_back(_level);
    }
public:
    std::vector<std::string> messages_;
    std::vector<UA_LogLevel> levels_;

    recording_logger() {
        logger_.log = record;
        logger_.context = this;
        logger_.clear = NULL;
    }

    const UA_Logger* get() const {
        return &logger_;
    }

    bool contains(const std::string& _text) const {
        for (const std::string& message : messages_) {
            if (message.find(_text) != std::string::npos)
                return true;
        }
        return false;
    }
};

#endif // RECORDING_LOGGER_HPP
