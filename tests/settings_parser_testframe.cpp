#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include "settings_parser.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

static std::string write_settings(const std::string& _name, const std::string& _content) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / ("opcua_enum_" + std::to_string(getpid()) + "_" + _name + ".json");
    std::ofstream ofs(path.string());
    ofs << _content;
    return path.string();
}

static bool rejects(const std::string& _name, const std::string& _content) {
    std::string path = write_settings(_name, _content);
    bool rejected = false;
    try {
        settings_parser parser(path);
    } catch (const std::invalid_argument& e) {
        rejected = true;
    }
    std::filesystem::remove(path);
    return rejected;
}

int main(int argc, char* argv[]) {
    std::string full_path = write_settings("full",
        "{\n"
        "  \"timeout_ms\": 2500,\n"
        "  \"connect_retry_s\": 10,\n"
        "  \"username\": \"operator\",\n"
        "  \"password\": \"secret\",\n"
        "  \"log_level\": \"error\",\n"
        "  \"max_references_per_node\": 100,\n"
        "  \"comment\": \"unknown keys are ignored\"\n"
        "}\n");
    connection_settings full = settings_parser(full_path).get_settings();
    std::filesystem::remove(full_path);
    assertm(full.timeout_ms_ == 2500, "timeout");
    assertm(full.connect_retry_s_ == 10, "retry window");
    assertm(full.username_ == "operator", "username");
    assertm(full.password_ == "secret", "password");
    assertm(full.log_level_ == UA_LOGLEVEL_ERROR, "log level");
    assertm(full.max_references_per_node_ == 100, "max references per node");

    std::string empty_path = write_settings("empty", "{}");
    connection_settings defaults = settings_parser(empty_path).get_settings();
    std::filesystem::remove(empty_path);
    assertm(defaults.timeout_ms_ == DEFAULT_TIMEOUT_MS, "default timeout");
    assertm(defaults.connect_retry_s_ == 0, "no retries by default");
    assertm(defaults.username_.empty(), "anonymous by default");
    assertm(defaults.log_level_ == UA_LOGLEVEL_WARNING, "library warnings and above by default");
    assertm(defaults.max_references_per_node_ == 0, "server decides references per node by default");

    assertm(rejects("malformed", "{ \"timeout_ms\": "), "malformed JSON");
    assertm(rejects("array", "[1, 2]"), "top level must be an object");
    assertm(rejects("negative_timeout", "{\"timeout_ms\": -5}"), "negative timeout");
    assertm(rejects("zero_timeout", "{\"timeout_ms\": 0}"), "zero timeout");
    assertm(rejects("text_retry", "{\"connect_retry_s\": \"ten\"}"), "retry window must be a number");
    assertm(rejects("numeric_username", "{\"username\": 7}"), "username must be a string");
    assertm(rejects("level", "{\"log_level\": \"loud\"}"), "unknown log level");

    bool missing_rejected = false;
    try {
        settings_parser parser("/nonexistent/opcua_enum_settings.json");
    } catch (const std::invalid_argument& e) {
        missing_rejected = true;
    }
    assertm(missing_rejected, "missing file");

    std::cout << "settings_parser_testframe passed" << std::endl;
    return 0;
}
