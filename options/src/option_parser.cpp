#include "../include/option_parser.hpp"
#include <limits>
#include <stdexcept>

#define MODE_ALL "all"
#define MODE_ENUM_OBJECTS "enum-objects"
#define MODE_SHOW_OBJECT "show-object"
#define FORMAT_TEXT "text"
#define FORMAT_JSON "json"

namespace po = boost::program_options;

/* Parses a non-negative decimal number that fits into _max */
static unsigned long parse_unsigned(const std::string& _text, unsigned long _max, const std::string& _what) {
    if (_text.empty() || _text.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument(_what + " must be a non-negative number, got '" + _text + "'");
    unsigned long value = 0;
    try {
        value = std::stoul(_text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(_what + " is out of range: " + _text);
    }
    if (value > _max)
        throw std::invalid_argument(_what + " is out of range: " + _text);
    return value;
}

option_parser::option_parser() : visible_options_("Options"), positional_options_("Arguments") {
    visible_options_.add_options()
        ("help,h", "Print this help")
        ("mode", po::value<std::string>()->default_value(MODE_ALL), "Enumeration mode: all, enum-objects or show-object")
        ("depth", po::value<std::string>()->default_value("0"), "Depth limit for enum-objects mode")
        ("nodeid", po::value<std::string>(), "NodeId or Object name for show-object mode")
        ("format", po::value<std::string>()->default_value(FORMAT_TEXT), "Output format: text or json")
        ("config", po::value<std::string>(), "JSON file with connection settings");
    positional_options_.add_options()
        ("ip", po::value<std::string>(), "Server IP address")
        ("port", po::value<std::string>(), "Server port");
    positional_.add("ip", 1).add("port", 1);
}

option_parser::~option_parser() {
}

port_t option_parser::parse_port(const std::string& _text) {
    unsigned long port = parse_unsigned(_text, std::numeric_limits<port_t>::max(), "port");
    if (port == 0)
        throw std::invalid_argument("port must be between 1 and 65535");
    return (port_t) port;
}

enum_options option_parser::parse(int _argc, const char* const _argv[]) const {
    po::options_description all_options;
    all_options.add(visible_options_).add(positional_options_);
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(_argc, _argv).options(all_options).positional(positional_).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::invalid_argument(e.what());
    }

    enum_options options;
    if (vm.count("help")) {
        options.show_help_ = true;
        return options;
    }
    if (!vm.count("ip") || !vm.count("port"))
        throw std::invalid_argument("the arguments ip and port are required");
    options.host_ = vm["ip"].as<std::string>();
    if (options.host_.empty())
        throw std::invalid_argument("ip must not be empty");
    options.port_ = parse_port(vm["port"].as<std::string>());

    std::string mode = vm["mode"].as<std::string>();
    if (!mode.compare(MODE_ALL)) {
        options.mode_ = enum_mode::ALL;
    } else if (!mode.compare(MODE_ENUM_OBJECTS)) {
        options.mode_ = enum_mode::ENUM_OBJECTS;
    } else if (!mode.compare(MODE_SHOW_OBJECT)) {
        options.mode_ = enum_mode::SHOW_OBJECT;
    } else {
        throw std::invalid_argument("invalid mode '" + mode + "', choose from all, enum-objects, show-object");
    }

    options.depth_ = (depth_t) parse_unsigned(vm["depth"].as<std::string>(), std::numeric_limits<depth_t>::max(), "depth");

    if (vm.count("nodeid"))
        options.node_id_ = vm["nodeid"].as<std::string>();
    if (options.mode_ == enum_mode::SHOW_OBJECT && options.node_id_.empty())
        throw std::invalid_argument("--nodeid is required for show-object mode");

    std::string format = vm["format"].as<std::string>();
    if (!format.compare(FORMAT_TEXT)) {
        options.format_ = output_format::TEXT;
    } else if (!format.compare(FORMAT_JSON)) {
        options.format_ = output_format::JSON;
    } else {
        throw std::invalid_argument("invalid format '" + format + "', choose from text, json");
    }

    if (vm.count("config"))
        options.config_file_ = vm["config"].as<std::string>();
    return options;
}

void option_parser::print_usage(std::ostream& _out, const std::string& _program_name) const {
    _out << "Usage: " << _program_name << " <ip> <port> [options]" << std::endl;
    _out << visible_options_ << std::endl;
}
