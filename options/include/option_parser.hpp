/**
 * @file option_parser.hpp
 * @brief Declares the option_parser for the command line of the enumeration tool.
 *
 * @details
 * Usage: <ip> <port> [--mode all|enum-objects|show-object] [--depth N] [--nodeid ID]
 *        [--format text|json] [--config FILE] [--help]
 */
#ifndef OPTION_PARSER_HPP
#define OPTION_PARSER_HPP

#include <boost/program_options.hpp>
#include <ostream>
#include <string>
#include "enum_options.hpp"

class option_parser {
private:
    boost::program_options::options_description visible_options_; /**< the options listed in the usage */
    boost::program_options::options_description positional_options_; /**< ip and port */
    boost::program_options::positional_options_description positional_; /**< position of ip and port */

    /**
     * @brief Parses a port number in the range 1..65535.
     *
     * @param _text the text to parse.
     * @return port_t the port.
     */
    static port_t parse_port(const std::string& _text);
public:
    /**
     * @brief Constructs a new option parser object
     *
     */
    option_parser();

    /**
     * @brief Destroys the option parser object
     *
     */
    ~option_parser();

    /**
     * @brief Parses the command line.
     *
     * @param _argc the argument count.
     * @param _argv the arguments, the program name first.
     * @return enum_options the options.
     * @throws std::invalid_argument if an argument is missing, unknown or malformed, or show-object lacks --nodeid.
     */
    enum_options parse(int _argc, const char* const _argv[]) const;

    /**
     * @brief Prints the usage text.
     *
     * @param _out the stream to print to.
     * @param _program_name the program name.
     */
    void print_usage(std::ostream& _out, const std::string& _program_name) const;
};

#endif // OPTION_PARSER_HPP
