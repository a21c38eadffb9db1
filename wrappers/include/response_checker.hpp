/**
 * @file response_checker.hpp
 * @brief Validation of service responses and status codes returned by the client.
 */
#ifndef RESPONSE_CHECKER_HPP
#define RESPONSE_CHECKER_HPP

#include <open62541/types.h>
#include <open62541/types_generated.h>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when a service or attribute read returns a bad status code.
 */
class ua_status_error : public std::runtime_error {
private:
    UA_StatusCode status_code_; /**< the offending status code */
public:
    /**
     * @brief Constructs a new status error.
     *
     * @param _status_code the status code.
     * @param _context what was being done, prefixed to the message.
     */
    ua_status_error(UA_StatusCode _status_code, const std::string& _context);

    /**
     * @brief Returns the status code carried by the error.
     *
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode get_status_code() const;
};

class response_checker {
private:
public:
    response_checker();
    ~response_checker();

    /**
     * @brief Throws an ua_status_error if the status code is not good.
     *
     * @param _status_code the status code to check.
     * @param _context what was being done.
     */
    static void
    check_status(UA_StatusCode _status_code, const std::string& _context);

    /**
     * @brief Returns the status of a single-node browse response.
     *
     * The service result is checked first, then the size and status of the only browse result.
     *
     * @param _response the response to be checked.
     * @return UA_StatusCode the first bad status code found, else UA_STATUSCODE_GOOD.
     */
    static UA_StatusCode
    get_browse_status(const UA_BrowseResponse& _response);

    /**
     * @brief Returns the status of a single continuation point browse next response.
     *
     * @param _response the response to be checked.
     * @return UA_StatusCode the first bad status code found, else UA_STATUSCODE_GOOD.
     */
    static UA_StatusCode
    get_browse_next_status(const UA_BrowseNextResponse& _response);
};

#endif // RESPONSE_CHECKER_HPP
