#include "../include/response_checker.hpp"

ua_status_error::ua_status_error(UA_StatusCode _status_code, const std::string& _context)
    : std::runtime_error(_context + ": " + UA_StatusCode_name(_status_code)), status_code_(_status_code) {
}

UA_StatusCode ua_status_error::get_status_code() const {
    return status_code_;
}

response_checker::response_checker() {
}

response_checker::~response_checker() {
}

void response_checker::check_status(UA_StatusCode _status_code, const std::string& _context) {
    if (_status_code != UA_STATUSCODE_GOOD)
        throw ua_status_error(_status_code, _context);
}

UA_StatusCode response_checker::get_browse_status(const UA_BrowseResponse& _response) {
    if (_response.responseHeader.serviceResult != UA_STATUSCODE_GOOD)
        return _response.responseHeader.serviceResult;
    if (_response.resultsSize != 1)
        return UA_STATUSCODE_BADUNEXPECTEDERROR;
    return _response.results[0].statusCode;
}

UA_StatusCode response_checker::get_browse_next_status(const UA_BrowseNextResponse& _response) {
    if (_response.responseHeader.serviceResult != UA_STATUSCODE_GOOD)
        return _response.responseHeader.serviceResult;
    if (_response.resultsSize != 1)
        return UA_STATUSCODE_BADUNEXPECTEDERROR;
    return _response.results[0].statusCode;
}
