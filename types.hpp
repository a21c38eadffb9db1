#ifndef TYPES_HPP
#define TYPES_HPP

#include <open62541/types.h>

namespace opcua_enum {
    typedef UA_UInt16 port_t;
    typedef UA_UInt32 depth_t;
    typedef UA_UInt32 timeout_ms_t;
    typedef UA_UInt32 retry_s_t;
};
#endif // TYPES_HPP
