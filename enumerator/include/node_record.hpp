#ifndef NODE_RECORD_HPP
#define NODE_RECORD_HPP

#include <open62541/types.h>
#include <string>
#include "types.hpp"

using namespace opcua_enum;

/**
 * @brief What the enumeration learned about a single node.
 */
struct node_record {
    depth_t depth_ = 0; /**< distance from the node the walk started at */
    std::string node_id_; /**< the printed node id */
    std::string browse_name_; /**< name part of the browse name */
    UA_NodeClass node_class_ = UA_NODECLASS_UNSPECIFIED; /**< the node class */
    std::string data_type_; /**< data type name, variables only */
    std::string access_; /**< Writable, Read-only or Unknown, variables only */

    bool is_variable() const {
        return node_class_ == UA_NODECLASS_VARIABLE;
    }
};

#endif // NODE_RECORD_HPP
