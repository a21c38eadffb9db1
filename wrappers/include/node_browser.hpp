#ifndef NODE_BROWSER_HPP
#define NODE_BROWSER_HPP

#include <open62541/client.h>
#include <vector>
#include "node_id.hpp"

class node_browser {
private:
    UA_UInt32 max_references_per_node_; /**< references per browse request, 0 leaves it to the server */

    /**
     * @brief Browses with the given description and follows continuation points until exhausted.
     *
     * @param _client the client
     * @param _browse_description the browse description
     * @param _targets the node ids of all referenced local nodes are appended here
     * @return UA_StatusCode the first bad status code, else UA_STATUSCODE_GOOD
     */
    UA_StatusCode browse(UA_Client* _client, UA_BrowseDescription _browse_description, std::vector<node_id>& _targets);

    /**
     * @brief Appends the target node ids of a browse result, skipping nodes on other servers.
     *
     * @param _browse_result the browse result
     * @param _targets the target node ids
     */
    static void collect_targets(const UA_BrowseResult& _browse_result, std::vector<node_id>& _targets);
public:
    explicit node_browser(UA_UInt32 _max_references_per_node = 0);
    ~node_browser();

    /**
     * @brief Tells the server to free a continuation point that will not be followed.
     *
     * @param _client the client
     * @param _continuation_point the continuation point, nothing is sent if it is empty
     */
    static void release_continuation_point(UA_Client* _client, UA_ByteString* _continuation_point);

    /**
     * @brief Returns all methods of a node
     *
     * @param _client the client
     * @param _node_id the id of the node
     * @param _methods the method node ids
     * @return UA_StatusCode the status code of the browse
     */
    UA_StatusCode browse_methods(UA_Client* _client, const UA_NodeId& _node_id, std::vector<node_id>& _methods);

    /**
     * @brief Returns all nodes referenced by forward hierarchical references, regardless of their node class
     *
     * @param _client the client
     * @param _node_id the id of the node
     * @param _children the child node ids
     * @return UA_StatusCode the status code of the browse
     */
    UA_StatusCode browse_children(UA_Client* _client, const UA_NodeId& _node_id, std::vector<node_id>& _children);
};

#endif // NODE_BROWSER_HPP
