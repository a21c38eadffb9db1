/**
 * @file information_node_reader.hpp
 * @brief Reads node attributes of a remote address space through client service calls.
 */
#ifndef INFORMATION_NODE_READER_HPP
#define INFORMATION_NODE_READER_HPP

#include <open62541/client_highlevel.h>
#include <string>
#include "node_id.hpp"

/**
 * @brief Helper encapsulating a UA_Variant buffer for reading node values and other attributes.
 */
class information_node_reader {
private:
    UA_Variant variant_; /**< Internal variant reused across reads. */
public:
    /**
     * @brief Constructs a new information node reader object.
     *
     */
    information_node_reader();

    /**
     * @brief Destroys the information node reader object.
     *
     */
    ~information_node_reader();

    /**
     * @brief Reads the value attribute of a node of a remote OPC UA host.
     *
     * @param _client the client.
     * @param _node_id the node id.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    read_information_node(UA_Client* _client, const UA_NodeId& _node_id);

    /**
     * @brief Returns the variant in which the value of the read node is stored.
     *
     * @return UA_Variant* the variant containing the read node value.
     */
    UA_Variant*
    get_variant();

    /**
     * @brief Reads the node class attribute.
     *
     * @param _client the client.
     * @param _node_id the node id.
     * @param _node_class where the node class is stored.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    read_node_class(UA_Client* _client, const UA_NodeId& _node_id, UA_NodeClass& _node_class);

    /**
     * @brief Reads the name part of the browse name attribute.
     *
     * @param _client the client.
     * @param _node_id the node id.
     * @param _browse_name where the browse name is stored.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    read_browse_name(UA_Client* _client, const UA_NodeId& _node_id, std::string& _browse_name);

    /**
     * @brief Reads the text part of the display name attribute.
     *
     * @param _client the client.
     * @param _node_id the node id.
     * @param _display_name where the display name text is stored.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    read_display_name(UA_Client* _client, const UA_NodeId& _node_id, std::string& _display_name);

    /**
     * @brief Reads the data type attribute of a variable.
     *
     * @param _client the client.
     * @param _node_id the node id.
     * @param _data_type_id where the data type node id is stored.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    read_data_type(UA_Client* _client, const UA_NodeId& _node_id, node_id& _data_type_id);

    /**
     * @brief Reads the access level attribute of a variable.
     *
     * @param _client the client.
     * @param _node_id the node id.
     * @param _access_level where the access level mask is stored.
     * @return UA_StatusCode the status code.
     */
    UA_StatusCode
    read_access_level(UA_Client* _client, const UA_NodeId& _node_id, UA_Byte& _access_level);
};

#endif // INFORMATION_NODE_READER_HPP
