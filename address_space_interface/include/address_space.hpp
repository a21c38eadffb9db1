#ifndef ADDRESS_SPACE_HPP
#define ADDRESS_SPACE_HPP

#include <open62541/types.h>
#include <string>
#include <vector>
#include "node_id.hpp"

/**
 * @brief Read and browse access to the address space of one server.
 *
 * Every read either returns the requested attribute or throws; implementations
 * report library status codes as ua_status_error.
 */
class address_space {
public:
    virtual ~address_space() = default;

    /**
     * @brief Returns the id of the standard Objects folder.
     *
     * @return node_id the objects folder id.
     */
    virtual node_id objects_node() = 0;

    /**
     * @brief Checks whether the node is present, i.e. its browse name can be read.
     *
     * @param _node_id the node id.
     * @return true if the node answers.
     * @return false if it does not.
     */
    virtual bool exists(const node_id& _node_id) = 0;

    virtual UA_NodeClass read_node_class(const node_id& _node_id) = 0;

    /**
     * @brief Reads the name part of the browse name.
     *
     * @param _node_id the node id.
     * @return std::string the browse name.
     */
    virtual std::string read_browse_name(const node_id& _node_id) = 0;

    /**
     * @brief Reads the display name text of the data type of a variable.
     *
     * @param _node_id the variable node id.
     * @return std::string the data type name.
     */
    virtual std::string read_data_type_name(const node_id& _node_id) = 0;

    virtual UA_Byte read_access_level(const node_id& _node_id) = 0;

    /**
     * @brief Reads the current value of a variable, formatted as text.
     *
     * @param _node_id the variable node id.
     * @return std::string the formatted value.
     */
    virtual std::string read_value(const node_id& _node_id) = 0;

    /**
     * @brief Returns the method components of a node.
     *
     * @param _node_id the node id.
     * @return std::vector<node_id> the method node ids.
     */
    virtual std::vector<node_id> browse_methods(const node_id& _node_id) = 0;

    /**
     * @brief Returns the targets of all forward hierarchical references of a node.
     *
     * @param _node_id the node id.
     * @return std::vector<node_id> the child node ids.
     */
    virtual std::vector<node_id> browse_children(const node_id& _node_id) = 0;
};

#endif // ADDRESS_SPACE_HPP
