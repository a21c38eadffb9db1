#ifndef MEMORY_ADDRESS_SPACE_HPP
#define MEMORY_ADDRESS_SPACE_HPP

#include <open62541/types.h>
#include <map>
#include <string>
#include <vector>
#include "address_space.hpp"
#include "response_checker.hpp"

/**
 * @brief A node of the in-memory address space with switches to make single reads fail.
 */
struct memory_node {
    UA_NodeClass node_class_ = UA_NODECLASS_OBJECT;
    std::string browse_name_;
    std::string data_type_; /**< empty makes the data type read fail */
    UA_Byte access_level_ = UA_ACCESSLEVELMASK_READ;
    bool access_level_readable_ = true;
    std::string value_;
    bool value_readable_ = true;
    bool readable_ = true; /**< false makes the node class read fail */
    bool browsable_ = true; /**< false makes browsing the methods fail */
    std::vector<node_id> methods_;
    std::vector<node_id> children_;
};

/**
 * @brief Address space held in memory, rooted at the Objects folder i=85.
 */
class memory_address_space : public address_space {
private:
    std::map<node_id, memory_node> nodes_;

    const memory_node& find(const node_id& _node_id, const std::string& _context) {
        auto it = nodes_.find(_node_id);
        if (it == nodes_.end())
            throw ua_status_error(UA_STATUSCODE_BADNODEIDUNKNOWN, _context);
        return it->second;
    }
public:
    memory_address_space() {
        memory_node objects;
        objects.browse_name_ = "Objects";
        nodes_[objects_node()] = objects;
    }

    memory_node& add_object(const node_id& _parent, const node_id& _id, const std::string& _browse_name) {
        memory_node node;
        node.browse_name_ = _browse_name;
        nodes_[_id] = node;
        nodes_[_parent].children_.push_back(_id);
        return nodes_[_id];
    }

    memory_node& add_variable(const node_id& _parent, const node_id& _id, const std::string& _browse_name,
                              const std::string& _data_type, const std::string& _value, UA_Byte _access_level) {
        memory_node& node = add_object(_parent, _id, _browse_name);
        node.node_class_ = UA_NODECLASS_VARIABLE;
        node.data_type_ = _data_type;
        node.value_ = _value;
        node.access_level_ = _access_level;
        return node;
    }

    /* Methods are hierarchical components, so they are children as well */
    memory_node& add_method(const node_id& _parent, const node_id& _id, const std::string& _browse_name) {
        memory_node& node = add_object(_parent, _id, _browse_name);
        node.node_class_ = UA_NODECLASS_METHOD;
        nodes_[_parent].methods_.push_back(_id);
        return nodes_[_id];
    }

    /* Adds an existing node as child of another one */
    void add_reference(const node_id& _parent, const node_id& _child) {
        nodes_[_parent].children_.push_back(_child);
    }

    memory_node& get(const node_id& _id) {
        return nodes_.at(_id);
    }

    node_id objects_node() override {
        return node_id::numeric(0, UA_NS0ID_OBJECTSFOLDER);
    }

    bool exists(const node_id& _node_id) override {
        return nodes_.find(_node_id) != nodes_.end();
    }

    UA_NodeClass read_node_class(const node_id& _node_id) override {
        const memory_node& node = find(_node_id, "Reading node class");
        if (!node.readable_)
            throw ua_status_error(UA_STATUSCODE_BADNOTREADABLE, "Reading node class");
        return node.node_class_;
    }

    std::string read_browse_name(const node_id& _node_id) override {
        return find(_node_id, "Reading browse name").browse_name_;
    }

    std::string read_data_type_name(const node_id& _node_id) override {
        const memory_node& node = find(_node_id, "Reading data type");
        if (node.data_type_.empty())
            throw ua_status_error(UA_STATUSCODE_BADATTRIBUTEIDINVALID, "Reading data type");
        return node.data_type_;
    }

    UA_Byte read_access_level(const node_id& _node_id) override {
        const memory_node& node = find(_node_id, "Reading access level");
        if (!node.access_level_readable_)
            throw ua_status_error(UA_STATUSCODE_BADATTRIBUTEIDINVALID, "Reading access level");
        return node.access_level_;
    }

    std::string read_value(const node_id& _node_id) override {
        const memory_node& node = find(_node_id, "Reading value");
        if (!node.value_readable_)
            throw ua_status_error(UA_STATUSCODE_BADUSERACCESSDENIED, "Reading value");
        return node.value_;
    }

    std::vector<node_id> browse_methods(const node_id& _node_id) override {
        const memory_node& node = find(_node_id, "Browsing methods");
        if (!node.browsable_)
            throw ua_status_error(UA_STATUSCODE_BADSERVICEUNSUPPORTED, "Browsing methods");
        return node.methods_;
    }

    std::vector<node_id> browse_children(const node_id& _node_id) override {
        return find(_node_id, "Browsing children").children_;
    }
};

#endif // MEMORY_ADDRESS_SPACE_HPP
