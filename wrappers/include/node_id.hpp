/**
 * @file node_id.hpp
 * @brief Owning value type around UA_NodeId.
 */
#ifndef NODE_ID_HPP
#define NODE_ID_HPP

#include <open62541/types.h>
#include <string>

/**
 * @brief Holds a deep copy of a UA_NodeId and releases it on destruction.
 *
 * String form follows the standard NodeId syntax, e.g. "i=85" or "ns=2;s=Pump".
 */
class node_id {
private:
    UA_NodeId id_; /**< the owned node id */
public:
    /**
     * @brief Constructs a null node id.
     *
     */
    node_id();

    /**
     * @brief Constructs a node id from a deep copy of the given one.
     *
     * @param _id the node id to copy.
     */
    explicit node_id(const UA_NodeId& _id);

    node_id(const node_id& _other);
    node_id(node_id&& _other);
    node_id& operator=(const node_id& _other);
    node_id& operator=(node_id&& _other);

    /**
     * @brief Destroys the node id object and clears the owned identifier.
     *
     */
    ~node_id();

    /**
     * @brief Creates a numeric node id.
     *
     * @param _namespace_index the namespace index.
     * @param _identifier the numeric identifier.
     * @return node_id the node id.
     */
    static node_id numeric(UA_UInt16 _namespace_index, UA_UInt32 _identifier);

    /**
     * @brief Creates a string node id.
     *
     * @param _namespace_index the namespace index.
     * @param _identifier the string identifier.
     * @return node_id the node id.
     */
    static node_id string(UA_UInt16 _namespace_index, const std::string& _identifier);

    /**
     * @brief Parses the standard string syntax of a node id.
     *
     * @param _text the text to parse.
     * @param _node_id where the parsed node id is stored.
     * @return true if the text is a valid node id.
     * @return false if the text could not be parsed, _node_id is left untouched.
     */
    static bool parse(const std::string& _text, node_id& _node_id);

    /**
     * @brief Returns the wrapped UA_NodeId.
     *
     * @return const UA_NodeId& the wrapped identifier.
     */
    const UA_NodeId& get() const;

    bool is_null() const;

    /**
     * @brief Prints the node id in the standard string syntax.
     *
     * @return std::string the printed node id.
     */
    std::string to_string() const;

    bool operator==(const node_id& _other) const;
    bool operator!=(const node_id& _other) const;
    bool operator<(const node_id& _other) const;
};

#endif // NODE_ID_HPP
