/**
 * @file address_space_enumerator.hpp
 * @brief Depth limited recursive walk over an address space.
 */
#ifndef ADDRESS_SPACE_ENUMERATOR_HPP
#define ADDRESS_SPACE_ENUMERATOR_HPP

#include <open62541/plugin/log.h>
#include <atomic>
#include <optional>
#include <set>
#include <string>
#include "address_space.hpp"
#include "enumeration_sink.hpp"
#include "types.hpp"

using namespace opcua_enum;

class address_space_enumerator {
private:
    address_space& address_space_; /**< the address space to walk */
    enumeration_sink& sink_; /**< receives the visited nodes */
    const UA_Logger* logger_; /**< logger for diagnostics outside of the walk output */
    std::atomic<bool> running_; /**< cleared by stop() */
    std::set<node_id> path_; /**< the ancestors of the node currently visited */

    /**
     * @brief Reads the attributes printed for a node.
     *
     * Data type and access level failures are reported inside the record.
     *
     * @param _node_id the node id.
     * @param _depth the depth of the node.
     * @return node_record the record.
     */
    node_record read_record(const node_id& _node_id, depth_t _depth);

    /**
     * @brief Visits a node, then its methods and its children.
     *
     * Errors reading or browsing the node are passed to the sink and end the visit of this node only.
     *
     * @param _node_id the node id.
     * @param _depth the depth of the node.
     * @param _max_depth nodes deeper than this are skipped, no limit if empty.
     */
    void browse_node(const node_id& _node_id, depth_t _depth, const std::optional<depth_t>& _max_depth);
public:
    /**
     * @brief Constructs a new address space enumerator object.
     *
     * @param _address_space the address space to walk.
     * @param _sink the sink receiving the walk.
     * @param _logger the logger for diagnostics.
     */
    address_space_enumerator(address_space& _address_space, enumeration_sink& _sink, const UA_Logger* _logger);
    ~address_space_enumerator();

    /**
     * @brief Walks everything below and including the Objects folder without depth limit.
     *
     */
    void browse_all();

    /**
     * @brief Walks each child of the Objects folder down to the given depth.
     *
     * @param _max_depth the depth limit, 0 visits only the children themselves.
     */
    void enumerate_objects(depth_t _max_depth);

    /**
     * @brief Walks a single object without depth limit.
     *
     * The target is looked up as node id first, then by browse name among the children of the Objects folder.
     *
     * @param _node_id_or_name the node id or browse name.
     * @return true if the object was found and walked.
     * @return false if the object was not found or could not be resolved.
     */
    bool browse_specific_object(const std::string& _node_id_or_name);

    /**
     * @brief Stops the walk before the next node is visited. Safe to call from a signal handler.
     *
     */
    void stop();

    bool is_running() const;
};

#endif // ADDRESS_SPACE_ENUMERATOR_HPP
