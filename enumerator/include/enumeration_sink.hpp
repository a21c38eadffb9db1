/**
 * @file enumeration_sink.hpp
 * @brief Receiver of the events produced while walking an address space.
 */
#ifndef ENUMERATION_SINK_HPP
#define ENUMERATION_SINK_HPP

#include <string>
#include "node_record.hpp"

/**
 * @brief Receives the walk in visiting order.
 *
 * Nodes arrive depth first. A node at depth d+1 belongs to the last node at depth d.
 */
class enumeration_sink {
public:
    virtual ~enumeration_sink() = default;

    /**
     * @brief Starts a new section of output, e.g. one per browsing mode.
     *
     * @param _title the section title.
     */
    virtual void on_section(const std::string& _title) = 0;

    /**
     * @brief Called for every node whose attributes could be read.
     *
     * @param _record the node record.
     */
    virtual void on_node(const node_record& _record) = 0;

    /**
     * @brief Called after on_node for variables whose value could be read.
     *
     * @param _depth the depth of the variable.
     * @param _value the formatted value.
     */
    virtual void on_value(depth_t _depth, const std::string& _value) = 0;

    /**
     * @brief Called after on_node for variables whose value could not be read.
     *
     * @param _depth the depth of the variable.
     * @param _error the error message.
     */
    virtual void on_value_error(depth_t _depth, const std::string& _error) = 0;

    /**
     * @brief Called instead of on_node when the attributes of a node could not be read.
     *
     * @param _depth the depth of the node.
     * @param _error the error message.
     */
    virtual void on_node_error(depth_t _depth, const std::string& _error) = 0;

    /**
     * @brief Called after on_node when the references of that node could not be browsed.
     *
     * @param _depth the depth of the node.
     * @param _error the error message.
     */
    virtual void on_browse_error(depth_t _depth, const std::string& _error) = 0;

    /**
     * @brief Called once the walk is complete.
     *
     */
    virtual void on_finished() = 0;
};

#endif // ENUMERATION_SINK_HPP
