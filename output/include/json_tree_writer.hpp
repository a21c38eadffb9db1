/**
 * @file json_tree_writer.hpp
 * @brief Collects the walk into a nested JSON document.
 *
 * @details
 * The document is written once the walk is finished:
 * {"endpoint": ..., "sections": [{"title": ..., "nodes": [{"nodeId", "browseName", "nodeClass",
 * "dataType", "access", "value" | "valueError", "error", "children": [...]}]}]}
 */
#ifndef JSON_TREE_WRITER_HPP
#define JSON_TREE_WRITER_HPP

#include <jsoncpp/json/json.h>
#include <ostream>
#include <string>
#include <vector>
#include "enumeration_sink.hpp"

class json_tree_writer : public enumeration_sink {
private:
    /**
     * @brief A node that may still receive children.
     */
    struct open_node {
        depth_t depth_; /**< depth of the node */
        Json::Value value_; /**< the node object */
    };

    std::ostream& out_; /**< the output stream */
    Json::Value root_; /**< the document */
    Json::Value section_; /**< the current section */
    bool has_section_; /**< whether section_ holds a started section */
    std::vector<open_node> open_nodes_; /**< the ancestors of the next node, innermost last */

    /**
     * @brief Closes all open nodes at or below the given depth, attaching them to their parents.
     *
     * @param _depth the depth.
     */
    void close_nodes(depth_t _depth);

    /**
     * @brief Closes all nodes and appends the current section to the document.
     *
     */
    void close_section();

    Json::Value& current_node();
public:
    /**
     * @brief Constructs a new json tree writer object.
     *
     * @param _out the stream the document is written to.
     * @param _endpoint_url the endpoint url recorded in the document.
     */
    json_tree_writer(std::ostream& _out, const std::string& _endpoint_url);
    ~json_tree_writer();

    void on_section(const std::string& _title) override;
    void on_node(const node_record& _record) override;
    void on_value(depth_t _depth, const std::string& _value) override;
    void on_value_error(depth_t _depth, const std::string& _error) override;
    void on_node_error(depth_t _depth, const std::string& _error) override;
    void on_browse_error(depth_t _depth, const std::string& _error) override;
    void on_finished() override;
};

#endif // JSON_TREE_WRITER_HPP
