#include "../include/json_tree_writer.hpp"
#include "variant_formatter.hpp"
#include <memory>

#define ENDPOINT_KEY "endpoint"
#define SECTIONS_KEY "sections"
#define TITLE_KEY "title"
#define NODES_KEY "nodes"
#define NODE_ID_KEY "nodeId"
#define BROWSE_NAME_KEY "browseName"
#define NODE_CLASS_KEY "nodeClass"
#define DATA_TYPE_KEY "dataType"
#define ACCESS_KEY "access"
#define VALUE_KEY "value"
#define VALUE_ERROR_KEY "valueError"
#define ERROR_KEY "error"
#define CHILDREN_KEY "children"

json_tree_writer::json_tree_writer(std::ostream& _out, const std::string& _endpoint_url)
    : out_(_out), root_(Json::objectValue), section_(Json::objectValue), has_section_(false) {
    root_[ENDPOINT_KEY] = _endpoint_url;
    root_[SECTIONS_KEY] = Json::Value(Json::arrayValue);
}

json_tree_writer::~json_tree_writer() {
}

void json_tree_writer::close_nodes(depth_t _depth) {
    while (!open_nodes_.empty() && open_nodes_.back().depth_ >= _depth) {
        Json::Value closed = open_nodes_.back().value_;
        open_nodes_.pop_back();
        if (open_nodes_.empty())
            section_[NODES_KEY].append(closed);
        else
            open_nodes_.back().value_[CHILDREN_KEY].append(closed);
    }
}

void json_tree_writer::close_section() {
    close_nodes(0);
    if (has_section_)
        root_[SECTIONS_KEY].append(section_);
    section_ = Json::Value(Json::objectValue);
    has_section_ = false;
}

Json::Value& json_tree_writer::current_node() {
    return open_nodes_.back().value_;
}

void json_tree_writer::on_section(const std::string& _title) {
    close_section();
    section_[TITLE_KEY] = _title;
    section_[NODES_KEY] = Json::Value(Json::arrayValue);
    has_section_ = true;
}

void json_tree_writer::on_node(const node_record& _record) {
    if (!has_section_)
        on_section("");
    close_nodes(_record.depth_);

    Json::Value node(Json::objectValue);
    node[NODE_ID_KEY] = _record.node_id_;
    node[BROWSE_NAME_KEY] = _record.browse_name_;
    node[NODE_CLASS_KEY] = node_class_to_string(_record.node_class_);
    if (_record.is_variable()) {
        node[DATA_TYPE_KEY] = _record.data_type_;
        node[ACCESS_KEY] = _record.access_;
    }
    node[CHILDREN_KEY] = Json::Value(Json::arrayValue);
    open_nodes_.push_back(open_node{_record.depth_, node});
}

void json_tree_writer::on_value(depth_t _depth, const std::string& _value) {
    if (open_nodes_.empty() || open_nodes_.back().depth_ != _depth)
        return;
    current_node()[VALUE_KEY] = _value;
}

void json_tree_writer::on_value_error(depth_t _depth, const std::string& _error) {
    if (open_nodes_.empty() || open_nodes_.back().depth_ != _depth)
        return;
    current_node()[VALUE_ERROR_KEY] = _error;
}

void json_tree_writer::on_node_error(depth_t _depth, const std::string& _error) {
    if (!has_section_)
        on_section("");
    close_nodes(_depth);
    /* the node is only known by its error */
    Json::Value node(Json::objectValue);
    node[ERROR_KEY] = _error;
    open_nodes_.push_back(open_node{_depth, node});
}

void json_tree_writer::on_browse_error(depth_t _depth, const std::string& _error) {
    if (open_nodes_.empty() || open_nodes_.back().depth_ != _depth)
        return;
    current_node()[ERROR_KEY] = _error;
}

void json_tree_writer::on_finished() {
    close_section();
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root_, &out_);
    out_ << std::endl;
}
