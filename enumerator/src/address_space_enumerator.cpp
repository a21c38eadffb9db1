#include "../include/address_space_enumerator.hpp"
#include "variant_formatter.hpp"
#include <algorithm>
#include <vector>

#define UNKNOWN_ACCESS "Unknown"

address_space_enumerator::address_space_enumerator(address_space& _address_space, enumeration_sink& _sink, const UA_Logger* _logger)
    : address_space_(_address_space), sink_(_sink), logger_(_logger), running_(true) {
}

address_space_enumerator::~address_space_enumerator() {
}

node_record
address_space_enumerator::read_record(const node_id& _node_id, depth_t _depth) {
    node_record record;
    record.depth_ = _depth;
    record.node_class_ = address_space_.read_node_class(_node_id);
    record.browse_name_ = address_space_.read_browse_name(_node_id);
    record.node_id_ = _node_id.to_string();
    if (!record.is_variable())
        return record;

    try {
        record.access_ = variant_formatter::access_level_label(address_space_.read_access_level(_node_id));
    } catch (const std::exception&) {
        record.access_ = UNKNOWN_ACCESS;
    }
    try {
        record.data_type_ = address_space_.read_data_type_name(_node_id);
    } catch (const std::exception& e) {
        record.data_type_ = std::string("Unknown type (") + e.what() + ")";
    }
    return record;
}

void
address_space_enumerator::browse_node(const node_id& _node_id, depth_t _depth, const std::optional<depth_t>& _max_depth) {
    if (!running_)
        return;
    if (_max_depth.has_value() && _depth > _max_depth.value())
        return;
    if (path_.find(_node_id) != path_.end()) {
        UA_LOG_DEBUG(logger_, UA_LOGCATEGORY_USERLAND, "%s: %s is its own ancestor, not entering it again", __FUNCTION__, _node_id.to_string().c_str());
        return;
    }

    node_record record;
    try {
        record = read_record(_node_id, _depth);
    } catch (const std::exception& e) {
        sink_.on_node_error(_depth, e.what());
        return;
    }

    std::vector<node_id> methods;
    std::vector<node_id> children;
    try {
        sink_.on_node(record);
        if (record.is_variable()) {
            try {
                std::string value = address_space_.read_value(_node_id);
                sink_.on_value(_depth, value);
            } catch (const std::exception& e) {
                sink_.on_value_error(_depth, e.what());
            }
        }
        methods = address_space_.browse_methods(_node_id);
        children = address_space_.browse_children(_node_id);
    } catch (const std::exception& e) {
        sink_.on_browse_error(_depth, e.what());
        return;
    }

    path_.insert(_node_id);
    for (const node_id& method : methods)
        browse_node(method, _depth + 1, _max_depth);
    for (const node_id& child : children) {
        /* methods are hierarchical components as well */
        if (std::find(methods.begin(), methods.end(), child) != methods.end())
            continue;
        browse_node(child, _depth + 1, _max_depth);
    }
    path_.erase(_node_id);
}

void
address_space_enumerator::browse_all() {
    sink_.on_section("Browsing all from root...");
    browse_node(address_space_.objects_node(), 0, std::nullopt);
}

void
address_space_enumerator::enumerate_objects(depth_t _max_depth) {
    sink_.on_section("Enumerating Objects (depth " + std::to_string(_max_depth) + "):");
    std::vector<node_id> children = address_space_.browse_children(address_space_.objects_node());
    for (const node_id& child : children) {
        try {
            browse_node(child, 0, _max_depth);
        } catch (const std::exception& e) {
            UA_LOG_WARNING(logger_, UA_LOGCATEGORY_USERLAND, "Could not browse child node: %s", e.what());
        }
    }
}

bool
address_space_enumerator::browse_specific_object(const std::string& _node_id_or_name) {
    try {
        node_id target;
        bool found = node_id::parse(_node_id_or_name, target) && address_space_.exists(target);
        if (!found) {
            /* Not a node id of this server, look for an object with that browse name */
            std::vector<node_id> children = address_space_.browse_children(address_space_.objects_node());
            for (const node_id& child : children) {
                if (!address_space_.read_browse_name(child).compare(_node_id_or_name)) {
                    target = child;
                    found = true;
                    break;
                }
            }
        }
        if (!found) {
            UA_LOG_ERROR(logger_, UA_LOGCATEGORY_USERLAND, "Object '%s' not found.", _node_id_or_name.c_str());
            return false;
        }

        sink_.on_section("Browsing object: " + address_space_.read_browse_name(target) + " | NodeId: " + target.to_string());
        browse_node(target, 0, std::nullopt);
        return true;
    } catch (const std::exception& e) {
        UA_LOG_ERROR(logger_, UA_LOGCATEGORY_USERLAND, "Could not browse node '%s': %s", _node_id_or_name.c_str(), e.what());
        return false;
    }
}

void
address_space_enumerator::stop() {
    running_ = false;
}

bool
address_space_enumerator::is_running() const {
    return running_;
}
