#include "../include/remote_address_space.hpp"
#include "response_checker.hpp"
#include "variant_formatter.hpp"
#include <stdexcept>

remote_address_space::remote_address_space(UA_Client* _client, UA_UInt32 _max_references_per_node)
    : client_(_client), node_browser_(_max_references_per_node) {
    if (_client == nullptr)
        throw std::invalid_argument("client must not be null");
}

remote_address_space::~remote_address_space() {
}

node_id remote_address_space::objects_node() {
    return node_id::numeric(0, UA_NS0ID_OBJECTSFOLDER);
}

bool remote_address_space::exists(const node_id& _node_id) {
    std::string browse_name;
    return reader_.read_browse_name(client_, _node_id.get(), browse_name) == UA_STATUSCODE_GOOD;
}

UA_NodeClass remote_address_space::read_node_class(const node_id& _node_id) {
    UA_NodeClass node_class = UA_NODECLASS_UNSPECIFIED;
    response_checker::check_status(reader_.read_node_class(client_, _node_id.get(), node_class), "Reading node class");
    return node_class;
}

std::string remote_address_space::read_browse_name(const node_id& _node_id) {
    std::string browse_name;
    response_checker::check_status(reader_.read_browse_name(client_, _node_id.get(), browse_name), "Reading browse name");
    return browse_name;
}

std::string remote_address_space::read_data_type_name(const node_id& _node_id) {
    node_id data_type_id;
    response_checker::check_status(reader_.read_data_type(client_, _node_id.get(), data_type_id), "Reading data type");
    std::string data_type_name;
    response_checker::check_status(reader_.read_display_name(client_, data_type_id.get(), data_type_name), "Reading data type name of " + data_type_id.to_string());
    return data_type_name;
}

UA_Byte remote_address_space::read_access_level(const node_id& _node_id) {
    UA_Byte access_level = 0;
    response_checker::check_status(reader_.read_access_level(client_, _node_id.get(), access_level), "Reading access level");
    return access_level;
}

std::string remote_address_space::read_value(const node_id& _node_id) {
    response_checker::check_status(reader_.read_information_node(client_, _node_id.get()), "Reading value");
    return variant_formatter::to_string(*reader_.get_variant());
}

std::vector<node_id> remote_address_space::browse_methods(const node_id& _node_id) {
    std::vector<node_id> methods;
    response_checker::check_status(node_browser_.browse_methods(client_, _node_id.get(), methods), "Browsing methods");
    return methods;
}

std::vector<node_id> remote_address_space::browse_children(const node_id& _node_id) {
    std::vector<node_id> children;
    response_checker::check_status(node_browser_.browse_children(client_, _node_id.get(), children), "Browsing children");
    return children;
}
