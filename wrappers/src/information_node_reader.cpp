#include "../include/information_node_reader.hpp"

information_node_reader::information_node_reader() {
    UA_Variant_init(&variant_);
}

information_node_reader::~information_node_reader() {
    UA_Variant_clear(&variant_);
}

UA_StatusCode information_node_reader::read_information_node(UA_Client* _client, const UA_NodeId& _node_id) {
    UA_Variant_clear(&variant_);
    UA_Variant_init(&variant_);
    return UA_Client_readValueAttribute(_client, _node_id, &variant_);
}

UA_Variant* information_node_reader::get_variant() {
    return &variant_;
}

UA_StatusCode information_node_reader::read_node_class(UA_Client* _client, const UA_NodeId& _node_id, UA_NodeClass& _node_class) {
    return UA_Client_readNodeClassAttribute(_client, _node_id, &_node_class);
}

UA_StatusCode information_node_reader::read_browse_name(UA_Client* _client, const UA_NodeId& _node_id, std::string& _browse_name) {
    UA_QualifiedName browse_name;
    UA_QualifiedName_init(&browse_name);
    UA_StatusCode status = UA_Client_readBrowseNameAttribute(_client, _node_id, &browse_name);
    if (status == UA_STATUSCODE_GOOD)
        _browse_name.assign((char*) browse_name.name.data, browse_name.name.length);
    UA_QualifiedName_clear(&browse_name);
    return status;
}

UA_StatusCode information_node_reader::read_display_name(UA_Client* _client, const UA_NodeId& _node_id, std::string& _display_name) {
    UA_LocalizedText display_name;
    UA_LocalizedText_init(&display_name);
    UA_StatusCode status = UA_Client_readDisplayNameAttribute(_client, _node_id, &display_name);
    if (status == UA_STATUSCODE_GOOD)
        _display_name.assign((char*) display_name.text.data, display_name.text.length);
    UA_LocalizedText_clear(&display_name);
    return status;
}

UA_StatusCode information_node_reader::read_data_type(UA_Client* _client, const UA_NodeId& _node_id, node_id& _data_type_id) {
    UA_NodeId data_type;
    UA_NodeId_init(&data_type);
    UA_StatusCode status = UA_Client_readDataTypeAttribute(_client, _node_id, &data_type);
    if (status == UA_STATUSCODE_GOOD)
        _data_type_id = node_id(data_type);
    UA_NodeId_clear(&data_type);
    return status;
}

UA_StatusCode information_node_reader::read_access_level(UA_Client* _client, const UA_NodeId& _node_id, UA_Byte& _access_level) {
    return UA_Client_readAccessLevelAttribute(_client, _node_id, &_access_level);
}
