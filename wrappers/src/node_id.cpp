#include "../include/node_id.hpp"
#include <open62541/util.h>
#include <new>

node_id::node_id() {
    UA_NodeId_init(&id_);
}

node_id::node_id(const UA_NodeId& _id) {
    UA_NodeId_init(&id_);
    if (UA_NodeId_copy(&_id, &id_) != UA_STATUSCODE_GOOD)
        throw std::bad_alloc();
}

node_id::node_id(const node_id& _other) : node_id(_other.id_) {
}

node_id::node_id(node_id&& _other) : id_(_other.id_) {
    UA_NodeId_init(&_other.id_);
}

node_id& node_id::operator=(const node_id& _other) {
    if (this == &_other)
        return *this;
    UA_NodeId copy;
    UA_NodeId_init(&copy);
    if (UA_NodeId_copy(&_other.id_, &copy) != UA_STATUSCODE_GOOD)
        throw std::bad_alloc();
    UA_NodeId_clear(&id_);
    id_ = copy;
    return *this;
}

node_id& node_id::operator=(node_id&& _other) {
    if (this == &_other)
        return *this;
    UA_NodeId_clear(&id_);
    id_ = _other.id_;
    UA_NodeId_init(&_other.id_);
    return *this;
}

node_id::~node_id() {
    UA_NodeId_clear(&id_);
}

node_id node_id::numeric(UA_UInt16 _namespace_index, UA_UInt32 _identifier) {
    return node_id(UA_NODEID_NUMERIC(_namespace_index, _identifier));
}

node_id node_id::string(UA_UInt16 _namespace_index, const std::string& _identifier) {
    UA_NodeId id;
    UA_NodeId_init(&id);
    id.namespaceIndex = _namespace_index;
    id.identifierType = UA_NODEIDTYPE_STRING;
    id.identifier.string.length = _identifier.size();
    id.identifier.string.data = (UA_Byte*) _identifier.data();
    /* borrowed buffer, deep copied by the constructor */
    return node_id(id);
}

bool node_id::parse(const std::string& _text, node_id& _node_id) {
    if (_text.empty())
        return false;
    UA_String text;
    text.length = _text.size();
    text.data = (UA_Byte*) _text.data();
    UA_NodeId parsed;
    UA_NodeId_init(&parsed);
    if (UA_NodeId_parse(&parsed, text) != UA_STATUSCODE_GOOD) {
        UA_NodeId_clear(&parsed);
        return false;
    }
    UA_NodeId_clear(&_node_id.id_);
    _node_id.id_ = parsed;
    return true;
}

const UA_NodeId& node_id::get() const {
    return id_;
}

bool node_id::is_null() const {
    return UA_NodeId_isNull(&id_);
}

std::string node_id::to_string() const {
    UA_String output = UA_STRING_NULL;
    if (UA_NodeId_print(&id_, &output) != UA_STATUSCODE_GOOD) {
        UA_String_clear(&output);
        return "<unprintable node id>";
    }
    std::string printed((char*) output.data, output.length);
    UA_String_clear(&output);
    return printed;
}

bool node_id::operator==(const node_id& _other) const {
    return UA_NodeId_equal(&id_, &_other.id_);
}

bool node_id::operator!=(const node_id& _other) const {
    return !(*this == _other);
}

bool node_id::operator<(const node_id& _other) const {
    return UA_NodeId_order(&id_, &_other.id_) == UA_ORDER_LESS;
}
