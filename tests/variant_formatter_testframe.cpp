#include <iostream>
#include <set>
#include <utility>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include "variant_formatter.hpp"
#include "node_id.hpp"
#include "filtered_logger.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

static void test_values() {
    UA_Variant variant;
    UA_Variant_init(&variant);
    assertm(variant_formatter::to_string(variant) == "None", "empty variant");

    UA_Int32 scalar = 42;
    UA_Variant_setScalarCopy(&variant, &scalar, &UA_TYPES[UA_TYPES_INT32]);
    assertm(variant_formatter::to_string(variant) == "42", "scalar");
    UA_Variant_clear(&variant);

    UA_Int32 array[3] = {1, -2, 3};
    UA_Variant_setArrayCopy(&variant, array, 3, &UA_TYPES[UA_TYPES_INT32]);
    assertm(variant_formatter::to_string(variant) == "[1, -2, 3]", "array");
    UA_Variant_clear(&variant);

    UA_Variant_setArray(&variant, UA_EMPTY_ARRAY_SENTINEL, 0, &UA_TYPES[UA_TYPES_INT32]);
    assertm(variant_formatter::to_string(variant) == "[]", "empty array");
}

static void test_labels() {
    assertm(std::string(variant_formatter::access_level_label(UA_ACCESSLEVELMASK_READ)) == "Read-only", "read only");
    assertm(std::string(variant_formatter::access_level_label(UA_ACCESSLEVELMASK_READ | UA_ACCESSLEVELMASK_WRITE)) == "Writable", "read write");
    assertm(std::string(variant_formatter::access_level_label(UA_ACCESSLEVELMASK_WRITE)) == "Writable", "write only");
    assertm(std::string(variant_formatter::access_level_label(UA_ACCESSLEVELMASK_HISTORYREAD)) == "Read-only", "history bits do not count");

    assertm(std::string(node_class_to_string(UA_NODECLASS_OBJECT)) == "Object", "object");
    assertm(std::string(node_class_to_string(UA_NODECLASS_VARIABLE)) == "Variable", "variable");
    assertm(std::string(node_class_to_string(UA_NODECLASS_METHOD)) == "Method", "method");
    assertm(std::string(node_class_to_string(UA_NODECLASS_OBJECTTYPE)) == "ObjectType", "object type");
    assertm(std::string(node_class_to_string(UA_NODECLASS_UNSPECIFIED)) == "Unspecified", "unspecified");

    UA_LogLevel level = UA_LOGLEVEL_INFO;
    assertm(filtered_logger::parse_level("debug", level) && level == UA_LOGLEVEL_DEBUG, "level name");
    assertm(!filtered_logger::parse_level("verbose", level) && level == UA_LOGLEVEL_DEBUG, "unknown level name");
}

static void test_node_ids() {
    node_id objects;
    assertm(objects.is_null(), "default node id is null");
    assertm(node_id::parse("i=85", objects), "numeric node id in namespace 0");
    assertm(objects == node_id::numeric(0, UA_NS0ID_OBJECTSFOLDER), "parsed numeric node id");
    assertm(objects.to_string() == "i=85", "namespace 0 printed without prefix");

    node_id pump;
    assertm(node_id::parse("ns=2;s=Pump", pump), "string node id");
    assertm(pump == node_id::string(2, "Pump"), "parsed string node id");
    assertm(pump.to_string() == "ns=2;s=Pump", "string node id printed");

    node_id untouched = node_id::numeric(1, 7);
    assertm(!node_id::parse("Pump", untouched), "browse name is not a node id");
    assertm(!node_id::parse("", untouched), "empty text is not a node id");
    assertm(untouched == node_id::numeric(1, 7), "failed parse leaves the node id untouched");

    node_id copy = pump;
    node_id moved = std::move(copy);
    assertm(moved == pump, "moved node id keeps its value");
    assertm(copy.is_null(), "moved from node id is null");
    copy = objects;
    assertm(copy == objects && copy != pump, "copy assignment");

    std::set<node_id> ids = {pump, objects, node_id::string(2, "Pump")};
    assertm(ids.size() == 2, "node ids are ordered by value");
}

int main(int argc, char* argv[]) {
    test_values();
    test_labels();
    test_node_ids();
    std::cout << "variant_formatter_testframe passed" << std::endl;
    return 0;
}
