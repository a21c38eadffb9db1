#include <open62541/plugin/log_stdout.h>
#include <jsoncpp/json/json.h>
#include <iostream>
#include <sstream>
// uncomment to disable assert()
// #define NDEBUG
#include <cassert>
#include "json_tree_writer.hpp"
#include "address_space_enumerator.hpp"
#include "memory_address_space.hpp"

// Use (void) to silence unused warnings.
#define assertm(exp, msg) assert((void(msg), exp))

static node_record make_record(depth_t _depth, const std::string& _name, UA_NodeClass _node_class) {
    node_record record;
    record.depth_ = _depth;
    record.node_id_ = "ns=1;s=" + _name;
    record.browse_name_ = _name;
    record.node_class_ = _node_class;
    if (_node_class == UA_NODECLASS_VARIABLE) {
        record.data_type_ = "Int32";
        record.access_ = "Read-only";
    }
    return record;
}

static Json::Value parse_document(const std::string& _text) {
    Json::Value document;
    Json::Reader reader;
    bool parsed = reader.parse(_text, document);
    assertm(parsed, "writer produces valid JSON");
    return document;
}

static void test_nesting() {
    std::ostringstream out;
    json_tree_writer writer(out, "opc.tcp://10.0.0.1:4840");
    writer.on_section("Enumerating Objects (depth 2):");
    writer.on_node(make_record(0, "Pump", UA_NODECLASS_OBJECT));
    writer.on_node(make_record(1, "Speed", UA_NODECLASS_VARIABLE));
    writer.on_value(1, "7");
    writer.on_node(make_record(1, "Motor", UA_NODECLASS_OBJECT));
    writer.on_node(make_record(2, "Current", UA_NODECLASS_VARIABLE));
    writer.on_value_error(2, "Reading value: BadUserAccessDenied");
    writer.on_node(make_record(0, "Valve", UA_NODECLASS_OBJECT));
    writer.on_finished();

    Json::Value document = parse_document(out.str());
    assertm(document["endpoint"].asString() == "opc.tcp://10.0.0.1:4840", "endpoint recorded");
    assertm(document["sections"].size() == 1, "one section");
    const Json::Value& section = document["sections"][0];
    assertm(section["title"].asString() == "Enumerating Objects (depth 2):", "section title");
    assertm(section["nodes"].size() == 2, "two top level nodes");

    const Json::Value& pump = section["nodes"][0];
    assertm(pump["browseName"].asString() == "Pump", "first top level node");
    assertm(pump["nodeClass"].asString() == "Object", "node class name");
    assertm(!pump.isMember("dataType"), "objects carry no data type");
    assertm(pump["children"].size() == 2, "pump has two children");

    const Json::Value& speed = pump["children"][0];
    assertm(speed["nodeId"].asString() == "ns=1;s=Speed", "node id");
    assertm(speed["dataType"].asString() == "Int32", "data type");
    assertm(speed["access"].asString() == "Read-only", "access");
    assertm(speed["value"].asString() == "7", "value attached to its variable");

    const Json::Value& current = pump["children"][1]["children"][0];
    assertm(current["browseName"].asString() == "Current", "grand child nested below its parent");
    assertm(current["valueError"].asString() == "Reading value: BadUserAccessDenied", "value error attached");
    assertm(!current.isMember("value"), "no value when reading failed");

    assertm(section["nodes"][1]["browseName"].asString() == "Valve", "second top level node");
    assertm(section["nodes"][1]["children"].empty(), "leaf has empty children");
}

static void test_errors() {
    std::ostringstream out;
    json_tree_writer writer(out, "opc.tcp://10.0.0.1:4840");
    writer.on_section("Browsing all from root...");
    writer.on_node(make_record(0, "Objects", UA_NODECLASS_OBJECT));
    writer.on_node(make_record(1, "Pump", UA_NODECLASS_OBJECT));
    writer.on_node_error(1, "Reading node class: BadNotReadable");
    writer.on_node(make_record(1, "Valve", UA_NODECLASS_OBJECT));
    writer.on_browse_error(1, "Browsing methods: BadServiceUnsupported");
    writer.on_finished();

    Json::Value document = parse_document(out.str());
    const Json::Value& children = document["sections"][0]["nodes"][0]["children"];
    assertm(children.size() == 3, "failed node kept as its own entry");
    assertm(!children[0].isMember("error"), "error of the next sibling is not attached to a childless node");
    assertm(children[1]["error"].asString() == "Reading node class: BadNotReadable", "node known only by its error");
    assertm(!children[1].isMember("browseName"), "unreadable node has no attributes");
    assertm(children[2]["error"].asString() == "Browsing methods: BadServiceUnsupported", "browse error attached to its node");
    assertm(children[2]["browseName"].asString() == "Valve", "browse error node keeps its attributes");
}

static void test_sections_from_enumerator() {
    memory_address_space space;
    node_id pump = node_id::string(1, "Pump");
    space.add_object(space.objects_node(), pump, "Pump");
    space.add_variable(pump, node_id::string(1, "Pump.Speed"), "Speed", "Double", "12.5", UA_ACCESSLEVELMASK_READ | UA_ACCESSLEVELMASK_WRITE);

    std::ostringstream out;
    json_tree_writer writer(out, "opc.tcp://plc:4840");
    address_space_enumerator enumerator(space, writer, UA_Log_Stdout);
    enumerator.enumerate_objects(0);
    assertm(enumerator.browse_specific_object("Pump"), "object found");
    writer.on_finished();

    Json::Value document = parse_document(out.str());
    assertm(document["sections"].size() == 2, "one section per walk");
    assertm(document["sections"][0]["nodes"][0]["children"].empty(), "depth 0 stops at the objects");
    const Json::Value& shown = document["sections"][1];
    assertm(shown["title"].asString() == "Browsing object: Pump | NodeId: ns=1;s=Pump", "show-object title");
    const Json::Value& speed = shown["nodes"][0]["children"][0];
    assertm(speed["access"].asString() == "Writable", "access label");
    assertm(speed["value"].asString() == "12.5", "value");
}

int main(int argc, char* argv[]) {
    test_nesting();
    test_errors();
    test_sections_from_enumerator();
    std::cout << "json_tree_writer_testframe passed" << std::endl;
    return 0;
}
