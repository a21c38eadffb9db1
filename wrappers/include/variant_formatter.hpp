/**
 * @file variant_formatter.hpp
 * @brief Text rendering of variant values and attribute masks.
 */
#ifndef VARIANT_FORMATTER_HPP
#define VARIANT_FORMATTER_HPP

#include <open62541/types.h>
#include <string>

class variant_formatter {
private:
    /**
     * @brief Prints a single value of the given type.
     *
     * @param _data pointer to the value.
     * @param _type the data type of the value.
     * @return std::string the printed value.
     */
    static std::string
    print_value(const void* _data, const UA_DataType* _type);
public:
    variant_formatter();
    ~variant_formatter();

    /**
     * @brief Formats a variant as text.
     *
     * Empty variants print as "None", scalars through the library type printer
     * and arrays as "[a, b, ...]".
     *
     * @param _variant the variant.
     * @return std::string the formatted value.
     */
    static std::string
    to_string(const UA_Variant& _variant);

    /**
     * @brief Returns "Writable" if the CurrentWrite bit is set in the access level, else "Read-only".
     *
     * @param _access_level the access level mask.
     * @return const char* the label.
     */
    static const char*
    access_level_label(UA_Byte _access_level);
};

/**
 * @brief Returns the name of a node class as printed in enumeration output.
 *
 * @param _node_class the node class
 * @return const char* the node class name
 */
static inline const char* node_class_to_string(UA_NodeClass _node_class) {
    switch (_node_class) {
    case UA_NODECLASS_OBJECT: return "Object";
    case UA_NODECLASS_VARIABLE: return "Variable";
    case UA_NODECLASS_METHOD: return "Method";
    case UA_NODECLASS_OBJECTTYPE: return "ObjectType";
    case UA_NODECLASS_VARIABLETYPE: return "VariableType";
    case UA_NODECLASS_REFERENCETYPE: return "ReferenceType";
    case UA_NODECLASS_DATATYPE: return "DataType";
    case UA_NODECLASS_VIEW: return "View";
    default: return "Unspecified";
    }
}

#endif // VARIANT_FORMATTER_HPP
