#include "../include/variant_formatter.hpp"
#include <open62541/util.h>
#include <stdint.h>

#define NONE_TEXT "None"
#define WRITABLE_TEXT "Writable"
#define READ_ONLY_TEXT "Read-only"

variant_formatter::variant_formatter() {
}

variant_formatter::~variant_formatter() {
}

std::string variant_formatter::print_value(const void* _data, const UA_DataType* _type) {
    UA_String output = UA_STRING_NULL;
    UA_StatusCode status = UA_print(_data, _type, &output);
    if (status != UA_STATUSCODE_GOOD) {
        UA_String_clear(&output);
        return std::string("<") + _type->typeName + ">";
    }
    std::string printed((char*) output.data, output.length);
    UA_String_clear(&output);
    return printed;
}

std::string variant_formatter::to_string(const UA_Variant& _variant) {
    if (UA_Variant_isEmpty(&_variant))
        return NONE_TEXT;
    if (UA_Variant_isScalar(&_variant))
        return print_value(_variant.data, _variant.type);

    std::string text = "[";
    uintptr_t element = (uintptr_t) _variant.data;
    for (size_t i = 0; i < _variant.arrayLength; i++) {
        if (i > 0)
            text += ", ";
        text += print_value((const void*) element, _variant.type);
        element += _variant.type->memSize;
    }
    text += "]";
    return text;
}

const char* variant_formatter::access_level_label(UA_Byte _access_level) {
    return (_access_level & UA_ACCESSLEVELMASK_WRITE) ? WRITABLE_TEXT : READ_ONLY_TEXT;
}
