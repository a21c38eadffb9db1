#include "../include/text_printer.hpp"
#include "variant_formatter.hpp"

text_printer::text_printer(std::ostream& _out) : out_(_out) {
}

text_printer::~text_printer() {
}

std::string text_printer::indent(depth_t _depth) const {
    return std::string(2 * _depth, ' ');
}

void text_printer::on_section(const std::string& _title) {
    out_ << _title << "\n";
}

void text_printer::on_node(const node_record& _record) {
    out_ << indent(_record.depth_) << "- " << _record.browse_name_ << " (" << node_class_to_string(_record.node_class_) << ")"
         << " | NodeId: " << _record.node_id_;
    if (_record.is_variable())
        out_ << " | DataType: " << _record.data_type_ << " | Access: " << _record.access_;
    out_ << "\n";
}

void text_printer::on_value(depth_t _depth, const std::string& _value) {
    out_ << indent(_depth) << "  Value: " << _value << "\n";
}

void text_printer::on_value_error(depth_t _depth, const std::string& _error) {
    out_ << indent(_depth) << "  Could not read value: " << _error << "\n";
}

void text_printer::on_node_error(depth_t _depth, const std::string& _error) {
    out_ << indent(_depth) << "Error browsing node: " << _error << "\n";
}

void text_printer::on_browse_error(depth_t _depth, const std::string& _error) {
    on_node_error(_depth, _error);
}

void text_printer::on_finished() {
    out_.flush();
}
