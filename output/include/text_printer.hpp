#ifndef TEXT_PRINTER_HPP
#define TEXT_PRINTER_HPP

#include <ostream>
#include "enumeration_sink.hpp"

/**
 * @brief Prints the walk as indented text, two spaces per depth level.
 */
class text_printer : public enumeration_sink {
private:
    std::ostream& out_; /**< the output stream */

    std::string indent(depth_t _depth) const;
public:
    explicit text_printer(std::ostream& _out);
    ~text_printer();

    void on_section(const std::string& _title) override;
    void on_node(const node_record& _record) override;
    void on_value(depth_t _depth, const std::string& _value) override;
    void on_value_error(depth_t _depth, const std::string& _error) override;
    void on_node_error(depth_t _depth, const std::string& _error) override;
    void on_browse_error(depth_t _depth, const std::string& _error) override;
    void on_finished() override;
};

#endif // TEXT_PRINTER_HPP
