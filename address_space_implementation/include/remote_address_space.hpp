#ifndef REMOTE_ADDRESS_SPACE_HPP
#define REMOTE_ADDRESS_SPACE_HPP

#include <open62541/client.h>
#include "address_space.hpp"
#include "node_browser.hpp"
#include "information_node_reader.hpp"

/**
 * @brief Address space of a server reached through a connected client.
 *
 * The client is not owned and must stay connected while the object is used.
 */
class remote_address_space : public address_space {
private:
    UA_Client* client_; /**< the connected client */
    node_browser node_browser_; /**< the browser issuing browse and browse next requests */
    information_node_reader reader_; /**< the reader issuing attribute reads */
public:
    /**
     * @brief Constructs a new remote address space object.
     *
     * @param _client the connected client.
     * @param _max_references_per_node references per browse request, 0 leaves it to the server.
     */
    remote_address_space(UA_Client* _client, UA_UInt32 _max_references_per_node);
    ~remote_address_space();

    node_id objects_node() override;
    bool exists(const node_id& _node_id) override;
    UA_NodeClass read_node_class(const node_id& _node_id) override;
    std::string read_browse_name(const node_id& _node_id) override;
    std::string read_data_type_name(const node_id& _node_id) override;
    UA_Byte read_access_level(const node_id& _node_id) override;
    std::string read_value(const node_id& _node_id) override;
    std::vector<node_id> browse_methods(const node_id& _node_id) override;
    std::vector<node_id> browse_children(const node_id& _node_id) override;
};

#endif // REMOTE_ADDRESS_SPACE_HPP
