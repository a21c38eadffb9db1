#include "../include/node_browser.hpp"
#include "../include/response_checker.hpp"

node_browser::node_browser(UA_UInt32 _max_references_per_node) : max_references_per_node_(_max_references_per_node) {
}

node_browser::~node_browser() {
}

void
node_browser::collect_targets(const UA_BrowseResult& _browse_result, std::vector<node_id>& _targets) {
    for (size_t i = 0; i < _browse_result.referencesSize; i++) {
        const UA_ReferenceDescription* ref = &_browse_result.references[i];
        if (ref->nodeId.serverIndex != 0)
            continue;
        _targets.push_back(node_id(ref->nodeId.nodeId));
    }
}

void
node_browser::release_continuation_point(UA_Client* _client, UA_ByteString* _continuation_point) {
    if (_continuation_point->length == 0)
        return;
    UA_BrowseNextRequest release_request;
    UA_BrowseNextRequest_init(&release_request);
    release_request.releaseContinuationPoints = true;
    release_request.continuationPoints = _continuation_point;
    release_request.continuationPointsSize = 1;
    UA_BrowseNextResponse release_response = UA_Client_Service_browseNext(_client, release_request);
    UA_BrowseNextResponse_clear(&release_response);
}

UA_StatusCode
node_browser::browse(UA_Client* _client, UA_BrowseDescription _browse_description, std::vector<node_id>& _targets) {
    UA_BrowseRequest request;
    UA_BrowseRequest_init(&request);
    request.requestedMaxReferencesPerNode = max_references_per_node_;
    request.nodesToBrowse = &_browse_description;
    request.nodesToBrowseSize = 1;

    UA_BrowseResponse response = UA_Client_Service_browse(_client, request);
    UA_StatusCode status = response_checker::get_browse_status(response);
    if (status != UA_STATUSCODE_GOOD) {
        UA_BrowseResponse_clear(&response);
        return status;
    }
    collect_targets(response.results[0], _targets);

    UA_ByteString continuation_point;
    UA_ByteString_init(&continuation_point);
    status = UA_ByteString_copy(&response.results[0].continuationPoint, &continuation_point);
    if (status != UA_STATUSCODE_GOOD)
        release_continuation_point(_client, &response.results[0].continuationPoint);
    UA_BrowseResponse_clear(&response);

    /* Fetch the remaining references of the node */
    while (status == UA_STATUSCODE_GOOD && continuation_point.length > 0) {
        UA_BrowseNextRequest next_request;
        UA_BrowseNextRequest_init(&next_request);
        next_request.releaseContinuationPoints = false;
        next_request.continuationPoints = &continuation_point;
        next_request.continuationPointsSize = 1;

        UA_BrowseNextResponse next_response = UA_Client_Service_browseNext(_client, next_request);
        UA_ByteString_clear(&continuation_point);
        status = response_checker::get_browse_next_status(next_response);
        if (status == UA_STATUSCODE_GOOD) {
            collect_targets(next_response.results[0], _targets);
            status = UA_ByteString_copy(&next_response.results[0].continuationPoint, &continuation_point);
            if (status != UA_STATUSCODE_GOOD)
                release_continuation_point(_client, &next_response.results[0].continuationPoint);
        }
        UA_BrowseNextResponse_clear(&next_response);
    }
    UA_ByteString_clear(&continuation_point);
    return status;
}

UA_StatusCode
node_browser::browse_methods(UA_Client* _client, const UA_NodeId& _node_id, std::vector<node_id>& _methods) {
    UA_BrowseDescription bd;
    UA_BrowseDescription_init(&bd);
    bd.nodeId = _node_id;
    bd.referenceTypeId = UA_NODEID_NUMERIC(0, UA_NS0ID_HASCOMPONENT);
    bd.browseDirection = UA_BROWSEDIRECTION_FORWARD;
    bd.includeSubtypes = true;
    bd.nodeClassMask = UA_NODECLASS_METHOD;
    bd.resultMask = UA_BROWSERESULTMASK_NONE;
    return browse(_client, bd, _methods);
}

UA_StatusCode
node_browser::browse_children(UA_Client* _client, const UA_NodeId& _node_id, std::vector<node_id>& _children) {
    UA_BrowseDescription bd;
    UA_BrowseDescription_init(&bd);
    bd.nodeId = _node_id;
    bd.referenceTypeId = UA_NODEID_NUMERIC(0, UA_NS0ID_HIERARCHICALREFERENCES);
    bd.browseDirection = UA_BROWSEDIRECTION_FORWARD;
    bd.includeSubtypes = true;
    bd.nodeClassMask = 0;
    bd.resultMask = UA_BROWSERESULTMASK_NONE;
    return browse(_client, bd, _children);
}
