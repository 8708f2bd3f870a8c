//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// search/bulk_transport.hpp
//
// Bulk-index submission seam between the loader and the search client
//===----------------------------------------------------------------------===//

#pragma once

#include <json/json.h>
#include <string>
#include <vector>

namespace duckes {

struct BulkItemFailure {
    size_t item_index = 0;  // position in the submitted document list
    int status = 0;
    std::string type;
    std::string reason;
};

struct BulkResponse {
    // Request-level HTTP status; item failures are only meaningful when it is 200
    int status = 200;
    std::string error; // response body when status is not 200
    std::vector<BulkItemFailure> failures;

    bool Ok() const { return status == 200 && failures.empty(); }
};

// 429 and 5xx are worth retrying, every other 4xx is the caller's fault
inline bool IsTransientStatus(int status) {
    return status == 429 || status >= 500;
}

class BulkTransport {
public:
    virtual ~BulkTransport() = default;

    // Index documents into index in one request. Throws HttpTransportError
    // when the request never got a response.
    virtual BulkResponse Bulk(const std::string& index, const std::vector<Json::Value>& documents) = 0;
};

} // namespace duckes
