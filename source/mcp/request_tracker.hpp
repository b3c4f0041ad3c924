#ifndef MCPGATE_REQUEST_TRACKER_HPP
#define MCPGATE_REQUEST_TRACKER_HPP

// Ids of tools/list requests forwarded upstream whose responses have not
// been seen yet. Written by the client->upstream loop, consumed by the
// upstream->client loop; every operation takes the same mutex and never
// holds it across I/O.

#include "protocol/json_rpc.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace request_tracker {

using json = json_rpc::json;

class RequestTracker {
public:
    // Remember id. Null, object and array ids are ignored. Returns true if
    // the id is now tracked.
    bool track(const json &request_id);

    // Test-and-remove: true if id was pending. Each tracked id is consumed
    // at most once.
    bool consume(const json &request_id);

    bool is_tracked(const json &request_id) const;

    size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    // Ids compare by JSON value equality (7 == 7.0, "7" != 7); the set stays
    // small, so a linear scan is enough.
    std::vector<json> pending_ids_;
};

} // namespace request_tracker

#endif // MCPGATE_REQUEST_TRACKER_HPP
