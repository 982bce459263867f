#pragma once

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace execq {

struct EnqueueResult {
    bool accepted{false};
    size_t position{0};
    std::string message;
};

struct BackendStats {
    size_t depth{0};
    size_t in_flight{0};
    uint64_t processed{0};
    uint64_t rejected{0};
};

// Queue Manager contract shared by the in-process and spool backends.
class IJobBackend {
public:
    virtual ~IJobBackend() = default;

    virtual EnqueueResult submit(Job job) = 0;
    // Jobs waiting for a worker.
    virtual size_t position() const = 0;
    virtual void start(int workers) = 0;
    // Stops intake, lets in-flight runs finish, joins workers.
    virtual void shutdown() = 0;
    virtual std::string name() const = 0;
    virtual BackendStats stats() const = 0;
    // True while this backend still owes the Run an execution attempt.
    virtual bool holds(RunId run_id) const = 0;
};

} // namespace execq
