#pragma once

#include <string>

namespace core {

// Cooperative task running on the engine io_context. cancel() only requests a
// stop; the task reports finished() once it has released its resources.
class BackgroundTask {
public:
    virtual ~BackgroundTask() = default;

    virtual std::string name() const = 0;
    virtual void cancel() = 0;
    virtual bool finished() const = 0;
};

}  // namespace core
