#pragma once

#include <functional>

namespace stoa {

/**
 * Hands work to the thread that owns all connection state.
 * post() may be called from any thread; tasks run on the loop thread in the
 * order they were posted from any one thread.
 */
class LoopExecutor {
public:
    virtual ~LoopExecutor() = default;
    virtual void post(std::function<void()> task) = 0;
};

} // namespace stoa
