/**
 * @file callback_dispatcher.h
 * @brief Routes lifecycle events to the listener of each task
 */

#ifndef KCENON_SEGMENT_TRANSFER_DISPATCHER_CALLBACK_DISPATCHER_H
#define KCENON_SEGMENT_TRANSFER_DISPATCHER_CALLBACK_DISPATCHER_H

#include <kcenon/segment_transfer/dispatcher/download_listener.h>

#include <memory>

namespace kcenon::segment_transfer {

/**
 * @brief Single entry point for lifecycle events
 *
 * dispatch() returns a listener that forwards every event to
 * task.listener(), synchronously and on the calling thread. Tasks without
 * a listener are skipped silently.
 *
 * @code
 * dispatcher.dispatch().task_start(task);
 * @endcode
 */
class callback_dispatcher {
public:
    callback_dispatcher();
    ~callback_dispatcher();

    callback_dispatcher(const callback_dispatcher&) = delete;
    auto operator=(const callback_dispatcher&) -> callback_dispatcher& = delete;

    [[nodiscard]] auto dispatch() -> download_listener&;

private:
    class forwarding_listener;
    std::unique_ptr<forwarding_listener> transmit_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_DISPATCHER_CALLBACK_DISPATCHER_H
