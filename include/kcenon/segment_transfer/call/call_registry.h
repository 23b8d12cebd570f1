/**
 * @file call_registry.h
 * @brief Notifications from a call to the scheduler that owns it
 */

#ifndef KCENON_SEGMENT_TRANSFER_CALL_CALL_REGISTRY_H
#define KCENON_SEGMENT_TRANSFER_CALL_CALL_REGISTRY_H

namespace kcenon::segment_transfer {

class download_call;

/**
 * @brief Tracks in-flight calls on behalf of the outer scheduler
 */
class call_registry {
public:
    virtual ~call_registry() = default;

    /**
     * @brief A running call was canceled and will not report task_end
     */
    virtual void flying_canceled(download_call& call) = 0;

    /**
     * @brief The call's worker thread is about to return
     */
    virtual void finish(download_call& call) = 0;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CALL_CALL_REGISTRY_H
