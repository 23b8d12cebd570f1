/**
 * @file segment_transfer.h
 * @brief Main header for the segment_transfer library
 * @version 0.1.0
 *
 * Include this header to access the download call orchestrator and every
 * contract it depends on.
 *
 * @code
 * #include <kcenon/segment_transfer/segment_transfer.h>
 *
 * using namespace kcenon::segment_transfer;
 *
 * adapters::elastic_transfer_pool pool;
 * download_environment env{store, files, strategy, dispatcher, pool,
 *                          nullptr, make_remote, make_local, make_chain};
 * auto call = download_call::create(task, env);
 * call->execute();
 * @endcode
 */

#ifndef KCENON_SEGMENT_TRANSFER_SEGMENT_TRANSFER_H
#define KCENON_SEGMENT_TRANSFER_SEGMENT_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/segment_transfer/core/types.h"
#include "kcenon/segment_transfer/core/causes.h"
#include "kcenon/segment_transfer/core/config.h"
#include "kcenon/segment_transfer/core/download_cache.h"
#include "kcenon/segment_transfer/core/download_task.h"

// Resumption state
#include "kcenon/segment_transfer/breakpoint/breakpoint_info.h"
#include "kcenon/segment_transfer/breakpoint/breakpoint_store.h"
#include "kcenon/segment_transfer/check/resume_checks.h"

// Strategies
#include "kcenon/segment_transfer/file/process_file_strategy.h"
#include "kcenon/segment_transfer/strategy/download_strategy.h"

// Call
#include "kcenon/segment_transfer/call/call_registry.h"
#include "kcenon/segment_transfer/call/download_call.h"
#include "kcenon/segment_transfer/call/download_chain.h"
#include "kcenon/segment_transfer/call/download_environment.h"

// Dispatcher
#include "kcenon/segment_transfer/dispatcher/callback_dispatcher.h"
#include "kcenon/segment_transfer/dispatcher/download_listener.h"

// Adapters
#include "kcenon/segment_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::segment_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_SEGMENT_TRANSFER_H
