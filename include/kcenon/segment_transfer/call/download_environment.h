/**
 * @file download_environment.h
 * @brief Collaborators shared by every download_call of a process
 */

#ifndef KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_ENVIRONMENT_H
#define KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_ENVIRONMENT_H

#include <kcenon/segment_transfer/call/download_chain.h>

#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::segment_transfer {

namespace adapters {
class transfer_thread_pool_interface;
}

class breakpoint_info;
class breakpoint_store;
class call_registry;
class callback_dispatcher;
class download_cache;
class download_strategy;
class download_task;
class local_check;
class process_file_strategy;
class remote_check;

/**
 * @brief Creates the remote check for one attempt
 */
using remote_check_factory = std::function<std::unique_ptr<remote_check>(
    const download_task& task,
    std::shared_ptr<breakpoint_info> info,
    std::shared_ptr<download_cache> cache)>;

/**
 * @brief Creates the local check for one attempt
 */
using local_check_factory = std::function<std::unique_ptr<local_check>(
    const download_task& task,
    std::shared_ptr<breakpoint_info> info,
    int64_t instance_length)>;

/**
 * @brief Bundle of the services a download_call depends on
 *
 * Every referenced object is owned by the caller and must outlive all
 * calls created with this environment.
 *
 * @code
 * download_environment env{store, files, strategy, dispatcher, pool,
 *                          &registry, make_remote, make_local, make_chain};
 * auto call = download_call::create(task, env);
 * @endcode
 */
struct download_environment {
    breakpoint_store& store;
    process_file_strategy& file_strategy;
    download_strategy& strategy;
    callback_dispatcher& dispatcher;
    adapters::transfer_thread_pool_interface& pool;
    call_registry* registry = nullptr;  ///< Optional
    remote_check_factory make_remote_check;
    local_check_factory make_local_check;
    chain_factory make_chain;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_ENVIRONMENT_H
