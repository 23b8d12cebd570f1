/**
 * @file download_chain.h
 * @brief Contract of the unit of work that transfers one block
 */

#ifndef KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_CHAIN_H
#define KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_CHAIN_H

#include <cstddef>
#include <functional>
#include <memory>

namespace kcenon::segment_transfer {

class breakpoint_info;
class download_cache;
class download_task;

/**
 * @brief Transfers the remaining bytes of one block
 *
 * run() executes on a pool worker and reports failures into the attempt's
 * download_cache instead of returning them. cancel() may be called from
 * any thread at any time and must not block.
 */
class download_chain {
public:
    virtual ~download_chain() = default;

    virtual void run() = 0;
    virtual void cancel() = 0;

    [[nodiscard]] virtual auto block_index() const -> std::size_t = 0;
};

/**
 * @brief Creates the chain for one block of an attempt
 */
using chain_factory = std::function<std::shared_ptr<download_chain>(
    std::size_t block_index,
    const download_task& task,
    std::shared_ptr<breakpoint_info> info,
    std::shared_ptr<download_cache> cache)>;

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_CALL_DOWNLOAD_CHAIN_H
