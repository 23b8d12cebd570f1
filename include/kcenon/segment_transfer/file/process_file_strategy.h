/**
 * @file process_file_strategy.h
 * @brief Output sink and file lifecycle contracts
 */

#ifndef KCENON_SEGMENT_TRANSFER_FILE_PROCESS_FILE_STRATEGY_H
#define KCENON_SEGMENT_TRANSFER_FILE_PROCESS_FILE_STRATEGY_H

#include <kcenon/segment_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace kcenon::segment_transfer {

class breakpoint_info;
class download_task;

/**
 * @brief Writable destination shared by every block of one attempt
 *
 * Blocks write concurrently, each into its own range.
 */
class output_sink {
public:
    virtual ~output_sink() = default;

    /**
     * @brief Write bytes of one block at an absolute offset
     * @param block_index Index of the writing block
     * @param offset Absolute offset in the output
     * @param data Bytes to write
     * @return Success or file_write_error
     */
    [[nodiscard]] virtual auto write(std::size_t block_index,
                                     int64_t offset,
                                     std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Stop accepting writes and release resources
     */
    virtual void cancel() = 0;
};

/**
 * @brief Creates, commits and discards task output
 */
class process_file_strategy {
public:
    virtual ~process_file_strategy() = default;

    [[nodiscard]] virtual auto create_output_sink(const download_task& task,
                                                  breakpoint_info& info)
        -> std::shared_ptr<output_sink> = 0;

    /**
     * @brief Move a completed output to its final location
     * @return Success or commit_failed
     */
    [[nodiscard]] virtual auto complete_process_stream(
        const std::shared_ptr<output_sink>& sink,
        const download_task& task) -> result<void> = 0;

    /**
     * @brief Delete partially written output before a retry
     * @return Success or discard_failed
     */
    [[nodiscard]] virtual auto discard_process(const download_task& task) -> result<void> = 0;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_FILE_PROCESS_FILE_STRATEGY_H
