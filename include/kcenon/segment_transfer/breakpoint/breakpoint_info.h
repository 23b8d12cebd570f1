/**
 * @file breakpoint_info.h
 * @brief Resumption state of a segmented transfer
 * @version 0.1.0
 *
 * A breakpoint_info records, per task, how the transfer was split into
 * blocks and how far each block got. It is what makes a transfer
 * resumable across attempts and process restarts.
 */

#ifndef KCENON_SEGMENT_TRANSFER_BREAKPOINT_BREAKPOINT_INFO_H
#define KCENON_SEGMENT_TRANSFER_BREAKPOINT_BREAKPOINT_INFO_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::segment_transfer {

/**
 * @brief One contiguous segment of the transfer
 */
struct block_info {
    int64_t start_offset = 0;    ///< Absolute offset of the first byte
    int64_t content_length = 0;  ///< Number of bytes this block covers
    int64_t current_offset = 0;  ///< Bytes already transferred within the block

    block_info() = default;
    block_info(int64_t start, int64_t length, int64_t current = 0)
        : start_offset(start), content_length(length), current_offset(current) {}

    /**
     * @brief Absolute offset of the next byte to transfer
     */
    [[nodiscard]] auto range_left() const noexcept -> int64_t {
        return start_offset + current_offset;
    }

    /**
     * @brief Absolute offset of the last byte of the block
     */
    [[nodiscard]] auto range_right() const noexcept -> int64_t {
        return start_offset + content_length - 1;
    }

    /**
     * @brief Length is unknown until the transfer ends (chunked response)
     */
    [[nodiscard]] auto is_chunked() const noexcept -> bool { return content_length < 0; }

    /**
     * @brief Every byte of the block has been transferred
     */
    [[nodiscard]] auto is_complete() const noexcept -> bool {
        return !is_chunked() && current_offset == content_length;
    }

    /**
     * @brief Progress is outside [0, content_length]
     */
    [[nodiscard]] auto is_dirty() const noexcept -> bool {
        if (current_offset < 0) return true;
        return !is_chunked() && current_offset > content_length;
    }

    /**
     * @brief Forget progress, the block restarts from its start offset
     */
    void reset() noexcept { current_offset = 0; }

    [[nodiscard]] auto operator==(const block_info& other) const -> bool = default;
};

/**
 * @brief Reset a block whose progress cannot be trusted
 * @return true if the block was dirty and has been reset
 */
auto reset_block_if_dirty(block_info& block) -> bool;

/**
 * @brief Resumption record of one task
 */
class breakpoint_info {
public:
    breakpoint_info() = default;
    breakpoint_info(int32_t task_id, std::string url, std::string filename);

    [[nodiscard]] auto task_id() const noexcept -> int32_t { return task_id_; }
    [[nodiscard]] auto url() const -> const std::string& { return url_; }
    [[nodiscard]] auto filename() const -> const std::string& { return filename_; }

    [[nodiscard]] auto block_count() const noexcept -> std::size_t { return blocks_.size(); }
    [[nodiscard]] auto block(std::size_t index) -> block_info& { return blocks_.at(index); }
    [[nodiscard]] auto block(std::size_t index) const -> const block_info& {
        return blocks_.at(index);
    }
    [[nodiscard]] auto blocks() const -> const std::vector<block_info>& { return blocks_; }

    void add_block(const block_info& block) { blocks_.push_back(block); }
    void reset_blocks() { blocks_.clear(); }

    /**
     * @brief Expected length of the whole transfer
     *
     * Sum of block content lengths; -1 for a chunked transfer whose
     * length is unknown.
     */
    [[nodiscard]] auto total_length() const -> int64_t;

    /**
     * @brief Bytes already transferred across all blocks
     */
    [[nodiscard]] auto total_offset() const -> int64_t;

    /**
     * @brief Remote length is unknown (no Content-Length)
     */
    [[nodiscard]] auto is_chunked() const noexcept -> bool { return chunked_; }
    void set_chunked(bool chunked) noexcept { chunked_ = chunked; }

    [[nodiscard]] auto etag() const -> const std::string& { return etag_; }
    void set_etag(std::string etag) { etag_ = std::move(etag); }

private:
    int32_t task_id_ = 0;
    std::string url_;
    std::string filename_;
    std::string etag_;
    bool chunked_ = false;
    std::vector<block_info> blocks_;
};

}  // namespace kcenon::segment_transfer

#endif  // KCENON_SEGMENT_TRANSFER_BREAKPOINT_BREAKPOINT_INFO_H
