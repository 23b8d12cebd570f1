/**
 * @file test_segmented_download.cpp
 * @brief End-to-end tests of segmented downloads over an in-memory origin
 *
 * Blocks copy real bytes from an in-memory origin into an in-memory disk,
 * so these tests cover splitting, concurrent writes, commit and resume
 * together.
 */

#include <gtest/gtest.h>

#include "unit/call/call_fixtures.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::segment_transfer::test {

namespace {

constexpr int64_t piece_size = 64;

auto make_payload(std::size_t size, int seed) -> std::vector<std::byte> {
    std::vector<std::byte> payload(size);
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<std::byte>((i * 31 + static_cast<std::size_t>(seed)) % 251);
    }
    return payload;
}

template <typename Predicate>
auto wait_until(Predicate pred,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}  // namespace

// ============================================================================
// Origin and disk
// ============================================================================

/**
 * @brief Remote resources addressed by URL
 */
class memory_origin {
public:
    struct resource {
        std::vector<std::byte> payload;
        std::string etag;
    };

    void publish(const std::string& url, std::vector<std::byte> payload, std::string etag) {
        std::lock_guard lock(mutex_);
        resources_[url] = resource{std::move(payload), std::move(etag)};
    }

    auto find(const std::string& url) const -> std::shared_ptr<const resource> {
        std::lock_guard lock(mutex_);
        auto it = resources_.find(url);
        if (it == resources_.end()) {
            return nullptr;
        }
        return std::make_shared<const resource>(it->second);
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, resource> resources_;
};

/**
 * @brief Partial and committed files keyed by task id
 */
class memory_disk : public process_file_strategy {
public:
    struct stored_file {
        std::mutex mutex;
        std::vector<std::byte> bytes;
    };

    class disk_sink : public output_sink {
    public:
        explicit disk_sink(std::shared_ptr<stored_file> file) : file_(std::move(file)) {}

        auto write(std::size_t, int64_t offset, std::span<const std::byte> data)
            -> result<void> override {
            if (closed_) {
                return unexpected(error(error_code::file_write_error, "sink closed"));
            }
            std::lock_guard lock(file_->mutex);
            auto end = static_cast<std::size_t>(offset) + data.size();
            if (file_->bytes.size() < end) {
                file_->bytes.resize(end);
            }
            std::copy(data.begin(), data.end(), file_->bytes.begin() + offset);
            return {};
        }

        void cancel() override { closed_ = true; }

    private:
        std::shared_ptr<stored_file> file_;
        std::atomic<bool> closed_{false};
    };

    auto create_output_sink(const download_task& task, breakpoint_info&)
        -> std::shared_ptr<output_sink> override {
        std::lock_guard lock(mutex_);
        auto& file = partial_[task.id()];
        if (!file) {
            file = std::make_shared<stored_file>();
        }
        return std::make_shared<disk_sink>(file);
    }

    auto complete_process_stream(const std::shared_ptr<output_sink>&, const download_task& task)
        -> result<void> override {
        std::lock_guard lock(mutex_);
        auto it = partial_.find(task.id());
        if (it == partial_.end()) {
            return unexpected(error(error_code::commit_failed, "no partial file"));
        }
        {
            std::lock_guard file_lock(it->second->mutex);
            committed_[task.id()] = it->second->bytes;
        }
        partial_.erase(it);
        return {};
    }

    auto discard_process(const download_task& task) -> result<void> override {
        std::lock_guard lock(mutex_);
        partial_.erase(task.id());
        return {};
    }

    auto has_partial(int32_t task_id) const -> bool {
        std::lock_guard lock(mutex_);
        return partial_.count(task_id) != 0;
    }

    auto committed(int32_t task_id) const -> std::vector<std::byte> {
        std::lock_guard lock(mutex_);
        auto it = committed_.find(task_id);
        return it == committed_.end() ? std::vector<std::byte>{} : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<int32_t, std::shared_ptr<stored_file>> partial_;
    std::map<int32_t, std::vector<std::byte>> committed_;
};

// ============================================================================
// Checks and chains
// ============================================================================

/**
 * @brief Compares the stored breakpoint with the origin's current resource
 */
class origin_remote_check : public remote_check {
public:
    origin_remote_check(const memory_origin& origin,
                        const download_task& task,
                        std::shared_ptr<breakpoint_info> info)
        : origin_(origin), task_(task), info_(std::move(info)) {}

    auto check() -> result<void> override {
        resource_ = origin_.find(task_.url());
        if (!resource_) {
            return unexpected(error(error_code::connection_failed, "404 " + task_.url()));
        }

        auto length = static_cast<int64_t>(resource_->payload.size());
        if (info_->block_count() == 0) {
            cause_ = resume_failed_cause::info_dirty;
        } else if (info_->etag() != resource_->etag) {
            cause_ = resume_failed_cause::response_etag_changed;
        } else if (info_->total_length() != length) {
            cause_ = resume_failed_cause::content_length_changed;
        }
        info_->set_etag(resource_->etag);
        return {};
    }

    auto is_resumable() const -> bool override { return !cause_.has_value(); }

    auto instance_length() const -> int64_t override {
        return static_cast<int64_t>(resource_->payload.size());
    }

    auto is_accept_range() const -> bool override { return true; }

    auto cause() const -> result<resume_failed_cause> override {
        if (!cause_) {
            return unexpected(error(error_code::not_applicable));
        }
        return *cause_;
    }

private:
    const memory_origin& origin_;
    const download_task& task_;
    std::shared_ptr<breakpoint_info> info_;
    std::shared_ptr<const memory_origin::resource> resource_;
    std::optional<resume_failed_cause> cause_;
};

class disk_local_check : public local_check {
public:
    disk_local_check(const memory_disk& disk,
                     const download_task& task,
                     std::shared_ptr<breakpoint_info> info)
        : disk_(disk), task_(task), info_(std::move(info)) {}

    void check() override {
        if (!disk_.has_partial(task_.id())) {
            cause_ = resume_failed_cause::file_not_exist;
            return;
        }
        for (const auto& block : info_->blocks()) {
            if (block.is_dirty()) {
                cause_ = resume_failed_cause::info_dirty;
                return;
            }
        }
    }

    auto is_dirty() const -> bool override { return cause_.has_value(); }

    auto cause() const -> result<resume_failed_cause> override {
        if (!cause_) {
            return unexpected(error(error_code::not_applicable));
        }
        return *cause_;
    }

private:
    const memory_disk& disk_;
    const download_task& task_;
    std::shared_ptr<breakpoint_info> info_;
    std::optional<resume_failed_cause> cause_;
};

/**
 * @brief Copies one block from the origin in fixed-size pieces
 *
 * With pause_at_half set, the chain stops halfway through its block and
 * waits to be canceled.
 */
class copy_chain : public download_chain {
public:
    copy_chain(std::size_t block_index,
               const download_task& task,
               std::shared_ptr<const memory_origin::resource> resource,
               std::shared_ptr<breakpoint_info> info,
               std::shared_ptr<download_cache> cache,
               callback_dispatcher& dispatcher,
               bool pause_at_half,
               std::atomic<int>& paused)
        : block_index_(block_index)
        , task_(task)
        , resource_(std::move(resource))
        , info_(std::move(info))
        , cache_(std::move(cache))
        , dispatcher_(dispatcher)
        , pause_at_half_(pause_at_half)
        , paused_(paused) {}

    void run() override {
        auto& listener = dispatcher_.dispatch();
        auto& block = info_->block(block_index_);
        listener.fetch_start(task_, block_index_, block.content_length - block.current_offset);

        while (!block.is_complete()) {
            if (is_canceled()) {
                return;
            }

            auto from = block.range_left();
            auto size = std::min(piece_size, block.content_length - block.current_offset);
            std::span<const std::byte> piece(resource_->payload.data() + from,
                                             static_cast<std::size_t>(size));
            if (auto written = cache_->sink()->write(block_index_, from, piece); !written) {
                cache_->catch_error(written.error());
                return;
            }
            block.current_offset += size;
            listener.fetch_progress(task_, block_index_, size);

            if (pause_at_half_ && !block.is_complete() &&
                block.current_offset >= block.content_length / 2) {
                ++paused_;
                std::unique_lock lock(mutex_);
                cv_.wait_for(lock, std::chrono::seconds(5), [this] { return canceled_; });
                return;
            }
        }

        listener.fetch_end(task_, block_index_, block.content_length);
    }

    void cancel() override {
        {
            std::lock_guard lock(mutex_);
            canceled_ = true;
        }
        cv_.notify_all();
    }

    auto block_index() const -> std::size_t override { return block_index_; }

private:
    auto is_canceled() -> bool {
        std::lock_guard lock(mutex_);
        return canceled_;
    }

    std::size_t block_index_;
    const download_task& task_;
    std::shared_ptr<const memory_origin::resource> resource_;
    std::shared_ptr<breakpoint_info> info_;
    std::shared_ptr<download_cache> cache_;
    callback_dispatcher& dispatcher_;
    bool pause_at_half_;
    std::atomic<int>& paused_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool canceled_ = false;
};

// ============================================================================
// Fixture
// ============================================================================

class SegmentedDownloadTest : public ::testing::Test {
protected:
    SegmentedDownloadTest()
        : env_{store_, disk_, strategy_, dispatcher_, pool_, nullptr,
               [this](const download_task& task, std::shared_ptr<breakpoint_info> info,
                      std::shared_ptr<download_cache>) {
                   return std::make_unique<origin_remote_check>(origin_, task, std::move(info));
               },
               [this](const download_task& task, std::shared_ptr<breakpoint_info> info,
                      int64_t) {
                   return std::make_unique<disk_local_check>(disk_, task, std::move(info));
               },
               [this](std::size_t block_index, const download_task& task,
                      std::shared_ptr<breakpoint_info> info,
                      std::shared_ptr<download_cache> cache) {
                   return std::make_shared<copy_chain>(
                       block_index, task, origin_.find(task.url()), std::move(info),
                       std::move(cache), dispatcher_, pause_at_half_.load(), paused_);
               }} {}

    void SetUp() override {
        get_logger().set_level(log_level::fatal);
    }

    void TearDown() override {
        get_logger().set_level(log_level::info);
    }

    auto make_task(int32_t id, std::shared_ptr<download_listener> listener, int connections)
        -> std::shared_ptr<const download_task> {
        return download_task::builder(id, url_of(id))
            .with_filename("file" + std::to_string(id) + ".bin")
            .with_connection_count(connections)
            .with_listener(std::move(listener))
            .build()
            .value();
    }

    static auto url_of(int32_t id) -> std::string {
        return "https://origin.example.com/file" + std::to_string(id) + ".bin";
    }

    memory_origin origin_;
    memory_disk disk_;
    memory_breakpoint_store store_;
    download_strategy strategy_;
    callback_dispatcher dispatcher_;
    adapters::elastic_transfer_pool pool_;

    std::atomic<bool> pause_at_half_{false};
    std::atomic<int> paused_{0};

    download_environment env_;
};

// ============================================================================
// Tests
// ============================================================================

TEST_F(SegmentedDownloadTest, DownloadsEveryByteAcrossBlocks) {
    auto payload = make_payload(10007, 1);
    origin_.publish(url_of(1), payload, "\"v1\"");
    auto listener = std::make_shared<recording_listener>();
    auto call = download_call::create(make_task(1, listener, 4), env_);

    ASSERT_TRUE(call->execute().has_value());

    ASSERT_EQ(listener->end_causes.size(), 1u);
    EXPECT_EQ(listener->end_causes.front(), end_cause::completed);
    EXPECT_EQ(listener->from_beginning_count.load(), 1);
    EXPECT_EQ(listener->beginning_causes.front(), resume_failed_cause::info_dirty);
    EXPECT_EQ(listener->fetch_start_count.load(), 4);
    EXPECT_EQ(listener->fetch_end_count.load(), 4);
    EXPECT_EQ(listener->progress_bytes.load(), 10007);
    EXPECT_EQ(disk_.committed(1), payload);
    EXPECT_EQ(store_.get(1), nullptr);
    EXPECT_EQ(call->state(), call_state::done);
}

TEST_F(SegmentedDownloadTest, ConcurrentCallsShareOnePool) {
    constexpr int32_t task_count = 6;
    std::vector<std::vector<std::byte>> payloads;
    std::vector<std::shared_ptr<recording_listener>> listeners;
    std::vector<std::shared_ptr<download_call>> calls;

    for (int32_t id = 0; id < task_count; ++id) {
        payloads.push_back(make_payload(3000 + static_cast<std::size_t>(id) * 517, id));
        origin_.publish(url_of(id), payloads.back(), "\"v1\"");
        listeners.push_back(std::make_shared<recording_listener>());
        calls.push_back(download_call::create(make_task(id, listeners.back(), 1 + id % 4), env_));
    }

    std::vector<std::thread> threads;
    for (auto& call : calls) {
        threads.emplace_back([call] { call->run(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int32_t id = 0; id < task_count; ++id) {
        ASSERT_EQ(listeners[id]->end_causes.size(), 1u) << "task " << id;
        EXPECT_EQ(listeners[id]->end_causes.front(), end_cause::completed) << "task " << id;
        EXPECT_EQ(disk_.committed(id), payloads[id]) << "task " << id;
    }
}

TEST_F(SegmentedDownloadTest, ResumesAfterCancel) {
    auto payload = make_payload(4096, 7);
    origin_.publish(url_of(7), payload, "\"v1\"");

    pause_at_half_ = true;
    auto first_listener = std::make_shared<recording_listener>();
    auto first = download_call::create(make_task(7, first_listener, 4), env_);
    std::thread runner([first] { first->run(); });

    ASSERT_TRUE(wait_until([this] { return paused_.load() == 4; }));
    EXPECT_TRUE(first->cancel());
    runner.join();

    EXPECT_EQ(first_listener->task_end_count.load(), 0);
    auto info = store_.get(7);
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->total_offset(), 2048);

    pause_at_half_ = false;
    auto second_listener = std::make_shared<recording_listener>();
    auto second = download_call::create(make_task(7, second_listener, 4), env_);

    ASSERT_TRUE(second->execute().has_value());

    EXPECT_EQ(second_listener->from_breakpoint_count.load(), 1);
    EXPECT_EQ(second_listener->from_beginning_count.load(), 0);
    EXPECT_EQ(second_listener->progress_bytes.load(), 2048);
    ASSERT_EQ(second_listener->end_causes.size(), 1u);
    EXPECT_EQ(second_listener->end_causes.front(), end_cause::completed);
    EXPECT_EQ(disk_.committed(7), payload);
}

TEST_F(SegmentedDownloadTest, ChangedEtagRestartsFromBeginning) {
    origin_.publish(url_of(9), make_payload(2048, 9), "\"v1\"");

    pause_at_half_ = true;
    auto first = download_call::create(
        make_task(9, std::make_shared<recording_listener>(), 2), env_);
    std::thread runner([first] { first->run(); });
    ASSERT_TRUE(wait_until([this] { return paused_.load() == 2; }));
    first->cancel();
    runner.join();

    auto replaced = make_payload(2048, 99);
    origin_.publish(url_of(9), replaced, "\"v2\"");
    pause_at_half_ = false;
    auto listener = std::make_shared<recording_listener>();
    auto second = download_call::create(make_task(9, listener, 2), env_);

    ASSERT_TRUE(second->execute().has_value());

    ASSERT_EQ(listener->beginning_causes.size(), 1u);
    EXPECT_EQ(listener->beginning_causes.front(), resume_failed_cause::response_etag_changed);
    EXPECT_EQ(listener->progress_bytes.load(), 2048);
    EXPECT_EQ(disk_.committed(9), replaced);
}

TEST_F(SegmentedDownloadTest, MissingResourceEndsWithError) {
    auto listener = std::make_shared<recording_listener>();
    auto call = download_call::create(make_task(11, listener, 2), env_);

    ASSERT_TRUE(call->execute().has_value());

    ASSERT_EQ(listener->end_causes.size(), 1u);
    EXPECT_EQ(listener->end_causes.front(), end_cause::error);
    ASSERT_TRUE(listener->last_real_cause.has_value());
    EXPECT_EQ(listener->last_real_cause->code, error_code::connection_failed);
    EXPECT_TRUE(disk_.committed(11).empty());
}

}  // namespace kcenon::segment_transfer::test
