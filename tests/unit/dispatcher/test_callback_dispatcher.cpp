/**
 * @file test_callback_dispatcher.cpp
 * @brief Unit tests for callback_dispatcher
 */

#include <gtest/gtest.h>

#include "unit/call/call_fixtures.h"

#include <thread>

namespace kcenon::segment_transfer::test {

class CallbackDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        listener_ = std::make_shared<recording_listener>();
        task_ = download_task::builder(5, "https://example.com/f")
            .with_listener(listener_)
            .build()
            .value();
        bare_task_ = download_task::builder(6, "https://example.com/g").build().value();
    }

    callback_dispatcher dispatcher_;
    std::shared_ptr<recording_listener> listener_;
    std::shared_ptr<const download_task> task_;
    std::shared_ptr<const download_task> bare_task_;
    breakpoint_info info_{5, "https://example.com/f", "f"};
};

TEST_F(CallbackDispatcherTest, EveryEventIsForwardedOnce) {
    header_fields request{{"Range", {"bytes=0-"}}};
    header_fields response{{"ETag", {"\"v1\""}}};
    auto& out = dispatcher_.dispatch();

    out.task_start(*task_);
    out.connect_trial_start(*task_, request);
    out.connect_trial_end(*task_, 206, response);
    out.download_from_beginning(*task_, info_, resume_failed_cause::info_dirty);
    out.download_from_breakpoint(*task_, info_);
    out.connect_start(*task_, 1, request);
    out.connect_end(*task_, 1, 206, response);
    out.fetch_start(*task_, 1, 100);
    out.fetch_progress(*task_, 1, 40);
    out.fetch_end(*task_, 1, 100);
    out.task_end(*task_, end_cause::completed, std::nullopt);

    EXPECT_EQ(listener_->task_start_count.load(), 1);
    EXPECT_EQ(listener_->connect_trial_start_count.load(), 1);
    EXPECT_EQ(listener_->connect_trial_end_count.load(), 1);
    EXPECT_EQ(listener_->from_beginning_count.load(), 1);
    EXPECT_EQ(listener_->from_breakpoint_count.load(), 1);
    EXPECT_EQ(listener_->connect_start_count.load(), 1);
    EXPECT_EQ(listener_->connect_end_count.load(), 1);
    EXPECT_EQ(listener_->fetch_start_count.load(), 1);
    EXPECT_EQ(listener_->fetch_progress_count.load(), 1);
    EXPECT_EQ(listener_->fetch_end_count.load(), 1);
    EXPECT_EQ(listener_->task_end_count.load(), 1);
}

TEST_F(CallbackDispatcherTest, ArgumentsArePassedThrough) {
    header_fields response{{"ETag", {"\"v1\""}}};
    auto& out = dispatcher_.dispatch();

    out.connect_end(*task_, 3, 416, response);
    EXPECT_EQ(listener_->last_block, 3u);
    EXPECT_EQ(listener_->last_code, 416);
    EXPECT_EQ(listener_->last_fields, &response);

    out.fetch_progress(*task_, 2, 1000);
    EXPECT_EQ(listener_->last_block, 2u);
    EXPECT_EQ(listener_->progress_bytes.load(), 1000);

    out.download_from_beginning(*task_, info_, resume_failed_cause::content_length_changed);
    EXPECT_EQ(listener_->last_info, &info_);
    EXPECT_EQ(listener_->beginning_causes.back(), resume_failed_cause::content_length_changed);

    out.task_end(*task_, end_cause::error, error(error_code::server_canceled));
    EXPECT_EQ(listener_->end_causes.back(), end_cause::error);
    EXPECT_EQ(listener_->last_real_cause->code, error_code::server_canceled);
}

TEST_F(CallbackDispatcherTest, ListenerCanAmendRequestHeaders) {
    class header_writer : public recording_listener {
    public:
        void connect_start(const download_task&, std::size_t, header_fields& fields) override {
            fields["User-Agent"].push_back("segment_transfer");
        }
    };
    auto writer = std::make_shared<header_writer>();
    auto task = download_task::builder(8, "https://example.com/h")
        .with_listener(writer)
        .build()
        .value();
    header_fields request;

    dispatcher_.dispatch().connect_start(*task, 0, request);

    ASSERT_EQ(request.count("User-Agent"), 1u);
    EXPECT_EQ(request["User-Agent"].front(), "segment_transfer");
}

TEST_F(CallbackDispatcherTest, TaskWithoutListenerIsNoOp) {
    header_fields fields;
    auto& out = dispatcher_.dispatch();

    EXPECT_NO_THROW({
        out.task_start(*bare_task_);
        out.connect_trial_start(*bare_task_, fields);
        out.connect_trial_end(*bare_task_, 200, fields);
        out.download_from_beginning(*bare_task_, info_, resume_failed_cause::info_dirty);
        out.download_from_breakpoint(*bare_task_, info_);
        out.connect_start(*bare_task_, 0, fields);
        out.connect_end(*bare_task_, 0, 200, fields);
        out.fetch_start(*bare_task_, 0, 10);
        out.fetch_progress(*bare_task_, 0, 10);
        out.fetch_end(*bare_task_, 0, 10);
        out.task_end(*bare_task_, end_cause::completed, std::nullopt);
    });
    EXPECT_EQ(listener_->task_start_count.load(), 0);
}

TEST_F(CallbackDispatcherTest, EventsRunOnTheCallingThread) {
    class thread_recorder : public recording_listener {
    public:
        void task_start(const download_task&) override {
            caller = std::this_thread::get_id();
        }
        std::thread::id caller;
    };
    auto recorder = std::make_shared<thread_recorder>();
    auto task = download_task::builder(9, "https://example.com/t")
        .with_listener(recorder)
        .build()
        .value();

    std::thread::id worker_id;
    std::thread worker([&] {
        worker_id = std::this_thread::get_id();
        dispatcher_.dispatch().task_start(*task);
    });
    worker.join();

    EXPECT_EQ(recorder->caller, worker_id);
}

}  // namespace kcenon::segment_transfer::test
