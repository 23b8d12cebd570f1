/**
 * @file segmented_download.cpp
 * @brief Segmented download with cancel and resume, using local files
 *
 * This example demonstrates:
 * - Wiring a download_environment with file-backed collaborators
 * - Splitting a transfer into concurrent blocks
 * - Canceling a running call and resuming it from its breakpoint
 * - Progress monitoring through a download_listener
 *
 * The "remote" resource is a local file addressed with a file:// URL so
 * the example runs without a network.
 */

#include <kcenon/segment_transfer/segment_transfer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <span>
#include <sstream>
#include <thread>
#include <vector>

using namespace kcenon::segment_transfer;

namespace {

constexpr std::size_t piece_size = 64 * 1024;
constexpr std::string_view file_scheme = "file://";

auto format_bytes(int64_t bytes) -> std::string {
    constexpr int64_t KB = 1024;
    constexpr int64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto source_path(const download_task& task) -> std::filesystem::path {
    return task.url().substr(file_scheme.size());
}

auto target_path(const download_task& task) -> std::filesystem::path {
    return task.parent_path() / task.filename();
}

auto partial_path(const download_task& task) -> std::filesystem::path {
    auto path = target_path(task);
    path += ".part";
    return path;
}

/**
 * @brief Create a source file for demonstration
 */
void create_source_file(const std::filesystem::path& path, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path.string());
    }

    std::vector<char> buffer(std::min(size, std::size_t{65536}));
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    std::size_t remaining = size;
    while (remaining > 0) {
        auto to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }

    std::cout << "Created source file: " << path << " (" << format_bytes(static_cast<int64_t>(size))
              << ")" << std::endl;
}

// ============================================================================
// Output
// ============================================================================

/**
 * @brief Writes blocks into a shared partial file
 */
class partial_file_sink : public output_sink {
public:
    explicit partial_file_sink(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            std::ofstream create(path, std::ios::binary);
        }
        file_.open(path, std::ios::binary | std::ios::in | std::ios::out);
    }

    auto write(std::size_t, int64_t offset, std::span<const std::byte> data)
        -> result<void> override {
        std::lock_guard lock(mutex_);
        if (!file_.is_open()) {
            return unexpected(error(error_code::file_write_error, "partial file is closed"));
        }
        file_.seekp(offset);
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return unexpected(error(error_code::file_write_error, "write failed"));
        }
        return {};
    }

    void cancel() override {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

private:
    std::mutex mutex_;
    std::fstream file_;
};

class partial_file_strategy : public process_file_strategy {
public:
    auto create_output_sink(const download_task& task, breakpoint_info&)
        -> std::shared_ptr<output_sink> override {
        return std::make_shared<partial_file_sink>(partial_path(task));
    }

    auto complete_process_stream(const std::shared_ptr<output_sink>& sink,
                                 const download_task& task) -> result<void> override {
        if (sink) {
            sink->cancel();
        }
        std::error_code ec;
        std::filesystem::rename(partial_path(task), target_path(task), ec);
        if (ec) {
            return unexpected(error(error_code::commit_failed, ec.message()));
        }
        return {};
    }

    auto discard_process(const download_task& task) -> result<void> override {
        std::error_code ec;
        std::filesystem::remove(partial_path(task), ec);
        if (ec) {
            return unexpected(error(error_code::discard_failed, ec.message()));
        }
        return {};
    }
};

// ============================================================================
// Checks
// ============================================================================

class file_remote_check : public remote_check {
public:
    file_remote_check(const download_task& task, std::shared_ptr<breakpoint_info> info)
        : task_(task), info_(std::move(info)) {}

    auto check() -> result<void> override {
        std::error_code ec;
        auto path = source_path(task_);
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return unexpected(error(error_code::connection_failed, path.string() + ": " +
                                                                   ec.message()));
        }
        length_ = static_cast<int64_t>(size);
        auto etag = std::to_string(
            std::filesystem::last_write_time(path).time_since_epoch().count());

        if (info_->block_count() == 0) {
            cause_ = resume_failed_cause::info_dirty;
        } else if (info_->etag() != etag) {
            cause_ = resume_failed_cause::response_etag_changed;
        } else if (info_->total_length() != length_) {
            cause_ = resume_failed_cause::content_length_changed;
        }
        info_->set_etag(etag);
        return {};
    }

    auto is_resumable() const -> bool override { return !cause_.has_value(); }
    auto instance_length() const -> int64_t override { return length_; }
    auto is_accept_range() const -> bool override { return true; }

    auto cause() const -> result<resume_failed_cause> override {
        if (!cause_) {
            return unexpected(error(error_code::not_applicable));
        }
        return *cause_;
    }

private:
    const download_task& task_;
    std::shared_ptr<breakpoint_info> info_;
    int64_t length_ = -1;
    std::optional<resume_failed_cause> cause_;
};

class file_local_check : public local_check {
public:
    file_local_check(const download_task& task, std::shared_ptr<breakpoint_info> info)
        : task_(task), info_(std::move(info)) {}

    void check() override {
        if (!std::filesystem::exists(partial_path(task_))) {
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
    const download_task& task_;
    std::shared_ptr<breakpoint_info> info_;
    std::optional<resume_failed_cause> cause_;
};

// ============================================================================
// Block chain
// ============================================================================

/**
 * @brief Copies one block of the source file
 */
class file_copy_chain : public download_chain {
public:
    file_copy_chain(std::size_t block_index,
                    const download_task& task,
                    std::shared_ptr<breakpoint_info> info,
                    std::shared_ptr<download_cache> cache,
                    callback_dispatcher& dispatcher,
                    std::chrono::microseconds piece_delay)
        : block_index_(block_index)
        , task_(task)
        , info_(std::move(info))
        , cache_(std::move(cache))
        , dispatcher_(dispatcher)
        , piece_delay_(piece_delay) {}

    void run() override {
        auto& listener = dispatcher_.dispatch();
        auto& block = info_->block(block_index_);

        std::ifstream source(source_path(task_), std::ios::binary);
        if (!source) {
            cache_->catch_error(error(error_code::connection_failed, "cannot open source"));
            return;
        }

        listener.fetch_start(task_, block_index_, block.content_length - block.current_offset);
        std::vector<char> buffer(piece_size);
        while (!block.is_complete() && !canceled_) {
            auto from = block.range_left();
            auto size = std::min<int64_t>(static_cast<int64_t>(piece_size),
                                          block.content_length - block.current_offset);
            source.seekg(from);
            source.read(buffer.data(), size);
            if (source.gcount() != size) {
                cache_->catch_error(error(error_code::connection_failed, "short read"));
                return;
            }

            auto bytes = std::as_bytes(std::span(buffer.data(), static_cast<std::size_t>(size)));
            if (auto written = cache_->sink()->write(block_index_, from, bytes); !written) {
                cache_->catch_error(written.error());
                return;
            }
            block.current_offset += size;
            listener.fetch_progress(task_, block_index_, size);

            if (piece_delay_.count() > 0) {
                std::this_thread::sleep_for(piece_delay_);
            }
        }

        if (block.is_complete()) {
            listener.fetch_end(task_, block_index_, block.content_length);
        }
    }

    void cancel() override { canceled_ = true; }

    auto block_index() const -> std::size_t override { return block_index_; }

private:
    std::size_t block_index_;
    const download_task& task_;
    std::shared_ptr<breakpoint_info> info_;
    std::shared_ptr<download_cache> cache_;
    callback_dispatcher& dispatcher_;
    std::chrono::microseconds piece_delay_;
    std::atomic<bool> canceled_{false};
};

// ============================================================================
// Listener
// ============================================================================

class console_listener : public download_listener {
public:
    void task_start(const download_task& task) override {
        std::cout << "[task " << task.id() << "] started" << std::endl;
    }

    void connect_trial_start(const download_task&, header_fields&) override {}
    void connect_trial_end(const download_task&, int, header_fields&) override {}

    void download_from_beginning(const download_task& task,
                                 breakpoint_info& info,
                                 resume_failed_cause cause) override {
        total_ = info.total_length();
        received_ = 0;
        std::cout << "[task " << task.id() << "] downloading from beginning (" << to_string(cause)
                  << "), " << info.block_count() << " blocks" << std::endl;
    }

    void download_from_breakpoint(const download_task& task, breakpoint_info& info) override {
        total_ = info.total_length();
        received_ = info.total_offset();
        std::cout << "[task " << task.id() << "] resuming at " << format_bytes(received_.load())
                  << " of " << format_bytes(total_.load()) << std::endl;
    }

    void connect_start(const download_task&, std::size_t, header_fields&) override {}
    void connect_end(const download_task&, std::size_t, int, header_fields&) override {}
    void fetch_start(const download_task&, std::size_t, int64_t) override {}

    void fetch_progress(const download_task&, std::size_t, int64_t bytes) override {
        received_ += bytes;
    }

    void fetch_end(const download_task& task, std::size_t block, int64_t length) override {
        std::cout << "[task " << task.id() << "] block " << block << " done ("
                  << format_bytes(length) << ")" << std::endl;
    }

    void task_end(const download_task& task,
                  end_cause cause,
                  const std::optional<error>& real_cause) override {
        std::cout << "[task " << task.id() << "] ended: " << to_string(cause);
        if (real_cause) {
            std::cout << " (" << real_cause->message << ")";
        }
        std::cout << std::endl;
    }

    [[nodiscard]] auto percent() const -> int {
        auto total = total_.load();
        return total > 0 ? static_cast<int>(received_.load() * 100 / total) : 0;
    }

private:
    std::atomic<int64_t> received_{0};
    std::atomic<int64_t> total_{0};
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --size <MB>        Source size in megabytes (default: 16)\n"
              << "  --blocks <n>       Force the number of blocks\n"
              << "  --cancel-at <pct>  Cancel the first attempt at this progress (default: 40)\n"
              << "  --verbose          Enable debug logging\n"
              << "  --help             Show this help message\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t size_mb = 16;
    std::optional<int> blocks;
    int cancel_at = 40;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--size") == 0 && i + 1 < argc) {
            size_mb = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (std::strcmp(argv[i], "--blocks") == 0 && i + 1 < argc) {
            blocks = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--cancel-at") == 0 && i + 1 < argc) {
            cancel_at = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = segment_transfer_config::builder()
                      .with_log_level(verbose ? log_level::debug : log_level::warn)
                      .with_idle_timeout(std::chrono::seconds(5))
                      .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(config.value().level);

    auto work_dir = std::filesystem::temp_directory_path() / "segment_transfer_example";
    std::filesystem::create_directories(work_dir);
    auto source = work_dir / "source.bin";
    auto target_name = std::string("copy.bin");
    std::filesystem::remove(work_dir / target_name);
    std::filesystem::remove(work_dir / (target_name + ".part"));

    try {
        create_source_file(source, size_mb * 1024 * 1024);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    memory_breakpoint_store store;
    partial_file_strategy files;
    download_strategy strategy(config.value().strategy);
    callback_dispatcher dispatcher;
    adapters::elastic_transfer_pool pool(config.value().pool);
    std::atomic<bool> throttle{true};

    download_environment env{
        store, files, strategy, dispatcher, pool, nullptr,
        [](const download_task& task, std::shared_ptr<breakpoint_info> info,
           std::shared_ptr<download_cache>) {
            return std::make_unique<file_remote_check>(task, std::move(info));
        },
        [](const download_task& task, std::shared_ptr<breakpoint_info> info, int64_t) {
            return std::make_unique<file_local_check>(task, std::move(info));
        },
        [&dispatcher, &throttle](std::size_t block_index, const download_task& task,
                                 std::shared_ptr<breakpoint_info> info,
                                 std::shared_ptr<download_cache> cache) {
            auto delay = throttle ? std::chrono::microseconds(500) : std::chrono::microseconds(0);
            return std::make_shared<file_copy_chain>(block_index, task, std::move(info),
                                                     std::move(cache), dispatcher, delay);
        }};

    auto listener = std::make_shared<console_listener>();
    auto make_task = [&]() {
        download_task::builder builder(1, std::string(file_scheme) + source.string());
        builder.with_filename(target_name).with_parent_path(work_dir).with_listener(listener);
        if (blocks) {
            builder.with_connection_count(*blocks);
        }
        return builder.build();
    };

    auto task = make_task();
    if (!task) {
        std::cerr << "Invalid task: " << task.error().message << std::endl;
        return 1;
    }

    // First attempt, canceled part way through
    std::cout << "\n=== First attempt ===" << std::endl;
    auto first = download_call::create(task.value(), env);
    std::thread runner([first] { first->run(); });
    while (!first->is_finishing() && listener->percent() < cancel_at) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (first->cancel()) {
        std::cout << "Canceled at " << listener->percent() << "%" << std::endl;
    }
    runner.join();

    // Second attempt resumes from the stored breakpoint
    std::cout << "\n=== Second attempt ===" << std::endl;
    throttle = false;
    auto start = std::chrono::steady_clock::now();
    auto second = download_call::create(task.value(), env);
    if (auto executed = second->execute(); !executed) {
        std::cerr << "Download abandoned: " << executed.error().message << std::endl;
        return 1;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    auto target = work_dir / target_name;
    std::error_code ec;
    auto copied = std::filesystem::file_size(target, ec);
    if (ec || copied != std::filesystem::file_size(source)) {
        std::cerr << "Copy is missing or has the wrong size" << std::endl;
        return 1;
    }

    std::cout << "\nCopied " << format_bytes(static_cast<int64_t>(copied)) << " to " << target
              << " in " << elapsed.count() << " ms" << std::endl;

    pool.shutdown();
    return 0;
}
