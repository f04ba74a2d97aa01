#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mediaup/client/cancellation.hpp"
#include "mediaup/client/chunk_planner.hpp"
#include "mediaup/client/errors.hpp"
#include "mediaup/client/logger.hpp"
#include "mediaup/client/part_uploader.hpp"
#include "mediaup/client/progress_observer.hpp"
#include "mediaup/client/session_coordinator.hpp"
#include "mediaup/client/upload_launcher.hpp"
#include "mediaup/crypto.hpp"

using namespace mediaup;
using namespace mediaup::client;
using mediaup::protocol::PartETag;
using mediaup::protocol::ProgressRecord;
using mediaup::protocol::SessionStatus;
using mediaup::protocol::UploadStrategy;

namespace
{

    // Files under 100 bytes go direct; larger ones use 10 byte parts.
    constexpr PlannerPolicy kTestPolicy{
        .direct_threshold = 100,
        .small_chunk_size = 10,
        .large_chunk_size = 20,
        .large_file_threshold = 1000,
    };

    constexpr RetryPolicy kFastRetry{
        .max_attempts = 3,
        .base_delay = std::chrono::milliseconds{1},
        .max_delay = std::chrono::milliseconds{4},
    };

    CoordinatorOptions test_options(std::uint32_t in_flight = 1)
    {
        return CoordinatorOptions{.planner = kTestPolicy, .retry = kFastRetry, .max_parts_in_flight = in_flight};
    }

    std::filesystem::path test_dir()
    {
        const auto dir = std::filesystem::temp_directory_path() / "mediaup_client_test";
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write_test_file(const std::string &name, std::size_t size)
    {
        const auto path = test_dir() / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        for (std::size_t i = 0; i < size; ++i)
        {
            out.put(static_cast<char>(i % 251));
        }
        return path;
    }

    std::string etag_of(const std::filesystem::path &path, const ByteRange &range)
    {
        return crypto::hash_bytes(PartUploader::read_range(path, range));
    }

    class Gate
    {
    public:
        void wait()
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]
                     { return open_; });
        }

        void open()
        {
            {
                std::lock_guard lock(mutex_);
                open_ = true;
            }
            cv_.notify_all();
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool open_{false};
    };

    class FakeStorage : public StorageService
    {
    public:
        InitResult initialize(const mediaup::protocol::InitializeUploadRequest &request) override
        {
            std::lock_guard lock(mutex);
            if (init_error)
            {
                throw ServiceError(*init_error, "initialize rejected");
            }
            last_init = request;
            InitResult result{.session_id = "sess-" + request.filename, .upload_id = std::nullopt};
            if (request.strategy == UploadStrategy::Multipart && issue_upload_id)
            {
                result.upload_id = "up-" + request.filename;
            }
            return result;
        }

        PartResult upload_part(const std::string &session_id, std::uint32_t part_number,
                               std::span<const std::byte> bytes) override
        {
            if (before_part)
            {
                before_part(session_id, part_number);
            }
            std::lock_guard lock(mutex);
            ++attempts[part_number];
            if (auto it = transient_failures.find(part_number); it != transient_failures.end() && it->second > 0)
            {
                --it->second;
                throw ServiceError(ErrorCode::Busy, "busy");
            }
            if (failing_parts.count(part_number) > 0 && (failing_session.empty() || failing_session == session_id))
            {
                throw ServiceError(failure_code, "part rejected");
            }
            stored_parts[session_id].push_back(part_number);
            return PartResult{.part_number = part_number, .etag = crypto::hash_bytes(bytes)};
        }

        CompletionResult direct_upload(const std::string &session_id, std::span<const std::byte> bytes) override
        {
            std::lock_guard lock(mutex);
            ++direct_calls;
            return CompletionResult{.session_id = session_id, .size = bytes.size()};
        }

        CompletionResult complete_upload(const std::string &session_id,
                                         const std::vector<PartETag> &parts) override
        {
            std::lock_guard lock(mutex);
            ++complete_calls;
            completed_parts = parts;
            if (fail_complete)
            {
                throw ServiceError(ErrorCode::PartsInvalid, "complete rejected");
            }
            return CompletionResult{.session_id = session_id, .size = declared_size};
        }

        void abort_upload(const std::string &session_id) override
        {
            std::lock_guard lock(mutex);
            aborted.push_back(session_id);
        }

        std::mutex mutex;
        std::optional<ErrorCode> init_error;
        bool issue_upload_id{true};
        std::optional<mediaup::protocol::InitializeUploadRequest> last_init;
        std::function<void(const std::string &, std::uint32_t)> before_part;
        std::map<std::uint32_t, int> transient_failures;
        std::set<std::uint32_t> failing_parts;
        std::string failing_session;
        ErrorCode failure_code{ErrorCode::Unavailable};
        std::map<std::uint32_t, int> attempts;
        std::map<std::string, std::vector<std::uint32_t>> stored_parts;
        int direct_calls{0};
        int complete_calls{0};
        bool fail_complete{false};
        std::uint64_t declared_size{100};
        std::vector<PartETag> completed_parts;
        std::vector<std::string> aborted;
    };

    class FakeProgress : public ProgressStore
    {
    public:
        void publish(const ProgressRecord &record) override
        {
            std::lock_guard lock(mutex);
            if (fail_publish)
            {
                throw ServiceError(ErrorCode::Unavailable, "store down");
            }
            published.push_back(record);
        }

        std::optional<ProgressRecord> fetch(const std::string &session_id) override
        {
            std::lock_guard lock(mutex);
            ++fetches[session_id];
            if (failing_fetch.count(session_id) > 0)
            {
                throw ServiceError(ErrorCode::Unavailable, "store down");
            }
            auto &queue = scripted[session_id];
            if (queue.empty())
            {
                return last_served[session_id];
            }
            auto next = queue.front();
            queue.pop_front();
            last_served[session_id] = next;
            return next;
        }

        void script(const std::string &session_id, SessionStatus status, double progress)
        {
            scripted[session_id].push_back(ProgressRecord{
                .session_id = session_id,
                .status = status,
                .progress = progress,
                .message = {},
                .stage = {},
                .timestamp = {},
            });
        }

        std::vector<ProgressRecord> records_for(const std::string &session_id)
        {
            std::lock_guard lock(mutex);
            std::vector<ProgressRecord> result;
            for (const auto &record : published)
            {
                if (record.session_id == session_id)
                {
                    result.push_back(record);
                }
            }
            return result;
        }

        std::mutex mutex;
        bool fail_publish{false};
        std::vector<ProgressRecord> published;
        std::map<std::string, std::deque<std::optional<ProgressRecord>>> scripted;
        std::map<std::string, std::optional<ProgressRecord>> last_served;
        std::map<std::string, int> fetches;
        std::set<std::string> failing_fetch;
    };

    bool non_decreasing(const std::vector<ProgressRecord> &records)
    {
        return std::is_sorted(records.begin(), records.end(), [](const auto &lhs, const auto &rhs)
                              { return lhs.progress < rhs.progress; });
    }

    template <typename Fn>
    std::optional<UploadErrorKind> upload_error_kind(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex.kind();
        }
        return std::nullopt;
    }

    void test_chunk_planner_thresholds()
    {
        const auto small = plan_chunks(3 * kMiB);
        assert(small.strategy == UploadStrategy::Direct);
        assert(small.total_parts == 1);
        assert(small.chunk_size == 3 * kMiB);

        assert(plan_chunks(10 * kMiB - 1).strategy == UploadStrategy::Direct);

        const auto at_threshold = plan_chunks(10 * kMiB);
        assert(at_threshold.strategy == UploadStrategy::Multipart);
        assert(at_threshold.chunk_size == 5 * kMiB);
        assert(at_threshold.total_parts == 2);

        const auto below_gib = plan_chunks(kGiB - 1);
        assert(below_gib.chunk_size == 5 * kMiB);
        assert(below_gib.total_parts == 205);

        const auto at_gib = plan_chunks(kGiB);
        assert(at_gib.chunk_size == 10 * kMiB);
        assert(at_gib.total_parts == 103);

        const auto large = plan_chunks(2500 * kMiB);
        assert(large.strategy == UploadStrategy::Multipart);
        assert(large.chunk_size == 10 * kMiB);
        assert(large.total_parts == 250);

        const auto binary_large = plan_chunks(2 * kGiB + kGiB / 2);
        assert(binary_large.total_parts == 256);
    }

    void test_chunk_planner_ranges()
    {
        for (const std::uint64_t size : {10 * kMiB, 12 * kMiB, 12 * kMiB + 1, 37 * kMiB - 3})
        {
            const auto plan = plan_chunks(size);
            std::uint64_t covered = 0;
            for (std::uint32_t part = 1; part <= plan.total_parts; ++part)
            {
                const auto range = byte_range(plan, part);
                assert(range.offset == covered);
                assert(range.length > 0);
                assert(range.length <= plan.chunk_size);
                covered += range.length;
            }
            assert(covered == size);
        }

        const auto plan = plan_chunks(12 * kMiB);
        const auto last = byte_range(plan, 3);
        assert(last.offset == 10 * kMiB);
        assert(last.length == 2 * kMiB);

        bool rejected_part = false;
        try
        {
            (void)byte_range(plan, 4);
        }
        catch (const std::out_of_range &)
        {
            rejected_part = true;
        }
        assert(rejected_part);

        bool rejected_empty = false;
        try
        {
            (void)plan_chunks(0);
        }
        catch (const std::invalid_argument &)
        {
            rejected_empty = true;
        }
        assert(rejected_empty);
    }

    void test_progress_mapping()
    {
        assert(transfer_progress(0, 10) == 5.0);
        assert(transfer_progress(6, 10) == 29.0);
        assert(transfer_progress(10, 10) == 45.0);
        assert(transfer_progress(125, 250) == 25.0);
        assert(transfer_progress(20, 10) == kHandoffProgress);
        assert(transfer_progress(0, 0) == kTransferStartProgress);
    }

    void test_retry_backoff()
    {
        const RetryPolicy policy{};
        assert(policy.backoff(1) == std::chrono::milliseconds{500});
        assert(policy.backoff(2) == std::chrono::milliseconds{1000});
        assert(policy.backoff(3) == std::chrono::milliseconds{2000});
        assert(policy.backoff(12) == std::chrono::milliseconds{8000});
    }

    void test_cancellation_token()
    {
        CancellationToken token;
        const auto copy = token;
        assert(!copy.cancelled());
        assert(copy.wait_for(std::chrono::milliseconds{1}));
        token.cancel();
        assert(copy.cancelled());
        assert(!copy.wait_for(std::chrono::milliseconds{1000}));
        assert(upload_error_kind([&]
                                 { copy.throw_if_cancelled(); }) == UploadErrorKind::Cancelled);
    }

    void test_direct_upload_scenario()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.declared_size = 30;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto file = write_test_file("direct.mp3", 30);
        const auto session = coordinator.initialize(UploadRequest{.source = file});
        assert(session.strategy() == UploadStrategy::Direct);
        assert(!session.upload_id);
        assert(storage.last_init->content_type == "audio/mpeg");
        assert(storage.last_init->speaker_count == 2);

        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.succeeded());
        assert(outcome.status == SessionStatus::Processing);
        assert(outcome.progress == 50.0);
        assert(storage.direct_calls == 1);
        assert(storage.complete_calls == 0);

        const auto records = progress.records_for(session.session_id);
        assert(records.size() == 2);
        assert(records[0].status == SessionStatus::Uploading && records[0].progress == 0.0);
        assert(records[1].status == SessionStatus::Processing && records[1].progress == 50.0);
    }

    void test_multipart_success()
    {
        FakeStorage storage;
        FakeProgress progress;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto file = write_test_file("multi.wav", 100);
        const auto session = coordinator.initialize(UploadRequest{.source = file, .speaker_count = 3});
        assert(session.strategy() == UploadStrategy::Multipart);
        assert(session.total_parts() == 10);
        assert(session.upload_id == std::optional<std::string>("up-multi.wav"));
        assert(storage.last_init->speaker_count == 3);

        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.succeeded());
        assert(outcome.parts_uploaded == 10);
        assert(storage.complete_calls == 1);
        assert(storage.aborted.empty());
        assert(storage.completed_parts.size() == 10);
        for (std::uint32_t i = 0; i < 10; ++i)
        {
            assert(storage.completed_parts[i].part_number == i + 1);
            assert(storage.completed_parts[i].etag == etag_of(file, byte_range(session.plan, i + 1)));
        }

        const auto records = progress.records_for(session.session_id);
        assert(records.size() == 12);
        assert(non_decreasing(records));
        assert(records[6].progress == 29.0);
        assert(records.back().status == SessionStatus::Processing);
        assert(records.back().progress == 50.0);
    }

    void test_part_failure_keeps_progress()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.failing_parts = {7};
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("fail7.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(!outcome.succeeded());
        assert(outcome.error == UploadErrorKind::PartUpload);
        assert(outcome.status == SessionStatus::Failed);
        assert(outcome.progress == 29.0);
        assert(outcome.parts_uploaded == 6);
        assert(storage.attempts[7] == 3);
        assert(storage.attempts.count(8) == 0);
        assert(storage.complete_calls == 0);
        assert(storage.aborted == std::vector<std::string>{session.session_id});

        const auto records = progress.records_for(session.session_id);
        assert(non_decreasing(records));
        assert(records.back().status == SessionStatus::Failed);
        assert(records.back().progress == 29.0);
        assert(records.back().stage == "part_upload");
        assert(!records.back().message.empty());
    }

    void test_non_retryable_failure_fails_fast()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.failing_parts = {2};
        storage.failure_code = ErrorCode::NotFound;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("fail2.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.error == UploadErrorKind::PartUpload);
        assert(storage.attempts[2] == 1);
        assert(outcome.progress == 9.0);
    }

    void test_transient_failure_retried()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.transient_failures[3] = 2;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("retry.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.succeeded());
        assert(storage.attempts[3] == 3);
        assert(storage.complete_calls == 1);
    }

    void test_cancellation_aborts()
    {
        FakeStorage storage;
        FakeProgress progress;
        CancellationToken cancel;
        storage.before_part = [&](const std::string &, std::uint32_t part_number)
        {
            if (part_number == 4)
            {
                cancel.cancel();
            }
        };
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("cancel.bin", 100)});
        const auto outcome = coordinator.run(session, cancel);
        assert(outcome.error == UploadErrorKind::Cancelled);
        assert(outcome.progress == 21.0);
        assert(storage.complete_calls == 0);
        assert(storage.aborted.size() == 1);

        const auto records = progress.records_for(session.session_id);
        assert(records.back().status == SessionStatus::Failed);
        assert(records.back().stage == "cancelled");
        assert(records.back().progress == 21.0);
    }

    void test_completion_failure_aborts()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.fail_complete = true;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("complete.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.error == UploadErrorKind::Completion);
        assert(outcome.progress == 45.0);
        assert(storage.aborted.size() == 1);

        const auto records = progress.records_for(session.session_id);
        assert(records.back().status == SessionStatus::Failed);
        assert(records.back().stage == "completion");
    }

    void test_completion_size_mismatch()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.declared_size = 99;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("size.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.error == UploadErrorKind::Completion);
        assert(storage.aborted.size() == 1);
    }

    void test_publish_failures_do_not_fail_upload()
    {
        FakeStorage storage;
        FakeProgress progress;
        progress.fail_publish = true;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("quiet.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.succeeded());
        assert(outcome.progress == 50.0);
        assert(progress.published.empty());
    }

    void test_validate_parts()
    {
        const std::vector<PartETag> valid{{1, "a"}, {2, "b"}, {3, "c"}};
        SessionCoordinator::validate_parts(valid, 3);

        const auto kind_of = [](const std::vector<PartETag> &parts, std::uint32_t total)
        {
            return upload_error_kind([&]
                                     { SessionCoordinator::validate_parts(parts, total); });
        };
        assert(kind_of({{1, "a"}, {3, "c"}}, 3) == UploadErrorKind::Completion);
        assert(kind_of({{1, "a"}, {2, "b"}, {2, "b"}}, 3) == UploadErrorKind::Completion);
        assert(kind_of({{2, "b"}, {1, "a"}, {3, "c"}}, 3) == UploadErrorKind::Completion);
        assert(kind_of({{1, "a"}, {2, ""}, {3, "c"}}, 3) == UploadErrorKind::Completion);
        assert(kind_of({{1, "a"}, {2, "b"}, {3, "c"}, {4, "d"}}, 3) == UploadErrorKind::Completion);
    }

    void test_parallel_parts_sorted()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.before_part = [](const std::string &, std::uint32_t part_number)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{(part_number % 3) * 2});
        };
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options(4));

        const auto session = coordinator.initialize(UploadRequest{.source = write_test_file("parallel.bin", 100)});
        const auto outcome = coordinator.run(session, CancellationToken{});
        assert(outcome.succeeded());
        assert(storage.completed_parts.size() == 10);
        for (std::uint32_t i = 0; i < 10; ++i)
        {
            assert(storage.completed_parts[i].part_number == i + 1);
        }
        assert(non_decreasing(progress.records_for(session.session_id)));
    }

    void test_initialize_errors()
    {
        FakeStorage storage;
        FakeProgress progress;
        SessionCoordinator coordinator(storage, progress, Logger{}, test_options());

        assert(upload_error_kind([&]
                                 { coordinator.initialize(UploadRequest{.source = test_dir() / "missing.bin"}); }) ==
               UploadErrorKind::Initialization);
        assert(upload_error_kind([&]
                                 { coordinator.initialize(UploadRequest{.source = write_test_file("empty.bin", 0)}); }) ==
               UploadErrorKind::Initialization);

        const auto file = write_test_file("init.bin", 100);
        storage.init_error = ErrorCode::Unavailable;
        try
        {
            coordinator.initialize(UploadRequest{.source = file});
            assert(false);
        }
        catch (const UploadError &ex)
        {
            assert(ex.kind() == UploadErrorKind::Initialization);
            assert(ex.code() == ErrorCode::Unavailable);
        }

        storage.init_error.reset();
        storage.issue_upload_id = false;
        assert(upload_error_kind([&]
                                 { coordinator.initialize(UploadRequest{.source = file}); }) ==
               UploadErrorKind::Initialization);
        assert(progress.published.empty());
    }

    void test_launcher_returns_before_completion()
    {
        FakeStorage storage;
        FakeProgress progress;
        Gate gate;
        storage.before_part = [&](const std::string &, std::uint32_t)
        { gate.wait(); };

        UploadLauncher launcher(storage, progress, Logger{}, 2);
        int hook_calls = 0;
        const auto launched = launcher.start_batch(
            {UploadRequest{.source = write_test_file("launch.bin", 100)}}, test_options(),
            [&](const std::vector<LaunchedSession> &sessions)
            {
                ++hook_calls;
                assert(sessions.size() == 1);
            });

        assert(hook_calls == 1);
        assert(launched.size() == 1);
        assert(launched[0].total_parts == 10);
        assert(launched[0].strategy == UploadStrategy::Multipart);
        assert(launcher.outcomes().empty());
        assert(launcher.active() == 1);

        gate.open();
        launcher.wait();
        const auto outcomes = launcher.outcomes();
        assert(outcomes.size() == 1);
        assert(outcomes[0].succeeded());
        assert(launcher.active() == 0);
    }

    void test_launcher_isolates_failures()
    {
        FakeStorage storage;
        FakeProgress progress;
        storage.failing_parts = {2};
        storage.failing_session = "sess-a.bin";
        storage.failure_code = ErrorCode::NotFound;

        UploadLauncher launcher(storage, progress, Logger{}, 2);
        std::mutex seen_mutex;
        std::vector<std::string> seen;
        launcher.on_outcome([&](const SessionOutcome &outcome)
                            {
            std::lock_guard lock(seen_mutex);
            seen.push_back(outcome.session_id); });

        launcher.start_batch({UploadRequest{.source = write_test_file("a.bin", 100)},
                              UploadRequest{.source = write_test_file("b.bin", 100)}},
                             test_options());
        launcher.wait();

        const auto outcomes = launcher.outcomes();
        assert(outcomes.size() == 2);
        assert(seen.size() == 2);
        for (const auto &outcome : outcomes)
        {
            if (outcome.session_id == "sess-a.bin")
            {
                assert(outcome.error == UploadErrorKind::PartUpload);
            }
            else
            {
                assert(outcome.session_id == "sess-b.bin");
                assert(outcome.succeeded());
            }
        }
        assert(progress.records_for("sess-b.bin").back().status == SessionStatus::Processing);
        assert(progress.records_for("sess-a.bin").back().status == SessionStatus::Failed);
    }

    void test_launcher_initialization_failure()
    {
        FakeStorage storage;
        FakeProgress progress;
        UploadLauncher launcher(storage, progress, Logger{}, 2);

        bool hook_called = false;
        const auto kind = upload_error_kind([&]
                                            { launcher.start_batch({UploadRequest{.source = write_test_file("first.bin", 100)},
                                                                    UploadRequest{.source = test_dir() / "absent.bin"}},
                                                                   test_options(),
                                                                   [&](const std::vector<LaunchedSession> &)
                                                                   { hook_called = true; }); });
        assert(kind == UploadErrorKind::Initialization);
        assert(!hook_called);

        launcher.wait();
        const auto outcomes = launcher.outcomes();
        assert(outcomes.size() == 1);
        assert(outcomes[0].session_id == "sess-first.bin");
        assert(outcomes[0].succeeded());
    }

    void test_launcher_cancel()
    {
        FakeStorage storage;
        FakeProgress progress;
        Gate gate;
        storage.before_part = [&](const std::string &, std::uint32_t)
        { gate.wait(); };

        UploadLauncher launcher(storage, progress, Logger{}, 1);
        const auto launched = launcher.start_batch({UploadRequest{.source = write_test_file("stop.bin", 100)}},
                                                   test_options());
        assert(!launcher.cancel("no-such-session"));
        assert(launcher.cancel(launched[0].session_id));
        gate.open();
        launcher.wait();

        const auto outcomes = launcher.outcomes();
        assert(outcomes.size() == 1);
        assert(outcomes[0].error == UploadErrorKind::Cancelled);
        assert(storage.aborted.size() == 1);
    }

    void test_launcher_sized_to_batch_runs_every_file_at_once()
    {
        FakeStorage storage;
        FakeProgress progress;
        std::mutex mutex;
        std::condition_variable cv;
        std::set<std::string> entered;
        constexpr std::size_t kFiles = 3;
        bool all_entered = false;
        storage.before_part = [&](const std::string &session_id, std::uint32_t)
        {
            std::unique_lock lock(mutex);
            entered.insert(session_id);
            cv.notify_all();
            if (cv.wait_for(lock, std::chrono::seconds{5}, [&]
                            { return entered.size() == kFiles; }))
            {
                all_entered = true;
            }
        };

        std::vector<UploadRequest> files;
        for (std::size_t i = 0; i < kFiles; ++i)
        {
            files.push_back(UploadRequest{.source = write_test_file("batch" + std::to_string(i) + ".bin", 100)});
        }
        UploadLauncher launcher(storage, progress, Logger{}, files.size());
        launcher.start_batch(files, test_options());
        launcher.wait();

        assert(all_entered);
        assert(entered.size() == kFiles);
        for (const auto &outcome : launcher.outcomes())
        {
            assert(outcome.succeeded());
        }
    }

    void test_observer_never_regresses()
    {
        FakeProgress store;
        store.script("s1", SessionStatus::Uploading, 40);
        store.script("s1", SessionStatus::Uploading, 25);
        ProgressObserver observer(store, Logger{});
        observer.watch("s1");

        std::vector<double> reported;
        observer.on_update([&](const ObservedSession &update)
                           { reported.push_back(update.progress); });
        observer.poll_once();
        observer.poll_once();
        assert((reported == std::vector<double>{40.0, 40.0}));
        assert(observer.snapshot("s1")->progress == 40.0);
    }

    void test_observer_baseline_and_phase()
    {
        FakeProgress store;
        store.script("s2", SessionStatus::Uploading, 10);
        store.script("s3", SessionStatus::Processing, 50);
        store.script("s3", SessionStatus::Uploading, 45);
        ProgressObserver observer(store, Logger{});
        observer.watch("s2", 30.0);
        observer.watch("s3");

        assert(observer.snapshot("s2")->progress == 30.0);
        observer.poll_once();
        assert(observer.snapshot("s2")->progress == 30.0);
        assert(observer.snapshot("s2")->status == SessionStatus::Uploading);

        observer.poll_once();
        const auto s3 = observer.snapshot("s3");
        assert(s3->status == SessionStatus::Processing);
        assert(s3->progress == 50.0);
        assert(!observer.snapshot("missing"));
    }

    void test_observer_stops_polling_terminal_sessions()
    {
        FakeProgress store;
        store.script("s4", SessionStatus::Processing, 50);
        store.script("s4", SessionStatus::Completed, 100);
        ProgressObserver observer(store, Logger{});
        observer.watch("s4");

        assert(observer.poll_once() == 1);
        assert(!observer.all_terminal());
        assert(observer.poll_once() == 1);
        assert(observer.all_terminal());
        assert(observer.poll_once() == 0);
        assert(store.fetches["s4"] == 2);
        assert(observer.snapshot("s4")->status == SessionStatus::Completed);
    }

    void test_observer_ignores_unknown_and_errors()
    {
        FakeProgress store;
        store.scripted["s5"].push_back(std::nullopt);
        store.failing_fetch.insert("s6");
        ProgressObserver observer(store, Logger{});
        observer.watch("s5", 12.0);
        observer.watch("s6");

        observer.poll_once();
        const auto s5 = observer.snapshot("s5");
        assert(!s5->seen);
        assert(s5->status == SessionStatus::Unknown);
        assert(s5->progress == 12.0);
        assert(!observer.snapshot("s6")->seen);

        assert(observer.poll_once() == 2);
        assert(store.fetches["s6"] == 2);
    }

    void test_observer_run_until_terminal()
    {
        FakeProgress store;
        store.script("s7", SessionStatus::Uploading, 10);
        store.script("s7", SessionStatus::Processing, 50);
        store.script("s7", SessionStatus::Failed, 50);
        ProgressObserver observer(store, Logger{}, std::chrono::milliseconds{1});
        observer.watch("s7");
        observer.run();

        const auto state = observer.snapshot("s7");
        assert(state->status == SessionStatus::Failed);
        assert(state->progress == 50.0);
        assert(store.fetches["s7"] == 3);
    }

} // namespace

void run_client_component_tests()
{
    test_chunk_planner_thresholds();
    test_chunk_planner_ranges();
    test_progress_mapping();
    test_retry_backoff();
    test_cancellation_token();
    test_direct_upload_scenario();
    test_multipart_success();
    test_part_failure_keeps_progress();
    test_non_retryable_failure_fails_fast();
    test_transient_failure_retried();
    test_cancellation_aborts();
    test_completion_failure_aborts();
    test_completion_size_mismatch();
    test_publish_failures_do_not_fail_upload();
    test_validate_parts();
    test_parallel_parts_sorted();
    test_initialize_errors();
    test_launcher_returns_before_completion();
    test_launcher_isolates_failures();
    test_launcher_initialization_failure();
    test_launcher_cancel();
    test_launcher_sized_to_batch_runs_every_file_at_once();
    test_observer_never_regresses();
    test_observer_baseline_and_phase();
    test_observer_stops_polling_terminal_sessions();
    test_observer_ignores_unknown_and_errors();
    test_observer_run_until_terminal();

    std::error_code ec;
    std::filesystem::remove_all(test_dir(), ec);
}
