#include "installer/download_engine.hpp"
#include "installer/errors.hpp"

#include "test_support.hpp"

#include <chrono>
#include <future>
#include <memory>

#include <gtest/gtest.h>

namespace installer::test {

using namespace std::chrono_literals;

class DownloadEngineTest : public ::testing::Test {
protected:
    static constexpr std::size_t kSize = 1000000;

    void SetUp() override {
        transport = std::make_shared<FakeTransport>(makeBody(kSize));
        engine = std::make_unique<DownloadEngine>(transport, sink, 10ms);
        handles = makeTaskHandles(TaskKind::Download);

        request.id = "v20.0.0";
        request.url = "https://nodejs.org/dist/v20.0.0/node-v20.0.0-linux-x64.tar.xz";
        request.staging_path = dir.path() / "v20.0.0" / "node.tar.xz.part";
        request.final_path = dir.path() / "v20.0.0" / "node.tar.xz";
    }

    std::vector<int> progressValues() const {
        std::vector<int> values;
        for (const auto& event : sink.events()) {
            if (event.progress) {
                values.push_back(*event.progress);
            }
        }
        return values;
    }

    TempDir dir;
    RecordingSink sink;
    std::shared_ptr<FakeTransport> transport;
    std::unique_ptr<DownloadEngine> engine;
    TaskHandles handles;
    DownloadRequest request;
};

TEST_F(DownloadEngineTest, FreshDownloadCommitsExactBytes) {
    EXPECT_EQ(engine->run(request, handles), DownloadResult::Completed);

    EXPECT_EQ(transport->offsets(), (std::vector<std::uint64_t>{0}));
    EXPECT_FALSE(std::filesystem::exists(request.staging_path));
    ASSERT_TRUE(std::filesystem::exists(request.final_path));
    EXPECT_EQ(std::filesystem::file_size(request.final_path), kSize);
    EXPECT_EQ(readFile(request.final_path), transport->body());

    const auto values = progressValues();
    ASSERT_FALSE(values.empty());
    EXPECT_LT(values.front(), 100);
    EXPECT_EQ(values.back(), 100);
    for (std::size_t i = 1; i < values.size(); ++i) {
        EXPECT_LE(values[i - 1], values[i]);
    }
    for (const auto& event : sink.events()) {
        EXPECT_EQ(event.id, "v20.0.0");
        EXPECT_FALSE(event.error.has_value());
    }
}

TEST_F(DownloadEngineTest, ResumesFromStagingFile) {
    constexpr std::size_t kHave = 300000;
    writeFile(request.staging_path, transport->body().substr(0, kHave));
    EXPECT_EQ(DownloadEngine::resumeOffset(request.staging_path), kHave);

    EXPECT_EQ(engine->run(request, handles), DownloadResult::Completed);

    EXPECT_EQ(transport->offsets(), (std::vector<std::uint64_t>{kHave}));
    EXPECT_EQ(std::filesystem::file_size(request.final_path), kSize);
    EXPECT_EQ(readFile(request.final_path), transport->body());

    // Progress accounts for the bytes already on disk.
    const auto values = progressValues();
    ASSERT_FALSE(values.empty());
    EXPECT_GE(values.front(), 30);
    EXPECT_EQ(values.back(), 100);
}

TEST_F(DownloadEngineTest, RangeNotSatisfiableCommitsStagingAsIs) {
    writeFile(request.staging_path, transport->body());

    EXPECT_EQ(engine->run(request, handles), DownloadResult::AlreadyComplete);

    EXPECT_FALSE(std::filesystem::exists(request.staging_path));
    EXPECT_EQ(readFile(request.final_path), transport->body());
}

TEST_F(DownloadEngineTest, ServerIgnoringRangeRestartsFromZero) {
    transport->ignore_range = true;
    writeFile(request.staging_path, std::string(1234, 'x'));

    EXPECT_EQ(engine->run(request, handles), DownloadResult::Completed);

    EXPECT_EQ(transport->offsets(), (std::vector<std::uint64_t>{1234}));
    EXPECT_EQ(std::filesystem::file_size(request.final_path), kSize);
    EXPECT_EQ(readFile(request.final_path), transport->body());
}

TEST_F(DownloadEngineTest, HttpErrorThrowsAndKeepsStaging) {
    transport->forced_status = 404;
    writeFile(request.staging_path, transport->body().substr(0, 1000));

    try {
        engine->run(request, handles);
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& ex) {
        EXPECT_EQ(ex.httpStatus(), 404);
        EXPECT_NE(std::string(ex.what()).find("HTTP 404"), std::string::npos);
    }

    EXPECT_EQ(DownloadEngine::resumeOffset(request.staging_path), 1000u);
    EXPECT_FALSE(std::filesystem::exists(request.final_path));
}

TEST_F(DownloadEngineTest, InterruptedTransferResumesOnNextRun) {
    transport->fail_after = 500000;
    EXPECT_THROW(engine->run(request, handles), NetworkError);
    EXPECT_EQ(DownloadEngine::resumeOffset(request.staging_path), 500000u);
    EXPECT_FALSE(std::filesystem::exists(request.final_path));

    transport->fail_after.reset();
    EXPECT_EQ(engine->run(request, handles), DownloadResult::Completed);

    EXPECT_EQ(transport->offsets(), (std::vector<std::uint64_t>{0, 500000}));
    EXPECT_EQ(readFile(request.final_path), transport->body());
}

TEST_F(DownloadEngineTest, CancelBetweenChunksDeletesStaging) {
    transport->before_chunk = [this](std::uint64_t position, std::uint64_t) {
        if (position >= 200000) {
            handles.cancel->notify();
        }
    };

    EXPECT_EQ(engine->run(request, handles), DownloadResult::Cancelled);

    EXPECT_FALSE(std::filesystem::exists(request.staging_path));
    EXPECT_FALSE(std::filesystem::exists(request.final_path));
}

TEST_F(DownloadEngineTest, AlreadyCancelledTaskDoesNotRequest) {
    handles.cancel->notify();

    EXPECT_EQ(engine->run(request, handles), DownloadResult::Cancelled);
    EXPECT_TRUE(transport->offsets().empty());
}

TEST_F(DownloadEngineTest, AlreadyCancelledTaskDeletesLeftoverStaging) {
    writeFile(request.staging_path, transport->body().substr(0, 400000));
    handles.cancel->notify();

    EXPECT_EQ(engine->run(request, handles), DownloadResult::Cancelled);

    EXPECT_FALSE(std::filesystem::exists(request.staging_path));
    EXPECT_FALSE(std::filesystem::exists(request.final_path));
    EXPECT_TRUE(transport->offsets().empty());
}

TEST_F(DownloadEngineTest, CancelBeforeRangeNotSatisfiableDoesNotCommit) {
    // Cancel lands while the request is in flight; the reply is a 416.
    class CancelThenRangeTransport final : public HttpTransport {
    public:
        explicit CancelThenRangeTransport(CancelSignalPtr cancel) : cancel_(std::move(cancel)) {}

        TransferResult fetch(const HttpRequest&, ResponseHandler& handler) override {
            cancel_->notify();
            TransferResult result;
            result.status = 416;
            result.aborted = !handler.onResponse(416, std::nullopt);
            result.completed = !result.aborted;
            return result;
        }

    private:
        CancelSignalPtr cancel_;
    };

    writeFile(request.staging_path, transport->body());
    DownloadEngine cancelling_engine(std::make_shared<CancelThenRangeTransport>(handles.cancel), sink,
                                     10ms);

    EXPECT_EQ(cancelling_engine.run(request, handles), DownloadResult::Cancelled);

    EXPECT_FALSE(std::filesystem::exists(request.staging_path));
    EXPECT_FALSE(std::filesystem::exists(request.final_path));
}

TEST_F(DownloadEngineTest, PauseFreezesProgressUntilResume) {
    transport->before_chunk = [this](std::uint64_t position, std::uint64_t size) {
        if (position * 100 >= size * 40 && position * 100 < size * 40 + 16384 * 100) {
            handles.paused->store(true);
        }
    };

    auto result = std::async(std::launch::async, [this] { return engine->run(request, handles); });

    ASSERT_TRUE(sink.waitFor(isPausedEvent));
    // Let a few poll intervals pass while paused.
    ASSERT_TRUE(eventually([this] { return sink.count(isPausedEvent) >= 3; }));

    for (const auto& event : sink.events()) {
        if (isPausedEvent(event)) {
            ASSERT_TRUE(event.progress.has_value());
            EXPECT_GE(*event.progress, 38);
            EXPECT_LE(*event.progress, 42);
        }
    }
    EXPECT_TRUE(std::filesystem::exists(request.staging_path));

    handles.paused->store(false);
    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), DownloadResult::Completed);

    const auto events = sink.events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().progress.value_or(-1), 100);
    EXPECT_FALSE(events.back().is_paused.value_or(false));
    EXPECT_EQ(readFile(request.final_path), transport->body());
}

TEST_F(DownloadEngineTest, CancelWhilePausedDeletesStaging) {
    transport->before_chunk = [this](std::uint64_t position, std::uint64_t) {
        if (position >= 400000) {
            handles.paused->store(true);
        }
    };

    auto result = std::async(std::launch::async, [this] { return engine->run(request, handles); });
    ASSERT_TRUE(sink.waitFor(isPausedEvent));
    EXPECT_TRUE(std::filesystem::exists(request.staging_path));

    handles.cancel->notify();
    ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(result.get(), DownloadResult::Cancelled);

    EXPECT_FALSE(std::filesystem::exists(request.staging_path));
    EXPECT_FALSE(std::filesystem::exists(request.final_path));
}

TEST_F(DownloadEngineTest, UnknownLengthReportsZeroPercent) {
    class NoLengthTransport final : public HttpTransport {
    public:
        TransferResult fetch(const HttpRequest&, ResponseHandler& handler) override {
            TransferResult result;
            result.status = 200;
            handler.onResponse(200, std::nullopt);
            handler.onData("abc", 3);
            result.completed = true;
            return result;
        }
    };

    DownloadEngine engine_without_length(std::make_shared<NoLengthTransport>(), sink, 10ms);
    EXPECT_EQ(engine_without_length.run(request, handles), DownloadResult::Completed);

    const auto values = progressValues();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values.front(), 0);
    EXPECT_EQ(readFile(request.final_path), "abc");
}

} // namespace installer::test
