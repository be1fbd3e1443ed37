#include "rangedl/download_session.hpp"
#include "rangedl/state_store.hpp"

#include "fake_transport.hpp"
#include "temp_dir.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace rangedl {
namespace {

using namespace std::chrono_literals;
using fakes::FakeFailure;
using fakes::FakeResource;
using fakes::FakeTransport;
using fakes::TempDir;
using fakes::waitUntil;
using ::testing::ElementsAre;

constexpr const char* kUrl = "http://example.com/archive.zip";

class DownloadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        body_ = fakes::makeBody(10'000);
        FakeResource resource;
        resource.body = body_;
        transport_->addResource(kUrl, resource);
        transport_->setBufferSize(256);
        target_ = dir_ / "out" / "archive.zip";
    }

    SessionOptions options(int connections = 4) const {
        SessionOptions opts;
        opts.url = kUrl;
        opts.filepath = target_;
        opts.connections = connections;
        opts.tuning.state_save_interval = 20ms;
        opts.tuning.supervise_interval = 5ms;
        opts.tuning.notify_interval = 0ms;
        opts.tuning.poll_interval = 5ms;
        opts.tuning.backoff = [](std::chrono::seconds, const TransferControl& control) {
            return !control.isCancelled();
        };
        return opts;
    }

    std::unique_ptr<DownloadSession> makeSession(SessionOptions opts) {
        return std::make_unique<DownloadSession>(
            transport_, std::move(opts),
            [this](std::uint64_t downloaded, std::uint64_t, double, std::uint64_t) {
                std::lock_guard<std::mutex> lock(mutex_);
                progress_.push_back(downloaded);
            },
            [this](DownloadStatus status) {
                std::lock_guard<std::mutex> lock(mutex_);
                statuses_.push_back(status);
            });
    }

    std::vector<DownloadStatus> statuses() {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    std::vector<std::uint64_t> progress() {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }

    void writeState(const std::string& url, std::vector<ChunkInfo> chunks) {
        std::filesystem::create_directories(StateStore::tempDirFor(target_));
        TransferState state;
        state.url = url;
        state.filepath = target_.string();
        state.total_size = body_.size();
        state.chunks = std::move(chunks);
        ASSERT_TRUE(StateStore(target_).save(state));
    }

    std::string body_;
    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    TempDir dir_;
    std::filesystem::path target_;
    std::mutex mutex_;
    std::vector<DownloadStatus> statuses_;
    std::vector<std::uint64_t> progress_;
};

TEST_F(DownloadSessionTest, DownloadsAndMergesChunks) {
    auto session = makeSession(options(4));
    session->run();

    EXPECT_THAT(statuses(), ElementsAre(DownloadStatus::Downloading, DownloadStatus::Merging,
                                        DownloadStatus::Completed));
    EXPECT_EQ(session->status(), DownloadStatus::Completed);
    EXPECT_EQ(fakes::readFile(target_), body_);
    EXPECT_FALSE(std::filesystem::exists(StateStore::tempDirFor(target_)));
    EXPECT_FALSE(std::filesystem::exists(StateStore::statePathFor(target_)));

    std::vector<std::uint64_t> offsets;
    for (const auto& request : transport_->requests()) {
        offsets.push_back(request.offset);
    }
    std::sort(offsets.begin(), offsets.end());
    EXPECT_THAT(offsets, ElementsAre(0u, 2500u, 5000u, 7500u));

    const Progress final_progress = session->getProgress();
    EXPECT_EQ(final_progress.total_bytes, body_.size());
    EXPECT_EQ(final_progress.downloaded_bytes, body_.size());
}

TEST_F(DownloadSessionTest, ProgressNeverGoesBackwards) {
    auto session = makeSession(options(8));
    session->run();

    const auto seen = progress();
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.back(), body_.size());
}

TEST_F(DownloadSessionTest, ResumesFromSavedState) {
    auto chunks = planChunks(body_.size(), true, 2);
    chunks[0].downloaded = chunks[0].length();
    chunks[0].completed = true;
    chunks[1].downloaded = 1000;
    writeState(kUrl, chunks);
    fakes::writeFile(ChunkWorker::chunkPath(StateStore::tempDirFor(target_), 0), body_.substr(0, 5000));
    fakes::writeFile(ChunkWorker::chunkPath(StateStore::tempDirFor(target_), 1), body_.substr(5000, 1000));

    auto session = makeSession(options(4));
    session->run();

    EXPECT_EQ(transport_->probeCount(), 0);
    const auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].offset, 6000u);
    EXPECT_EQ(requests[0].last_byte, 9999u);
    EXPECT_EQ(session->status(), DownloadStatus::Completed);
    EXPECT_EQ(fakes::readFile(target_), body_);
    EXPECT_EQ(progress().back(), body_.size());
}

TEST_F(DownloadSessionTest, StateAheadOfChunkFilesIsRepaired) {
    auto chunks = planChunks(body_.size(), true, 2);
    chunks[0].downloaded = chunks[0].length();
    chunks[0].completed = true;
    chunks[1].downloaded = 2000;
    writeState(kUrl, chunks);
    fakes::writeFile(ChunkWorker::chunkPath(StateStore::tempDirFor(target_), 0), body_.substr(0, 3000));
    fakes::writeFile(ChunkWorker::chunkPath(StateStore::tempDirFor(target_), 1), body_.substr(5000, 2000));

    auto session = makeSession(options(2));
    session->run();

    std::vector<std::uint64_t> offsets;
    for (const auto& request : transport_->requests()) {
        offsets.push_back(request.offset);
    }
    std::sort(offsets.begin(), offsets.end());
    EXPECT_THAT(offsets, ElementsAre(3000u, 7000u));
    EXPECT_EQ(session->status(), DownloadStatus::Completed);
    EXPECT_EQ(fakes::readFile(target_), body_);

    const auto seen = progress();
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.back(), body_.size());
}

TEST_F(DownloadSessionTest, StateForAnotherUrlIsIgnored) {
    auto chunks = planChunks(body_.size(), true, 2);
    chunks[0].downloaded = 100;
    writeState("http://example.com/other.zip", chunks);

    auto session = makeSession(options(4));
    session->run();

    EXPECT_EQ(transport_->probeCount(), 1);
    EXPECT_EQ(transport_->requests().size(), 4u);
    EXPECT_EQ(fakes::readFile(target_), body_);
}

TEST_F(DownloadSessionTest, FollowsProbeRedirect) {
    FakeResource redirect;
    redirect.body = body_;
    redirect.final_url = "http://cdn.example.com/archive.zip";
    transport_->addResource(kUrl, redirect);
    FakeResource actual;
    actual.body = body_;
    transport_->addResource("http://cdn.example.com/archive.zip", actual);

    auto session = makeSession(options(2));
    session->run();

    EXPECT_EQ(session->url(), "http://cdn.example.com/archive.zip");
    for (const auto& request : transport_->requests()) {
        EXPECT_EQ(request.url, "http://cdn.example.com/archive.zip");
    }
    EXPECT_EQ(fakes::readFile(target_), body_);
}

TEST_F(DownloadSessionTest, ProbeFailureFallsBackToOneStream) {
    FakeResource resource;
    resource.body = body_;
    resource.probe_ok = false;
    transport_->addResource(kUrl, resource);

    auto session = makeSession(options(8));
    session->run();

    const auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].offset, 0u);
    EXPECT_FALSE(requests[0].last_byte.has_value());
    EXPECT_EQ(session->status(), DownloadStatus::Completed);
    EXPECT_EQ(session->getProgress().total_bytes, body_.size());
    EXPECT_EQ(fakes::readFile(target_), body_);
}

TEST_F(DownloadSessionTest, StopKeepsStateForResume) {
    transport_->closeGate();
    auto session = makeSession(options(4));
    std::thread runner([&session] { session->run(); });

    EXPECT_TRUE(waitUntil([this] { return transport_->requests().size() == 4; }));
    session->stopAndSave();
    runner.join();

    EXPECT_EQ(session->status(), DownloadStatus::Stopped);
    EXPECT_THAT(statuses(), ElementsAre(DownloadStatus::Downloading, DownloadStatus::Stopped));
    EXPECT_FALSE(std::filesystem::exists(target_));
    const auto state = StateStore(target_).load();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->chunks.size(), 4u);
    EXPECT_TRUE(session->errorMessage().empty());
}

TEST_F(DownloadSessionTest, StoppedTransferResumesInNewSession) {
    transport_->setBufferSize(64);
    transport_->setDelayPerBuffer(1ms);
    auto first = makeSession(options(4));
    std::thread runner([&first] { first->run(); });
    EXPECT_TRUE(waitUntil([&first] { return first->getProgress().downloaded_bytes >= 2000; }));
    first->stopAndSave();
    runner.join();
    ASSERT_EQ(first->status(), DownloadStatus::Stopped);
    const std::uint64_t kept = first->getProgress().downloaded_bytes;

    transport_->setDelayPerBuffer(0ms);
    const std::size_t probes_before = transport_->probeCount();
    auto second = makeSession(options(4));
    second->run();

    EXPECT_EQ(static_cast<std::size_t>(transport_->probeCount()), probes_before);
    EXPECT_EQ(second->status(), DownloadStatus::Completed);
    EXPECT_EQ(fakes::readFile(target_), body_);
    EXPECT_GE(kept, 2000u);
}

TEST_F(DownloadSessionTest, ExhaustedChunkReportsError) {
    transport_->failNext(kUrl, FakeFailure{500}, 5);
    auto session = makeSession(options(1));
    session->run();

    EXPECT_EQ(session->status(), DownloadStatus::Error);
    EXPECT_THAT(session->errorMessage(), ::testing::HasSubstr("500"));
    EXPECT_EQ(statuses().back(), DownloadStatus::Error);
    EXPECT_FALSE(std::filesystem::exists(target_));
    EXPECT_TRUE(std::filesystem::exists(StateStore::statePathFor(target_)));
}

TEST_F(DownloadSessionTest, PauseAndResumeFinishTheSameTransfer) {
    transport_->setDelayPerBuffer(1ms);
    auto session = makeSession(options(2));
    std::thread runner([&session] { session->run(); });

    EXPECT_TRUE(waitUntil([&session] { return session->getProgress().downloaded_bytes > 0; }));
    session->pause();
    EXPECT_EQ(session->status(), DownloadStatus::Paused);

    std::this_thread::sleep_for(30ms);
    const std::uint64_t held = session->getProgress().downloaded_bytes;
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(session->getProgress().downloaded_bytes, held);

    session->resume();
    runner.join();

    EXPECT_EQ(session->status(), DownloadStatus::Completed);
    EXPECT_EQ(fakes::readFile(target_), body_);
    EXPECT_EQ(transport_->requests().size(), 2u);
    EXPECT_THAT(statuses(), ElementsAre(DownloadStatus::Downloading, DownloadStatus::Paused,
                                        DownloadStatus::Downloading, DownloadStatus::Merging,
                                        DownloadStatus::Completed));
}

TEST_F(DownloadSessionTest, CallbackMayPauseItsSession) {
    transport_->setDelayPerBuffer(1ms);
    DownloadSession* self = nullptr;
    std::atomic<bool> paused{false};
    DownloadSession session(
        transport_, options(2),
        [&self, &paused](std::uint64_t downloaded, std::uint64_t, double, std::uint64_t) {
            if (downloaded > 0 && !paused.load()) {
                self->pause();
                paused = true;
            }
        });
    self = &session;
    std::thread runner([&session] { session.run(); });

    EXPECT_TRUE(waitUntil([&paused] { return paused.load(); }));
    EXPECT_EQ(session.status(), DownloadStatus::Paused);
    session.resume();
    runner.join();

    EXPECT_EQ(session.status(), DownloadStatus::Completed);
    EXPECT_EQ(fakes::readFile(target_), body_);
}

TEST_F(DownloadSessionTest, ConnectionsAreClamped) {
    auto opts = options(100);
    auto session = makeSession(opts);
    session->run();
    EXPECT_EQ(session->chunks().size(), static_cast<std::size_t>(DownloadSession::kMaxConnections));
    EXPECT_EQ(fakes::readFile(target_), body_);
}

TEST_F(DownloadSessionTest, RunsOnlyOnce) {
    auto session = makeSession(options(2));
    session->run();
    session->run();
    EXPECT_EQ(transport_->requests().size(), 2u);
}

} // namespace
} // namespace rangedl
