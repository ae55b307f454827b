#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <vector>

#include "TestUtils.hpp"
#include "core/events/EventSystem.hpp"
#include "core/ingest/IngestionPipeline.hpp"
#include "core/watch/DirectoryWatcher.hpp"

using namespace core::ingest;
using core::events::Event;
using core::events::EventType;
using core::watch::FileEvent;
using core::watch::FileEventKind;
using test_utils::EXPORT_HEADER;
using test_utils::failRow;
using test_utils::passRow;

namespace {
    class RecordingObserver : public core::events::IEventObserver {
    public:
        void onEvent(const Event &event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }

        std::vector<Event> events(EventType type) const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Event> matching;
            for (const auto &event: events_) {
                if (event.type == type) matching.push_back(event);
            }
            return matching;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<Event> events_;
    };
}

class IngestionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        reader = std::make_shared<IncrementalFileReader>();
        aggregator = std::make_shared<PrinterAggregator>();
        pipeline = std::make_unique<IngestionPipeline>(reader, aggregator, bus);
        observer = std::make_shared<RecordingObserver>();
        bus.subscribe(observer);
    }

    test_utils::TempDir dir;
    core::events::EventBus bus;
    std::shared_ptr<IncrementalFileReader> reader;
    std::shared_ptr<PrinterAggregator> aggregator;
    std::unique_ptr<IngestionPipeline> pipeline;
    std::shared_ptr<RecordingObserver> observer;
};

TEST_F(IngestionPipelineTest, EmptyFilePublishesNothing) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, EXPORT_HEADER);

    pipeline->onFileEvent(FileEvent{FileEventKind::Created, path});

    EXPECT_TRUE(observer->events(EventType::COUNTERS_UPDATED).empty());
    EXPECT_EQ(aggregator->printerCount(), 0u);
}

TEST_F(IngestionPipelineTest, PublishesCumulativeCountersPerBatch) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1") + failRow("P1") + passRow("P1"));

    pipeline->onFileEvent(FileEvent{FileEventKind::Created, path});

    auto updates = observer->events(EventType::COUNTERS_UPDATED);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].source, path);
    EXPECT_EQ(updates[0].counters.at("P1"), (PrinterCounters{"P1", 2, 1}));

    test_utils::appendFile(path, failRow("P1") + passRow("P1"));
    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, path});

    updates = observer->events(EventType::COUNTERS_UPDATED);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[1].counters.at("P1"), (PrinterCounters{"P1", 3, 2}));
    EXPECT_EQ(reader->cursor(path)->rowsConsumed, 5u);
}

TEST_F(IngestionPipelineTest, DuplicateNotificationDoesNotRecount) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1"));

    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, path});
    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, path});

    EXPECT_EQ(observer->events(EventType::COUNTERS_UPDATED).size(), 1u);
    EXPECT_EQ(aggregator->counters("P1").cumulativePass, 1);
}

TEST_F(IngestionPipelineTest, CreatedEventRestartsFileFromFirstRow) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1") + passRow("P1"));
    pipeline->onFileEvent(FileEvent{FileEventKind::Created, path});

    // Same name, new file with as many rows as before
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1") + failRow("P1"));
    pipeline->onFileEvent(FileEvent{FileEventKind::Created, path});

    EXPECT_EQ(aggregator->counters("P1"), (PrinterCounters{"P1", 3, 1}));
}

TEST_F(IngestionPipelineTest, MissingFilePublishesAccessFailure) {
    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, dir.file("gone.csv")});

    EXPECT_EQ(observer->events(EventType::FILE_ACCESS_FAILED).size(), 1u);
    EXPECT_TRUE(observer->events(EventType::COUNTERS_UPDATED).empty());
    EXPECT_EQ(pipeline->getStatistics().failedPasses, 1u);
}

TEST_F(IngestionPipelineTest, ShrinkIsReported) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1") + passRow("P1"));
    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, path});

    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1"));
    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, path});

    EXPECT_EQ(observer->events(EventType::FILE_SHRINK_DETECTED).size(), 1u);
    EXPECT_EQ(aggregator->counters("P1").cumulativePass, 3);
}

TEST_F(IngestionPipelineTest, CountsAcrossFilesForSamePrinter) {
    const auto a = dir.file("a.csv");
    const auto b = dir.file("b.csv");
    test_utils::writeFile(a, std::string(EXPORT_HEADER) + passRow("P1"));
    test_utils::writeFile(b, std::string(EXPORT_HEADER) + passRow("P1") + failRow("P2"));

    pipeline->onFileEvent(FileEvent{FileEventKind::Created, a});
    pipeline->onFileEvent(FileEvent{FileEventKind::Created, b});

    auto snapshot = aggregator->snapshot();
    EXPECT_EQ(snapshot.at("P1").cumulativePass, 2);
    EXPECT_EQ(snapshot.at("P2").cumulativeFail, 1);
    EXPECT_EQ(pipeline->getStatistics().batchesPublished, 2u);
}

TEST_F(IngestionPipelineTest, ExistingEventSkipsHistoryAndCountsOnlyAppendedRows) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1") + passRow("P1") + passRow("P1"));

    pipeline->onFileEvent(FileEvent{FileEventKind::Existing, path});

    EXPECT_TRUE(observer->events(EventType::COUNTERS_UPDATED).empty());
    EXPECT_EQ(aggregator->printerCount(), 0u);
    EXPECT_EQ(reader->cursor(path)->rowsConsumed, 3u);

    test_utils::appendFile(path, passRow("P1"));
    pipeline->onFileEvent(FileEvent{FileEventKind::Modified, path});

    EXPECT_EQ(aggregator->counters("P1").cumulativePass, 1);
}

TEST_F(IngestionPipelineTest, WatcherStartupIgnoresRowsAlreadyInExports) {
    const auto path = dir.file("log.csv");
    test_utils::writeFile(path, std::string(EXPORT_HEADER) + passRow("P1") + passRow("P1") + passRow("P1"));

    core::watch::WatchOptions options;
    options.directory = dir.path();
    options.processExisting = false;
    core::watch::DirectoryWatcher watcher(options, [this](const FileEvent &event) {
        pipeline->onFileEvent(event);
    });

    watcher.pollOnce();
    test_utils::appendFile(path, passRow("P1"));
    watcher.pollOnce();

    EXPECT_EQ(aggregator->counters("P1").cumulativePass, 1);
    EXPECT_EQ(aggregator->counters("P1").cumulativeFail, 0);
    EXPECT_EQ(observer->events(EventType::COUNTERS_UPDATED).size(), 1u);
}

TEST_F(IngestionPipelineTest, UnreadableExistingFileReportsAccessFailure) {
    const auto path = dir.file("missing.csv");

    pipeline->onFileEvent(FileEvent{FileEventKind::Existing, path});

    EXPECT_EQ(observer->events(EventType::FILE_ACCESS_FAILED).size(), 1u);
    EXPECT_EQ(pipeline->getStatistics().failedPasses, 1u);
}
