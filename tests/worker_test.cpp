#include <gtest/gtest.h>
#include <memory>
#include <set>
#include "engine/worker.hpp"
#include "test_helpers.hpp"

using namespace testing_helpers;

namespace
{
    ImageTask task(const std::string &path, size_t index)
    {
        ImageTask t;
        t.path = path;
        t.index = index;
        return t;
    }

    std::vector<ClassificationResult> drain(BoundedQueue<ClassificationResult> &queue)
    {
        std::vector<ClassificationResult> results;
        ClassificationResult result;
        while (queue.pop(result, 10))
            results.push_back(result);
        return results;
    }
}

TEST(WorkerTest, ProcessesUntilQueueIsDrained)
{
    BoundedQueue<ImageTask> tasks(10);
    BoundedQueue<ClassificationResult> results(10);
    CancellationToken cancel;

    tasks.push(task("/photos/shot_1.png", 1));
    tasks.push(task("/photos/beach.jpg", 2));
    tasks.push(task("/photos/broken.jpg", 3));
    tasks.close();

    auto detector = std::make_unique<FakeDetector>();
    FakeDetector *fake = detector.get();
    Worker worker(1, std::move(detector), tasks, results, cancel);

    auto ready = worker.start();
    EXPECT_TRUE(ready.get());
    worker.join();

    EXPECT_EQ(worker.state(), WorkerState::TERMINATED);
    EXPECT_EQ(worker.processed(), 3u);
    EXPECT_TRUE(fake->terminated());

    std::vector<ClassificationResult> out = drain(results);
    ASSERT_EQ(out.size(), 3u);

    EXPECT_EQ(out[0].verdict, Verdict::SCREENSHOT);
    EXPECT_EQ(out[0].method, DetectionMethod::HORIZONTAL);
    EXPECT_EQ(out[0].worker_id, 1);
    EXPECT_EQ(out[1].verdict, Verdict::REGULAR);
    EXPECT_EQ(out[2].verdict, Verdict::ERROR);
    EXPECT_EQ(out[2].method, DetectionMethod::NONE);
    EXPECT_NE(out[2].error.find("broken.jpg"), std::string::npos);
}

TEST(WorkerTest, FailedInitializationTakesNoTasks)
{
    BoundedQueue<ImageTask> tasks(10);
    BoundedQueue<ClassificationResult> results(10);
    CancellationToken cancel;
    tasks.push(task("/photos/a.jpg", 1));

    Worker worker(2, std::make_unique<FakeDetector>(DetectionMethod::OCR, true), tasks, results, cancel);
    EXPECT_FALSE(worker.start().get());
    worker.join();

    EXPECT_EQ(worker.state(), WorkerState::TERMINATED);
    EXPECT_EQ(worker.initError(), "fake model missing");
    EXPECT_EQ(tasks.size(), 1u);
    EXPECT_EQ(results.size(), 0u);
}

TEST(WorkerTest, StopsOnCancellation)
{
    BoundedQueue<ImageTask> tasks(10);
    BoundedQueue<ClassificationResult> results(10);
    CancellationToken cancel;

    // Queue stays open, so only cancellation can end the worker
    Worker worker(3, std::make_unique<FakeDetector>(), tasks, results, cancel);
    ASSERT_TRUE(worker.start().get());

    cancel.cancel();
    worker.join();
    EXPECT_EQ(worker.state(), WorkerState::TERMINATED);
}

TEST(WorkerTest, ClosedResultChannelEndsWorker)
{
    BoundedQueue<ImageTask> tasks(10);
    BoundedQueue<ClassificationResult> results(1);
    CancellationToken cancel;

    for (size_t i = 1; i <= 5; i++)
        tasks.push(task("/photos/img" + std::to_string(i) + ".jpg", i));

    Worker worker(4, std::make_unique<FakeDetector>(), tasks, results, cancel);
    ASSERT_TRUE(worker.start().get());

    // Nobody reads results; closing the channel must still let the worker finish
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    results.close();
    worker.join();

    EXPECT_EQ(worker.state(), WorkerState::TERMINATED);
    EXPECT_LT(worker.processed(), 5u);
}

TEST(WorkerTest, StateNames)
{
    EXPECT_EQ(toString(WorkerState::INITIALIZING), "initializing");
    EXPECT_EQ(toString(WorkerState::BUSY), "busy");
    EXPECT_EQ(toString(WorkerState::TERMINATED), "terminated");
}
