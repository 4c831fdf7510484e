#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "Driver/BatchScheduler.h"
#include "Common/Error.h"

using namespace FJS;
using FJS::Driver::BatchScheduler;

namespace {

// Every dependency of a batch member that is itself scheduled must sit in an earlier batch
void expectDependencySafe(const std::vector<std::vector<std::string>>& batches,
                          const Import::DependencyGraph& graph) {
    std::map<std::string, size_t> batchOf;
    for (size_t i = 0; i < batches.size(); ++i) {
        for (const auto& file : batches[i]) {
            batchOf[file] = i;
        }
    }
    for (const auto& [file, index] : batchOf) {
        for (const auto& dependency : graph.dependenciesOf(file)) {
            auto it = batchOf.find(dependency);
            if (it != batchOf.end()) {
                EXPECT_LT(it->second, index) << file << " depends on " << dependency;
            }
        }
    }
}

Import::DependencyGraph sampleGraph() {
    Import::DependencyGraph graph;
    graph.addEdge("app", "home");
    graph.addEdge("app", "settings");
    graph.addEdge("home", "model");
    graph.addEdge("settings", "model");
    graph.addEdge("home", "theme");
    graph.addNode("util");
    return graph;
}

// Refuses to start any thread after the first `limit`
class LimitedScheduler : public BatchScheduler {
public:
    LimitedScheduler(size_t maxParallelism, int limit) : BatchScheduler(maxParallelism), limit_(limit) {}

protected:
    std::thread launch(std::function<void()> work) const override {
        if (launched_++ >= limit_) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return BatchScheduler::launch(std::move(work));
    }

private:
    int limit_;
    mutable int launched_ = 0;
};

} // namespace

TEST(BatchSchedulerTest, BatchesRespectDependenciesAndSize) {
    auto graph = sampleGraph();
    auto order = graph.topologicalSort();
    std::set<std::string> dirty(order.begin(), order.end());

    BatchScheduler scheduler(2);
    auto batches = scheduler.schedule(order, dirty, graph);

    std::set<std::string> scheduled;
    for (const auto& batch : batches) {
        EXPECT_FALSE(batch.empty());
        EXPECT_LE(batch.size(), 2u);
        scheduled.insert(batch.begin(), batch.end());
    }
    EXPECT_EQ(scheduled, dirty);
    expectDependencySafe(batches, graph);
}

TEST(BatchSchedulerTest, CleanFilesAreNotScheduled) {
    auto graph = sampleGraph();
    auto order = graph.topologicalSort();

    BatchScheduler scheduler(4);
    auto batches = scheduler.schedule(order, {"home", "app"}, graph);

    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0], std::vector<std::string>({"home"}));
    EXPECT_EQ(batches[1], std::vector<std::string>({"app"}));
}

TEST(BatchSchedulerTest, IndependentFilesShareABatch) {
    Import::DependencyGraph graph;
    for (const char* file : {"a", "b", "c"}) {
        graph.addNode(file);
    }
    auto order = graph.topologicalSort();

    auto batches = BatchScheduler(8).schedule(order, {"a", "b", "c"}, graph);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].size(), 3u);

    auto single = BatchScheduler(0).schedule(order, {"a", "b", "c"}, graph);
    EXPECT_EQ(single.size(), 3u);
}

TEST(BatchSchedulerTest, FilesOutsideOrderAreIgnored) {
    auto graph = sampleGraph();
    auto order = graph.topologicalSort();

    auto batches = BatchScheduler(4).schedule(order, {"ghost", "util"}, graph);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0], std::vector<std::string>({"util"}));
}

TEST(BatchSchedulerTest, UnschedulableCycleIsFatal) {
    Import::DependencyGraph graph;
    graph.addEdge("x", "y");
    graph.addEdge("y", "x");

    try {
        BatchScheduler(2).schedule({"x", "y"}, {"x", "y"}, graph);
        FAIL() << "expected FatalError";
    } catch (const Common::FatalError& e) {
        EXPECT_EQ(e.code(), Common::ErrorCode::CircularImport);
    }
}

TEST(BatchSchedulerTest, RunExecutesEveryFileAndCollectsFailures) {
    std::vector<std::string> batch = {"c.dart", "a.dart", "b.dart", "d.dart"};
    std::mutex mutex;
    std::set<std::string> seen;

    auto failures = BatchScheduler(4).run(batch, [&](const std::string& file) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(file);
        }
        if (file == "c.dart" || file == "a.dart") {
            throw std::runtime_error("cannot parse " + file);
        }
    });

    EXPECT_EQ(seen.size(), 4u);
    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].file, "a.dart");
    EXPECT_EQ(failures[0].message, "cannot parse a.dart");
    EXPECT_EQ(failures[1].file, "c.dart");
}

TEST(BatchSchedulerTest, SingleFileRunsInline) {
    std::atomic<int> calls{0};
    auto failures = BatchScheduler(4).run({"only.dart"}, [&](const std::string&) { ++calls; });
    EXPECT_TRUE(failures.empty());
    EXPECT_EQ(calls.load(), 1);
}

TEST(BatchSchedulerTest, FailedLaunchJoinsStartedThreads) {
    std::atomic<int> finished{0};
    LimitedScheduler scheduler(4, 2);

    EXPECT_THROW(scheduler.run({"a.dart", "b.dart", "c.dart", "d.dart"},
                               [&](const std::string&) { ++finished; }),
                 std::system_error);
    EXPECT_EQ(finished.load(), 2);
}
