#include "Driver/BatchScheduler.h"
#include "Common/Error.h"
#include "Common/Debug.h"
#include <algorithm>
#include <list>
#include <mutex>
#include <thread>
#include <utility>

namespace FJS {
namespace Driver {

namespace {

// Joins every started thread when it goes out of scope, also while a later launch unwinds
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() {
        for (auto& thread : threads_) {
            if (thread.joinable()) thread.join();
        }
    }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

private:
    std::vector<std::thread>& threads_;
};

} // anonymous namespace

BatchScheduler::BatchScheduler(size_t maxParallelism)
    : maxParallelism_(maxParallelism == 0 ? 1 : maxParallelism) {}

std::vector<std::vector<std::string>> BatchScheduler::schedule(const std::vector<std::string>& order,
                                                               const std::set<std::string>& dirty,
                                                               const Import::DependencyGraph& graph) const {
    std::set<std::string> inOrder(order.begin(), order.end());
    std::set<std::string> satisfied;
    std::list<std::string> pending;

    for (const auto& file : order) {
        if (dirty.count(file) > 0) {
            pending.push_back(file);
        } else {
            satisfied.insert(file);
        }
    }

    auto isReady = [&](const std::string& file) {
        for (const auto& dependency : graph.dependenciesOf(file)) {
            // Dependencies outside the ordered set have nothing to wait for
            if (inOrder.count(dependency) > 0 && satisfied.count(dependency) == 0) {
                return false;
            }
        }
        return true;
    };

    std::vector<std::vector<std::string>> batches;
    std::vector<std::string> current;

    auto closeBatch = [&]() {
        satisfied.insert(current.begin(), current.end());
        batches.push_back(std::move(current));
        current.clear();
    };

    while (!pending.empty()) {
        bool progress = false;
        for (auto it = pending.begin(); it != pending.end();) {
            if (!isReady(*it)) {
                ++it;
                continue;
            }
            current.push_back(*it);
            it = pending.erase(it);
            progress = true;
            if (current.size() >= maxParallelism_) {
                closeBatch();
            }
        }
        if (!current.empty()) {
            closeBatch();
        }
        if (!progress) {
            throw Common::FatalError(Common::ErrorCode::CircularImport,
                                     "Cannot schedule " + std::to_string(pending.size()) +
                                     " files: unresolved dependency cycle at " + pending.front());
        }
    }

    DEBUG_OUT("Scheduled " << dirty.size() << " dirty files into " << batches.size() << " batches" << std::endl);
    return batches;
}

std::vector<TaskFailure> BatchScheduler::run(const std::vector<std::string>& batch,
                                             const std::function<void(const std::string&)>& task) const {
    std::vector<TaskFailure> failures;
    std::mutex failuresMutex;

    auto guarded = [&](const std::string& file) {
        try {
            task(file);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(failuresMutex);
            failures.push_back({file, e.what()});
        } catch (...) {
            std::lock_guard<std::mutex> lock(failuresMutex);
            failures.push_back({file, "unknown exception"});
        }
    };

    if (batch.size() == 1) {
        guarded(batch.front());
        return failures;
    }

    std::vector<std::thread> threads;
    threads.reserve(batch.size());
    {
        ThreadJoiner joiner(threads);
        for (const auto& file : batch) {
            threads.push_back(launch([&guarded, &file] { guarded(file); }));
        }
    }

    // Thread completion order is arbitrary
    std::sort(failures.begin(), failures.end(),
              [](const TaskFailure& a, const TaskFailure& b) { return a.file < b.file; });
    return failures;
}

std::thread BatchScheduler::launch(std::function<void()> work) const {
    return std::thread(std::move(work));
}

} // namespace Driver
} // namespace FJS
