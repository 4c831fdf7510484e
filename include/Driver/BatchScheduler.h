#pragma once
#include <string>
#include <vector>
#include <set>
#include <functional>
#include <thread>
#include "../Import/DependencyGraph.h"

namespace FJS {
namespace Driver {

struct TaskFailure {
    std::string file;
    std::string message;
};

/**
 * Groups dirty files into dependency-ordered batches and runs each batch
 * on its own set of threads.
 *
 * A file enters a batch only once every file it imports is satisfied:
 * either not dirty, or a member of an already closed batch. Files inside
 * one batch therefore never depend on each other. run() joins every task
 * before returning, which is the barrier between consecutive batches.
 */
class BatchScheduler {
public:
    explicit BatchScheduler(size_t maxParallelism);
    virtual ~BatchScheduler() = default;

    /**
     * Partition the dirty files of `order` into batches of at most
     * maxParallelism files
     * @param order Topological order of the whole graph
     * @param dirty Files needing work; files outside `order` are ignored
     * @throws Common::FatalError if some dirty file can never be admitted
     */
    std::vector<std::vector<std::string>> schedule(const std::vector<std::string>& order,
                                                   const std::set<std::string>& dirty,
                                                   const Import::DependencyGraph& graph) const;

    /**
     * Run task once per file of the batch, one thread per file, and wait for
     * all of them. An exception thrown by a task becomes a TaskFailure.
     * If starting a thread fails, the threads already started are joined
     * and the std::system_error propagates.
     */
    std::vector<TaskFailure> run(const std::vector<std::string>& batch,
                                 const std::function<void(const std::string&)>& task) const;

    size_t maxParallelism() const { return maxParallelism_; }

protected:
    // Start one worker thread
    virtual std::thread launch(std::function<void()> work) const;

private:
    size_t maxParallelism_;
};

} // namespace Driver
} // namespace FJS
