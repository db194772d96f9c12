#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "ExecutionPlanner.hpp"
#include "ThreadSafeQueue.hpp"

// Starts the dependency containers of a stage on a worker pool. A container is
// queued once everything it depends on is ready; the first failure stops the
// pool and is rethrown after every worker has been joined.
class DependencyStarter {
public:
    // Creates, starts and waits for one container; throws on failure
    using StartFunction = std::function<void(const DependencyStartup&)>;

    DependencyStarter(const std::vector<DependencyStartup>& startups, size_t concurrency);

    DependencyStarter(const DependencyStarter&) = delete;
    DependencyStarter& operator=(const DependencyStarter&) = delete;

    void run(const StartFunction& start);

    // Set once any startup failed; long waits poll this to give up early
    bool has_failure() const { return stop_execution_.load(); }

private:
    struct StartupNode {
        const DependencyStartup* startup = nullptr;
        std::atomic<int> in_degree{0};
        std::vector<StartupNode*> successors;
    };

    void worker_loop(const StartFunction& start);
    void record_failure(std::exception_ptr error);

    size_t concurrency_;
    std::vector<std::unique_ptr<StartupNode>> nodes_;
    ThreadSafeQueue<StartupNode*> queue_;
    std::atomic<size_t> remaining_;
    std::mutex done_mutex_;
    std::condition_variable done_cv_;

    std::atomic<bool> stop_execution_{false};
    std::exception_ptr first_error_;
};
