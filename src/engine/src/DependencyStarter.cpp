#include "DependencyStarter.hpp"
#include "LogUtils.hpp"
#include "OrchestrationErrors.hpp"
#include <algorithm>
#include <thread>
#include <unordered_map>

DependencyStarter::DependencyStarter(const std::vector<DependencyStartup>& startups, size_t concurrency)
    : concurrency_(std::max<size_t>(1, concurrency)),
      remaining_(startups.size()) {

    std::unordered_map<std::string, StartupNode*> by_name;
    for (const auto& startup : startups) {
        auto node = std::make_unique<StartupNode>();
        node->startup = &startup;
        by_name[startup.container] = node.get();
        nodes_.push_back(std::move(node));
    }

    for (const auto& node : nodes_) {
        for (const auto& dependency : node->startup->depends_on) {
            auto it = by_name.find(dependency);
            if (it == by_name.end()) {
                throw ConfigGraphError("Container '" + node->startup->container +
                                       "' waits for '" + dependency + "', which is not part of the stage");
            }
            it->second->successors.push_back(node.get());
            node->in_degree.fetch_add(1);
        }
    }

    // Every node must become reachable, otherwise workers would wait forever
    std::vector<int> degrees;
    std::vector<StartupNode*> ready;
    std::unordered_map<StartupNode*, size_t> index;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        index[nodes_[i].get()] = i;
        degrees.push_back(nodes_[i]->in_degree.load());
        if (degrees.back() == 0) ready.push_back(nodes_[i].get());
    }
    size_t reached = 0;
    while (!ready.empty()) {
        StartupNode* node = ready.back();
        ready.pop_back();
        ++reached;
        for (auto* successor : node->successors) {
            if (--degrees[index[successor]] == 0) ready.push_back(successor);
        }
    }
    if (reached != nodes_.size()) {
        throw ConfigGraphError("Dependency containers of the stage contain a cycle");
    }

    // Initialize queue
    for (const auto& node : nodes_) {
        if (node->in_degree.load() == 0) {
            queue_.enqueue(node.get());
        }
    }
}

void DependencyStarter::run(const StartFunction& start) {
    if (nodes_.empty()) return;

    const size_t worker_count = std::min(concurrency_, nodes_.size());
    std::vector<std::thread> workers;
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([this, &start] { worker_loop(start); });
    }

    // Wait for all startups to complete
    {
        std::unique_lock<std::mutex> lock(done_mutex_);
        done_cv_.wait(lock, [this] { return remaining_.load() == 0 || stop_execution_.load(); });
    }

    // Stop queue and wait for threads
    queue_.stop();
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    if (first_error_) {
        std::rethrow_exception(first_error_);
    }
}

void DependencyStarter::record_failure(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        if (!first_error_) {
            first_error_ = error;
        }
        stop_execution_.store(true);
    }
    queue_.stop();
    done_cv_.notify_all();
}

void DependencyStarter::worker_loop(const StartFunction& start) {
    while (true) {
        if (stop_execution_.load()) return;

        auto next = queue_.dequeue();
        if (!next) return;
        StartupNode* node = *next;

        try {
            start(*node->startup);
        } catch (const std::exception& e) {
            LogUtils::debug("Startup of '{}' failed: {}", node->startup->container, e.what());
            record_failure(std::current_exception());
            return;
        }

        // Update successor nodes
        for (auto* successor : node->successors) {
            int prev = successor->in_degree.fetch_sub(1);
            if (prev == 1) { // Now in-degree is 0
                queue_.enqueue(successor);
            }
        }

        size_t left = remaining_.fetch_sub(1);
        if (left == 1) {
            std::lock_guard<std::mutex> lock(done_mutex_);
            done_cv_.notify_all();
        }
    }
}
