#pragma once

// ============================================================
// task_set.hpp -- Header-only set of joinable worker tasks
// ============================================================

#include <map>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <exception>
#include <stdexcept>
#include <utility>
#include <cstdint>

// Each spawned task runs on its own thread. Completions are collected in
// finishing order so callers can await "any one" task, which is what a
// spawn-then-wait-when-full gate needs. A task's exception is captured and
// handed back by join_next(), never rethrown on the worker thread.
class TaskSet {
public:
    TaskSet() = default;

    ~TaskSet() {
        drain();
    }

    TaskSet(const TaskSet&) = delete;
    TaskSet& operator=(const TaskSet&) = delete;

    void spawn(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = next_id_++;
        workers_.emplace(id, std::thread([this, id, fn = std::move(fn)] {
            std::exception_ptr err;
            try {
                fn();
            } catch (...) {
                err = std::current_exception();
            }
            {
                std::lock_guard<std::mutex> lk(mutex_);
                done_.emplace_back(id, err);
            }
            cv_.notify_all();
        }));
    }

    // Block until any task completes; returns its error (null on success).
    std::exception_ptr join_next() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (workers_.empty()) {
            throw std::logic_error("TaskSet::join_next on empty set");
        }
        cv_.wait(lock, [this] { return !done_.empty(); });
        return reap_front(lock);
    }

    // Join one already-completed task without blocking.
    bool try_join_next(std::exception_ptr& err) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (done_.empty()) return false;
        err = reap_front(lock);
        return true;
    }

    // Await every outstanding task; returns the first error observed.
    std::exception_ptr drain() {
        std::exception_ptr first;
        while (!empty()) {
            std::exception_ptr err = join_next();
            if (err && !first) first = err;
        }
        return first;
    }

    // Spawned and not yet joined (running or completed).
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return workers_.size();
    }

    bool empty() const { return size() == 0; }

private:
    std::exception_ptr reap_front(std::unique_lock<std::mutex>& lock) {
        auto entry = std::move(done_.front());
        done_.pop_front();
        std::thread t = std::move(workers_[entry.first]);
        workers_.erase(entry.first);
        lock.unlock();
        t.join();
        return entry.second;
    }

    std::map<uint64_t, std::thread>                        workers_;
    std::deque<std::pair<uint64_t, std::exception_ptr>>    done_;
    mutable std::mutex                                     mutex_;
    std::condition_variable                                cv_;
    uint64_t                                               next_id_{0};
};
