// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/thread.h"
#include "core/logging.h"

#include <exception>
#include <utility>

#include <pthread.h>

namespace core {

namespace {

thread_local std::string t_thread_name;

// Linux limits the kernel-visible name to 15 bytes plus NUL.
constexpr size_t OS_THREAD_NAME_MAX = 15;

} // anonymous namespace

void set_thread_name(std::string_view name) {
    t_thread_name.assign(name);
    const std::string os_name{name.substr(0, OS_THREAD_NAME_MAX)};
    pthread_setname_np(pthread_self(), os_name.c_str());
}

const std::string& current_thread_name() {
    return t_thread_name;
}

ThreadGroup::~ThreadGroup() {
    join_all();
}

void ThreadGroup::create_thread(std::string name, std::function<void()> func) {
    std::lock_guard<std::mutex> guard(mutex_);
    threads_.emplace_back([name = std::move(name), func = std::move(func)] {
        set_thread_name(name);
        LOG_DEBUG(LogCategory::NONE, "thread " + name + " started");
        try {
            func();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::NONE,
                      "thread " + name + " stopped by exception: " + e.what());
        }
        LOG_DEBUG(LogCategory::NONE, "thread " + name + " exiting");
    });
}

void ThreadGroup::join_all() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        joining.swap(threads_);
    }
    // Joined without the lock held; a body may still call create_thread().
    for (auto& t : joining) {
        if (t.joinable()) t.join();
    }
}

size_t ThreadGroup::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return threads_.size();
}

} // namespace core
