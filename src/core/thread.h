#pragma once

// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Thread naming
// ---------------------------------------------------------------------------

/// Name the calling thread. Log lines carry the full name; the OS copy is
/// cut to 15 characters.
void set_thread_name(std::string_view name);

/// Name set for the calling thread, or an empty string.
const std::string& current_thread_name();

// ---------------------------------------------------------------------------
// ThreadGroup
// ---------------------------------------------------------------------------

/// Named threads, one per board worker. Bodies return on their own once
/// shutdown_requested() turns true.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    /// An exception escaping @p func is logged and ends that thread only.
    void create_thread(std::string name, std::function<void()> func);

    void join_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::thread> threads_;
};

} // namespace core
