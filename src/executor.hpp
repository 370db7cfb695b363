#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). CPU-bound fan-out (checksumming of
// large snapshots) submits work through this executor; request handling
// uses the service's BS::thread_pool so blocking fetches never occupy
// these workers.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

namespace diff_server::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace diff_server::detail
