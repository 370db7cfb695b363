/// @file diff_server.hpp
/// @brief Umbrella header for the diff-server library.
///
/// Include this single header for access to all public types:
/// Snapshot, Patch, ContentStore, CommitLog, ClientViewGetter,
/// AccountRegistry, ServerConfig, Service, and Error.

#pragma once

#include <diff-server/account.hpp>
#include <diff-server/client_view.hpp>
#include <diff-server/commit.hpp>
#include <diff-server/commit_log.hpp>
#include <diff-server/config.hpp>
#include <diff-server/error.hpp>
#include <diff-server/http.hpp>
#include <diff-server/log.hpp>
#include <diff-server/patch.hpp>
#include <diff-server/pull.hpp>
#include <diff-server/service.hpp>
#include <diff-server/snapshot.hpp>
#include <diff-server/store.hpp>
#include <diff-server/types.hpp>
