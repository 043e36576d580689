// ============================================================================
// heir/heir.hpp - Main Include Header
// ============================================================================
//
// Inheritable task-locals for C++20 coroutines.
//
// USAGE:
// ------
//   #include <heir/heir.hpp>
//
//   inline heir::InheritableLocal<int> kDepth{"depth"};
//
// ============================================================================

#pragma once

// Core
#include "heir/core/check.hpp"
#include "heir/core/error.hpp"
#include "heir/core/result.hpp"
#include "heir/core/spawn.hpp"
#include "heir/core/task.hpp"

// Executor boundary
#include "heir/exec/executor.hpp"
#include "heir/exec/timer.hpp"
#include "heir/exec/yield.hpp"

// Inheritable locals
#include "heir/local/cell.hpp"
#include "heir/local/inherit.hpp"
#include "heir/local/inheritable_local.hpp"
#include "heir/local/registry.hpp"
#include "heir/local/snapshot.hpp"

// Sync/async bridge
#include "heir/sync/sync_wait.hpp"
