/************************************************************************
Strata Options
Store-wide, per-table and per-write configuration
**************************************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <strata/clock.h>

namespace strata {

using StateId = uint64_t;

// Store-wide options
struct StoreOptions {
    // Directory holding segments and manifests. Empty keeps everything in memory.
    std::string db_path;

    // Retention applied to tables created without an explicit override
    // (DATA_RETENTION_TIME_IN_DAYS = 1)
    Duration default_retention = kMicrosPerDay;

    // Upper bound for per-table retention
    Duration max_retention = 90 * kMicrosPerDay;

    // fsync the manifest after every appended record
    bool sync_manifest = false;

    // Time source for created_at / dropped_at. Null means SystemClock.
    std::shared_ptr<Clock> clock;

    // User created on first open and granted ACCOUNTADMIN
    std::string admin_user = "ADMIN";
};

// Per-table options, fixed at CREATE TABLE / CLONE time
struct TableOptions {
    // Overrides StoreOptions::default_retention when set
    std::optional<Duration> retention;
};

// Write options
struct WriteOptions {
    // Parent the new state must extend. When unset the head observed at the
    // start of the call is used; a concurrent commit still yields kConflict.
    std::optional<StateId> expected_head;

    // Opaque id correlating the new state to the statement that produced it.
    // Generated when empty.
    std::string statement_ref;
};

} // namespace strata
