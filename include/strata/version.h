/************************************************************************
Strata Version Chain types

A table's history is a parent-linked chain of immutable TableStates.
Each state names the full set of segments visible in it; writes never
alter a segment, they append a state that references a different set.
**************************************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <strata/clock.h>
#include <strata/options.h>
#include <strata/segment_store.h>

namespace strata {

using TableId = uint64_t;
using SchemaId = uint64_t;

constexpr StateId kNoState = 0;
constexpr TableId kNoTable = 0;

enum class OperationKind {
    kInsert,
    kUpdate,
    kDelete,
    kDdl,
    kClone,
};

const char* OperationKindToString(OperationKind kind);
bool OperationKindFromString(const std::string& name, OperationKind* kind);

/**
 * @brief Changes a new state applies on top of its parent
 *
 * The resulting segment set is
 *   (replaces_parent ? {} : parent.segments - removed) + added
 */
struct StateEdit {
    std::vector<SegmentId> added;
    std::vector<SegmentId> removed;   // tombstones relative to the parent
    bool replaces_parent = false;     // restore / CREATE TABLE AS

    static StateEdit Add(std::vector<SegmentId> segments) {
        StateEdit edit;
        edit.added = std::move(segments);
        return edit;
    }

    static StateEdit Replace(std::vector<SegmentId> segments) {
        StateEdit edit;
        edit.added = std::move(segments);
        edit.replaces_parent = true;
        return edit;
    }
};

/**
 * @brief One immutable version of a table's content (a commit)
 */
struct TableState {
    StateId state_id = kNoState;
    StateId parent_state_id = kNoState;
    TableId table_id = kNoTable;

    std::vector<SegmentId> segments;     // full visible set, in scan order
    std::vector<SegmentId> added;
    std::vector<SegmentId> tombstones;
    bool replaces_parent = false;

    OperationKind operation = OperationKind::kDdl;
    Timestamp created_at = 0;
    std::string statement_ref;
};

using TableStatePtr = std::shared_ptr<const TableState>;

/**
 * @brief Catalog row for a table identity
 */
struct TableEntry {
    TableId table_id = kNoTable;
    std::string name;
    SchemaId schema_id = 0;
    StateId head_state_id = kNoState;
    Duration retention = 0;
    Timestamp created_at = 0;
    Timestamp dropped_at = 0;   // 0 while the table is live

    bool dropped() const { return dropped_at != 0; }
};

struct CloneRecord {
    TableId new_table_id = kNoTable;
    TableId source_table_id = kNoTable;
    StateId source_state_id = kNoState;
    Timestamp created_at = 0;
};

} // namespace strata
