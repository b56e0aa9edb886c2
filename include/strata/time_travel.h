/************************************************************************
Strata Time Travel

Resolves AT / BEFORE locators to the table state valid at that instant
or statement by walking the version chain from the head toward the root.
Walks never cross the table's retention boundary and never mutate state.
**************************************************************************/

#pragma once

#include <string>

#include <strata/catalog.h>
#include <strata/clock.h>
#include <strata/status.h>
#include <strata/version.h>

namespace strata {

/**
 * @brief Point-in-time reference for a read, clone or restore
 */
class Locator {
public:
    enum class Kind {
        kCurrent,          // the head
        kAtTime,           // AT(TIMESTAMP => ts)
        kAtOffset,         // AT(OFFSET => -d), i.e. AtTime(now - d)
        kAtStatement,      // AT(STATEMENT => ref)
        kBeforeStatement,  // BEFORE(STATEMENT => ref)
        kAtState,          // a specific state id
    };

    Locator() : kind_(Kind::kCurrent) {}

    static Locator Current() { return Locator(); }
    static Locator AtTime(Timestamp ts) { return Locator(Kind::kAtTime, ts, kNoState, ""); }
    static Locator AtOffset(Duration d) { return Locator(Kind::kAtOffset, d, kNoState, ""); }
    static Locator AtStatement(const std::string& ref) { return Locator(Kind::kAtStatement, 0, kNoState, ref); }
    static Locator BeforeStatement(const std::string& ref) { return Locator(Kind::kBeforeStatement, 0, kNoState, ref); }
    static Locator AtState(StateId id) { return Locator(Kind::kAtState, 0, id, ""); }

    Kind kind() const { return kind_; }
    Timestamp timestamp() const { return time_; }
    Duration offset() const { return time_; }
    StateId state_id() const { return state_id_; }
    const std::string& statement_ref() const { return statement_ref_; }

    std::string ToString() const;

private:
    Locator(Kind kind, uint64_t time, StateId state_id, std::string ref)
        : kind_(kind), time_(time), state_id_(state_id), statement_ref_(std::move(ref)) {}

    Kind kind_;
    uint64_t time_ = 0;
    StateId state_id_ = kNoState;
    std::string statement_ref_;
};

class TimeTravelResolver {
public:
    explicit TimeTravelResolver(const TableCatalog* catalog) : catalog_(catalog) {}

    /**
     * @brief Resolve a locator to a state of table_id
     *
     * Works on dropped tables by identity. Fails with kNotFound for an
     * unknown table and kOutOfRetention when the locator predates the
     * history still available.
     */
    Status Resolve(TableId table_id, const Locator& locator, StateId* state_id) const;

    // Resolve and fetch the state itself
    Status ResolveState(TableId table_id, const Locator& locator, TableStatePtr* state) const;

private:
    const TableCatalog* catalog_;
};

} // namespace strata
