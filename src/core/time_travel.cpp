#include "strata/time_travel.h"

#include "strata/logging.h"

namespace strata {

STRATA_LOG_TAG(TimeTravel);

std::string Locator::ToString() const {
    switch (kind_) {
        case Kind::kCurrent:
            return "CURRENT";
        case Kind::kAtTime:
            return "AT(TIMESTAMP => " + std::to_string(time_) + ")";
        case Kind::kAtOffset:
            return "AT(OFFSET => -" + std::to_string(time_) + ")";
        case Kind::kAtStatement:
            return "AT(STATEMENT => '" + statement_ref_ + "')";
        case Kind::kBeforeStatement:
            return "BEFORE(STATEMENT => '" + statement_ref_ + "')";
        case Kind::kAtState:
            return "AT(STATE => " + std::to_string(state_id_) + ")";
    }
    return "UNKNOWN";
}

Status TimeTravelResolver::Resolve(TableId table_id, const Locator& locator, StateId* state_id) const {
    if (!state_id) {
        return Status::InvalidArgument("Null output state id");
    }

    if (locator.kind() == Locator::Kind::kCurrent) {
        TableEntry entry;
        STRATA_RETURN_NOT_OK(catalog_->GetTable(table_id, &entry));
        *state_id = entry.head_state_id;
        return Status::OK();
    }

    const Timestamp now = catalog_->Now();

    Locator effective = locator;
    if (locator.kind() == Locator::Kind::kAtOffset) {
        effective = Locator::AtTime(now > locator.offset() ? now - locator.offset() : 0);
    }
    if (effective.kind() == Locator::Kind::kAtTime && effective.timestamp() > now) {
        return Status::InvalidArgument("Time travel target " + std::to_string(effective.timestamp()) +
                                       " is in the future");
    }

    StateId found = kNoState;
    StateId wanted_parent = kNoState;   // BEFORE: set once the statement is seen
    bool crossed_boundary = false;
    bool before_time = false;
    TableStatePtr successor;

    Status walk = catalog_->WalkChain(table_id, [&](const TableEntry& entry, const TableStatePtr& state) {
        const Timestamp boundary = now > entry.retention ? now - entry.retention : 0;

        if (effective.kind() == Locator::Kind::kAtTime && effective.timestamp() < boundary) {
            before_time = true;
            return false;
        }

        // Resolvable while it was current at some instant inside the window
        if (successor && successor->created_at < boundary) {
            crossed_boundary = true;
            return false;
        }
        successor = state;

        switch (effective.kind()) {
            case Locator::Kind::kAtTime:
                if (state->created_at <= effective.timestamp()) {
                    found = state->state_id;
                    return false;
                }
                return true;
            case Locator::Kind::kAtStatement:
                if (state->statement_ref == effective.statement_ref()) {
                    found = state->state_id;
                    return false;
                }
                return true;
            case Locator::Kind::kAtState:
                if (state->state_id == effective.state_id()) {
                    found = state->state_id;
                    return false;
                }
                return true;
            case Locator::Kind::kBeforeStatement:
                if (wanted_parent != kNoState) {
                    found = state->state_id;
                    return false;
                }
                if (state->statement_ref == effective.statement_ref()) {
                    if (state->parent_state_id == kNoState) {
                        crossed_boundary = true;
                        return false;
                    }
                    wanted_parent = state->parent_state_id;
                }
                return true;
            default:
                return false;
        }
    });
    STRATA_RETURN_NOT_OK(walk);

    if (found != kNoState) {
        *state_id = found;
        return Status::OK();
    }

    STRATA_LOG_DEBUG(TimeTravel) << "No state of table " << table_id << " for " << effective.ToString();

    if (before_time || crossed_boundary || wanted_parent != kNoState ||
        effective.kind() == Locator::Kind::kAtTime) {
        return Status::OutOfRetention("Time travel data for " + effective.ToString() +
                                      " is not available for table " + std::to_string(table_id));
    }

    // The walk covered the whole chain inside retention, or stopped where
    // purged history begins
    if (successor && successor->parent_state_id != kNoState) {
        return Status::OutOfRetention("Time travel data for " + effective.ToString() +
                                      " has been purged for table " + std::to_string(table_id));
    }
    return Status::NotFound("No state of table " + std::to_string(table_id) + " matches " +
                            effective.ToString());
}

Status TimeTravelResolver::ResolveState(TableId table_id, const Locator& locator, TableStatePtr* state) const {
    StateId state_id = kNoState;
    STRATA_RETURN_NOT_OK(Resolve(table_id, locator, &state_id));
    return catalog_->GetState(state_id, state);
}

} // namespace strata
