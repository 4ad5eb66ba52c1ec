#include <pulsegraph/util/lifecycle.h>

namespace pulsegraph {
    std::string_view to_string(LifeCycleState state) {
        switch (state) {
            case LifeCycleState::UNINITIALIZED: return "Uninitialized";
            case LifeCycleState::REINITIALIZE_REQUESTED: return "ReinitializeRequested";
            case LifeCycleState::RESET_REQUESTED: return "ResetRequested";
            case LifeCycleState::HISTORY_INVALIDATED: return "HistoryInvalidated";
            case LifeCycleState::INITIALIZED: return "Initialized";
        }
        return "Unknown";
    }

    bool NodeLifeCycle::is_initialized() const { return _initialized; }

    bool NodeLifeCycle::reinitialize_requested() const { return _reinitialize_requested; }

    bool NodeLifeCycle::reset_requested() const { return _reset_requested; }

    bool NodeLifeCycle::input_history_invalid() const { return _input_history_invalid; }

    bool NodeLifeCycle::upstream_changed() const { return _upstream_changed; }

    bool NodeLifeCycle::has_pending_changes() const {
        return _reinitialize_requested || _reset_requested || _input_history_invalid;
    }

    bool NodeLifeCycle::is_reset_suppressed() const { return _suppression_depth > 0; }

    LifeCycleState NodeLifeCycle::state() const {
        if (!_initialized) { return LifeCycleState::UNINITIALIZED; }
        if (_reinitialize_requested) { return LifeCycleState::REINITIALIZE_REQUESTED; }
        if (_reset_requested) { return LifeCycleState::RESET_REQUESTED; }
        if (_input_history_invalid) { return LifeCycleState::HISTORY_INVALIDATED; }
        return LifeCycleState::INITIALIZED;
    }

    void NodeLifeCycle::mark_reset_needed() {
        if (is_reset_suppressed()) { return; }
        _reset_requested = true;
    }

    void NodeLifeCycle::request_reinitialize() { _reinitialize_requested = true; }

    void NodeLifeCycle::invalidate_input_history() { _input_history_invalid = true; }

    void NodeLifeCycle::mark_upstream_changed() { _upstream_changed = true; }

    bool NodeLifeCycle::consume_upstream_change() {
        bool changed = _upstream_changed;
        _upstream_changed = false;
        return changed;
    }

    void NodeLifeCycle::set_initialized(bool value) { _initialized = value; }

    void NodeLifeCycle::clear_reset_request() { _reset_requested = false; }

    void NodeLifeCycle::clear_input_history_invalid() { _input_history_invalid = false; }

    void NodeLifeCycle::clear_pending_changes() {
        _reinitialize_requested = false;
        _reset_requested = false;
        _input_history_invalid = false;
        _upstream_changed = false;
    }

    /*
     * NOTE the life-cycle methods are expected to be called on a single thread, so a simple counter is sufficient
     * to track nested suppression.
     */

    ResetSuppressionGuard::ResetSuppressionGuard(NodeLifeCycle &component) : _component{component} {
        ++_component._suppression_depth;
    }

    ResetSuppressionGuard::~ResetSuppressionGuard() { --_component._suppression_depth; }
} // namespace pulsegraph
