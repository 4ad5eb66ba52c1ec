#ifndef PULSEGRAPH_LIFECYCLE_H
#define PULSEGRAPH_LIFECYCLE_H

#include <pulsegraph/pulsegraph_base.h>

#include <cstdint>

namespace pulsegraph {
    struct ResetSuppressionGuard;

    /**
     * The state a node reports, in priority order. A node may have several pending requests at once, the state is
     * the most disruptive of them since that is the one the next update will act on.
     */
    enum class LifeCycleState : std::uint8_t {
        UNINITIALIZED,
        REINITIALIZE_REQUESTED,
        RESET_REQUESTED,
        HISTORY_INVALIDATED,
        INITIALIZED
    };

    [[nodiscard]] PULSEGRAPH_EXPORT std::string_view to_string(LifeCycleState state);

    /**
     * The life-cycle of a processing node is as follows:
     *
     * * The node is constructed, attributes may be assigned freely after this.
     *
     * * On its first update the node is initialised. This prepares all derived state from the node's attributes and
     *   the attributes of its upstream nodes. If called again (a re-initialisation) it must remove all traces of the
     *   past.
     *
     * * Subsequent updates compute a new output from the current upstream output.
     *
     * * Three kinds of outstanding work can be requested at any time, they are resolved lazily on the next update
     *   and never synchronously:
     *   - re-initialise: something upstream the node depends on structurally has changed,
     *   - reset: one of the node's own reset sensitive attributes has been changed,
     *   - history invalidated: the input can no longer be considered a continuation of the previous input.
     *
     * Re-initialise is strictly more disruptive than reset, which is strictly more disruptive than a history
     * invalidation, an update resolves the most disruptive pending request first.
     *
     * The flags are only ever cleared once the corresponding hook has completed successfully.
     */
    struct PULSEGRAPH_EXPORT NodeLifeCycle {
        virtual ~NodeLifeCycle() = default;

        /**
         * Has the node completed initialisation since its last (re-)initialisation started.
         */
        [[nodiscard]] bool is_initialized() const;

        [[nodiscard]] bool reinitialize_requested() const;

        [[nodiscard]] bool reset_requested() const;

        [[nodiscard]] bool input_history_invalid() const;

        /**
         * An upstream node reported a change that has not yet been checked against the upstream snapshot.
         */
        [[nodiscard]] bool upstream_changed() const;

        /**
         * True if any of re-initialise, reset or history invalidation is pending.
         */
        [[nodiscard]] bool has_pending_changes() const;

        /**
         * True while one of the node's own hooks is running, attribute changes made then do not request a reset.
         */
        [[nodiscard]] bool is_reset_suppressed() const;

        [[nodiscard]] LifeCycleState state() const;

    protected:
        /**
         * Called by the setter of every reset sensitive attribute once the new value has been accepted.
         * Has no effect while a ResetSuppressionGuard is held on this node.
         */
        void mark_reset_needed();

        void request_reinitialize();

        void invalidate_input_history();

        void mark_upstream_changed();

        /**
         * Returns the upstream-changed marker and clears it.
         */
        bool consume_upstream_change();

        void set_initialized(bool value);

        void clear_reset_request();

        void clear_input_history_invalid();

        void clear_pending_changes();

    private:
        bool _initialized{false};
        bool _reinitialize_requested{false};
        bool _reset_requested{false};
        bool _input_history_invalid{false};
        bool _upstream_changed{false};
        std::uint32_t _suppression_depth{0};

        friend ResetSuppressionGuard;
    };

    /**
     * Held for the duration of a hook so the hook can assign the node's own reset sensitive attributes
     * (e.g. derived values) without scheduling another reset of the node it is running on.
     * Guards nest, suppression ends when the outermost guard is released.
     */
    struct PULSEGRAPH_EXPORT ResetSuppressionGuard {
        explicit ResetSuppressionGuard(NodeLifeCycle &component);

        ~ResetSuppressionGuard();

        ResetSuppressionGuard(const ResetSuppressionGuard &) = delete;

        ResetSuppressionGuard &operator=(const ResetSuppressionGuard &) = delete;

    private:
        NodeLifeCycle &_component;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_LIFECYCLE_H
