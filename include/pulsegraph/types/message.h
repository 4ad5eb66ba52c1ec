#ifndef PULSEGRAPH_MESSAGE_H
#define PULSEGRAPH_MESSAGE_H

namespace pulsegraph {
    /**
     * Delivered by a node to each of its listeners when its output-producing contract changes, i.e. once an
     * initialize, reset or history invalidation has completed.
     *
     * ``changed``         - this node, or one upstream of it, has changed.
     * ``history_invalid`` - the outputs that follow cannot be treated as a continuation of the previous ones.
     *
     * The two values are independent, a local reset may report a change without invalidating history.
     */
    struct Message {
        constexpr Message(bool changed, bool history_invalid) noexcept
            : _changed{changed}, _history_invalid{history_invalid} {
        }

        [[nodiscard]] constexpr bool changed() const noexcept { return _changed; }

        [[nodiscard]] constexpr bool history_invalid() const noexcept { return _history_invalid; }

        // Sent when the node has been rebuilt or its upstream replaced, everything downstream is stale.
        [[nodiscard]] static constexpr Message everything_changed() noexcept { return {true, true}; }

        constexpr bool operator==(const Message &) const noexcept = default;

    private:
        bool _changed;
        bool _history_invalid;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_MESSAGE_H
