#ifndef PULSEGRAPH_GRAPH_H
#define PULSEGRAPH_GRAPH_H

#include <pulsegraph/types/message.h>
#include <pulsegraph/types/node.h>

namespace pulsegraph {
    /**
     * The registry of the nodes that make up a processing chain.
     *
     * The graph owns its nodes and keeps the edges between them: each node has at most one upstream node and any
     * number of listeners. Nodes are addressed by the index they received when they were added. Removing a node
     * never changes the indices of the remaining nodes; the freed slot is handed to the next node that is added.
     *
     * The registry refuses any edge that would close a cycle, so iterating it in topological order is always
     * possible.
     */
    struct PULSEGRAPH_EXPORT Graph {
        using ptr = Graph*;
        using s_ptr = std::shared_ptr<Graph>;
        using node_list = std::vector<node_s_ptr>;

        Graph() = default;

        ~Graph();

        Graph(const Graph &) = delete;

        Graph &operator=(const Graph &) = delete;

        /**
         * Registers the node and returns it, in the lowest free slot. Raises DuplicateNodeError if it is already
         * part of this graph and ProtocolViolation if it belongs to another graph.
         */
        node_ptr add_node(node_s_ptr node);

        template<typename T, typename... Args>
        std::shared_ptr<T> emplace_node(Args &&... args) {
            auto node{std::make_shared<T>(std::forward<Args>(args)...)};
            add_node(node);
            return node;
        }

        /**
         * Removes a node that no other node listens to, disconnecting it from its upstream first.
         */
        void remove_node(Node &node);

        [[nodiscard]] bool contains(const Node &node) const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] node_ptr node(int64_t node_ndx) const;

        [[nodiscard]] node_ptr upstream_of(const Node &node) const;

        [[nodiscard]] const std::vector<node_ptr> &listeners_of(const Node &node) const;

        /**
         * Makes ``upstream`` the upstream node of ``node`` (or disconnects it when nullptr).
         *
         * Raises CycleError if ``node`` is reachable walking up from ``upstream``. When the upstream actually
         * changes, the node is deregistered from its old upstream, registered with the new one and receives
         * ``Message::everything_changed()``; an initialised node is also marked for re-initialisation.
         */
        void connect(Node &node, node_ptr upstream);

        /**
         * All live nodes, every node after its upstream, ties broken by registration order.
         */
        [[nodiscard]] std::vector<node_ptr> topological_order() const;

        /**
         * Checks the structural constraints: sources have no upstream, every edge stays within the graph and
         * there are no cycles.
         */
        void validate() const;

        void deliver_message(const Node &from, const Message &message) const;

        void add_life_cycle_observer(observer_ptr observer);

        void remove_life_cycle_observer(observer_ptr observer);

        [[nodiscard]] const std::vector<observer_ptr> &life_cycle_observers() const;

    private:
        void check_member(const Node &node) const;

        [[nodiscard]] bool reaches(node_ptr from, const Node &target) const;

        node_list _nodes;
        std::vector<int64_t> _upstream;
        std::vector<std::vector<node_ptr>> _listeners;
        std::vector<observer_ptr> _life_cycle_observers;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_GRAPH_H
