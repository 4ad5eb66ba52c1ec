#include <pulsegraph/types/graph.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <queue>

namespace pulsegraph {
    Graph::~Graph() {
        // Nodes may outlive the registry (e.g. held by the pipeline), they must not point back to it.
        for (auto &node: _nodes) {
            if (node == nullptr) { continue; }
            node->_graph = nullptr;
            node->_node_ndx = -1;
        }
    }

    node_ptr Graph::add_node(node_s_ptr node) {
        if (node == nullptr) { throw_error<ProtocolViolation>("Cannot add an empty node to the graph"); }
        if (node->_graph == this) { throw_error<DuplicateNodeError>("The {} node is already part of the graph", node->str()); }
        if (node->_graph != nullptr) {
            throw_error<ProtocolViolation>("The {} node already belongs to another graph", node->str());
        }

        // Slots freed by remove_node are reused before the graph grows
        auto free_slot{std::ranges::find(_nodes, nullptr)};
        auto ndx{static_cast<int64_t>(std::distance(_nodes.begin(), free_slot))};
        node->_graph = this;
        node->_node_ndx = ndx;
        if (free_slot != _nodes.end()) {
            *free_slot = std::move(node);
            _upstream[ndx] = -1;
            _listeners[ndx].clear();
        } else {
            _nodes.push_back(std::move(node));
            _upstream.push_back(-1);
            _listeners.emplace_back();
        }
        return _nodes[ndx].get();
    }

    void Graph::remove_node(Node &node) {
        check_member(node);
        auto ndx{node._node_ndx};
        if (!_listeners[ndx].empty()) {
            throw_error<ProtocolViolation>("Cannot remove the {} node, {} node(s) still listen to it", node.str(),
                                           _listeners[ndx].size());
        }
        if (auto upstream_ndx{_upstream[ndx]}; upstream_ndx >= 0) { std::erase(_listeners[upstream_ndx], &node); }
        _upstream[ndx] = -1;

        // Keep the node alive until it is fully detached
        auto removed{std::move(_nodes[ndx])};
        removed->_graph = nullptr;
        removed->_node_ndx = -1;
    }

    bool Graph::contains(const Node &node) const { return node._graph == this; }

    size_t Graph::size() const {
        return static_cast<size_t>(std::ranges::count_if(_nodes, [](const auto &node) { return node != nullptr; }));
    }

    node_ptr Graph::node(int64_t node_ndx) const {
        if (node_ndx < 0 || node_ndx >= static_cast<int64_t>(_nodes.size())) { return nullptr; }
        return _nodes[node_ndx].get();
    }

    node_ptr Graph::upstream_of(const Node &node) const {
        check_member(node);
        return this->node(_upstream[node._node_ndx]);
    }

    const std::vector<node_ptr> &Graph::listeners_of(const Node &node) const {
        check_member(node);
        return _listeners[node._node_ndx];
    }

    void Graph::connect(Node &node, node_ptr upstream) {
        check_member(node);
        if (upstream != nullptr) {
            check_member(*upstream);
            if (node.node_type() == NodeTypeEnum::SOURCE_NODE) {
                throw_error<ProtocolViolation>("The {} node is a source and cannot have an upstream node", node.str());
            }
            if (upstream->node_type() == NodeTypeEnum::OUTPUT_NODE) {
                throw_error<ProtocolViolation>("The {} node is an output and cannot feed the {} node", upstream->str(),
                                               node.str());
            }
            if (reaches(upstream, node)) {
                throw_error<CycleError>("Connecting the {} node to {} would create a cycle", node.str(),
                                        upstream->str());
            }
        }

        auto ndx{node._node_ndx};
        auto current_ndx{_upstream[ndx]};
        auto new_ndx{upstream == nullptr ? int64_t{-1} : upstream->_node_ndx};
        if (current_ndx == new_ndx) { return; }

        if (current_ndx >= 0) { std::erase(_listeners[current_ndx], &node); }
        _upstream[ndx] = new_ndx;
        if (new_ndx >= 0) { _listeners[new_ndx].push_back(&node); }

        if (node.is_initialized()) { node.request_reinitialize(); }
        node.receive_message(Message::everything_changed());
    }

    std::vector<node_ptr> Graph::topological_order() const {
        std::vector<node_ptr> order;
        order.reserve(_nodes.size());

        std::priority_queue<int64_t, std::vector<int64_t>, std::greater<>> ready;
        for (int64_t ndx = 0; ndx < static_cast<int64_t>(_nodes.size()); ++ndx) {
            if (_nodes[ndx] != nullptr && _upstream[ndx] < 0) { ready.push(ndx); }
        }
        while (!ready.empty()) {
            auto ndx{ready.top()};
            ready.pop();
            order.push_back(_nodes[ndx].get());
            for (auto listener: _listeners[ndx]) { ready.push(listener->_node_ndx); }
        }
        return order;
    }

    void Graph::validate() const {
        for (const auto &node: _nodes) {
            if (node == nullptr) { continue; }
            auto upstream_ndx{_upstream[node->_node_ndx]};
            if (upstream_ndx < 0) { continue; }

            auto upstream{this->node(upstream_ndx)};
            if (upstream == nullptr) {
                throw_error<ProtocolViolation>("The upstream node of {} is no longer part of the graph", node->str());
            }
            if (node->node_type() == NodeTypeEnum::SOURCE_NODE) {
                throw_error<ProtocolViolation>("The {} node is a source and cannot have an upstream node", node->str());
            }
            if (reaches(upstream, *node)) {
                throw_error<CycleError>("The {} node is part of a cycle", node->str());
            }
        }
    }

    void Graph::deliver_message(const Node &from, const Message &message) const {
        for (auto listener: listeners_of(from)) { listener->receive_message(message); }
    }

    void Graph::add_life_cycle_observer(observer_ptr observer) {
        if (observer == nullptr || std::ranges::find(_life_cycle_observers, observer) != _life_cycle_observers.end()) {
            return;
        }
        _life_cycle_observers.push_back(observer);
    }

    void Graph::remove_life_cycle_observer(observer_ptr observer) { std::erase(_life_cycle_observers, observer); }

    const std::vector<observer_ptr> &Graph::life_cycle_observers() const { return _life_cycle_observers; }

    void Graph::check_member(const Node &node) const {
        if (node._graph != this) { throw_error<ProtocolViolation>("The {} node is not part of this graph", node.str()); }
    }

    bool Graph::reaches(node_ptr from, const Node &target) const {
        // Walks at most one step per node, a longer walk can only mean a cycle that is already there
        for (size_t steps = 0; from != nullptr && steps <= _nodes.size(); ++steps) {
            if (from == &target) { return true; }
            from = node(_upstream[from->_node_ndx]);
        }
        return from != nullptr;
    }
} // namespace pulsegraph
