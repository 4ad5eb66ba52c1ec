#include <pulsegraph/runtime/lifecycle_observer.h>
#include <pulsegraph/runtime/pipeline.h>
#include <pulsegraph/types/graph.h>

#include <cstdio>
#include <string>

namespace pulsegraph {
    std::string_view to_string(NodeEvent event) {
        switch (event) {
            case NodeEvent::INITIALIZE: return "initialize";
            case NodeEvent::UPDATE: return "update";
            case NodeEvent::RESET: return "reset";
            case NodeEvent::HISTORY_INVALIDATION: return "history invalidation";
        }
        return "unknown";
    }

    namespace {
        void notify_before(PipelineLifeCycleObserver &observer, Node &node, NodeEvent event) {
            switch (event) {
                case NodeEvent::INITIALIZE: observer.on_before_node_initialize(node);
                    break;
                case NodeEvent::UPDATE: observer.on_before_node_update(node);
                    break;
                case NodeEvent::RESET: observer.on_before_node_reset(node);
                    break;
                case NodeEvent::HISTORY_INVALIDATION: observer.on_before_node_history_invalidation(node);
                    break;
            }
        }

        void notify_after(PipelineLifeCycleObserver &observer, Node &node, NodeEvent event) {
            switch (event) {
                case NodeEvent::INITIALIZE: observer.on_after_node_initialize(node);
                    break;
                case NodeEvent::UPDATE: observer.on_after_node_update(node);
                    break;
                case NodeEvent::RESET: observer.on_after_node_reset(node);
                    break;
                case NodeEvent::HISTORY_INVALIDATION: observer.on_after_node_history_invalidation(node);
                    break;
            }
        }

        // Observers get the after notification in reverse order, so nested observers see balanced calls. A failing
        // observer does not keep the others from being notified.
        template<typename Fn, typename Describe>
        void for_each_observer(const Graph &graph, bool reverse, Fn &&fn, Describe &&describe) noexcept {
            auto notify = [&](PipelineLifeCycleObserver &observer) {
                try {
                    fn(observer);
                } catch (const std::exception &e) {
                    fmt::print(stderr, "Warning: exception during the {}: {}\n", describe(), e.what());
                }
            };
            const auto &observers{graph.life_cycle_observers()};
            if (reverse) {
                for (auto it = observers.rbegin(); it != observers.rend(); ++it) { notify(**it); }
            } else {
                for (auto observer: observers) { notify(*observer); }
            }
        }
    } // namespace

    NotifyNodeEvent::NotifyNodeEvent(Node &node, NodeEvent event) : _node{node}, _event{event} {
        if (auto graph{_node.graph()}; graph != nullptr) {
            for_each_observer(*graph, false, [this](auto &observer) { notify_before(observer, _node, _event); },
                              [this] {
                                  return fmt::format("before {} notification of {}", to_string(_event), _node.str());
                              });
        }
    }

    NotifyNodeEvent::~NotifyNodeEvent() noexcept {
        if (auto graph{_node.graph()}; graph != nullptr) {
            for_each_observer(*graph, true, [this](auto &observer) { notify_after(observer, _node, _event); },
                              [this] {
                                  return fmt::format("after {} notification of {}", to_string(_event), _node.str());
                              });
        }
    }

    NotifyPipelineEvent::NotifyPipelineEvent(Pipeline &pipeline, PipelineEvent event)
        : _pipeline{pipeline}, _event{event} {
        for_each_observer(_pipeline.graph(), false, [this](auto &observer) {
            if (_event == PipelineEvent::INITIALIZE) {
                observer.on_before_initialize_pipeline(_pipeline);
            } else {
                observer.on_before_tick(_pipeline);
            }
        }, [] { return std::string{"before pipeline notification"}; });
    }

    NotifyPipelineEvent::~NotifyPipelineEvent() noexcept {
        for_each_observer(_pipeline.graph(), true, [this](auto &observer) {
            if (_event == PipelineEvent::INITIALIZE) {
                observer.on_after_initialize_pipeline(_pipeline);
            } else {
                observer.on_after_tick(_pipeline);
            }
        }, [] { return std::string{"after pipeline notification"}; });
    }
} // namespace pulsegraph
