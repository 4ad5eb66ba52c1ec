#ifndef PULSEGRAPH_FORWARD_DECLARATIONS_H
#define PULSEGRAPH_FORWARD_DECLARATIONS_H

#include <memory>

namespace pulsegraph {
    // Node - shared ownership lives in the Graph registry
    struct Node;
    using node_ptr = Node*;
    using node_s_ptr = std::shared_ptr<Node>;

    struct SourceNode;
    using source_node_ptr = SourceNode*;
    using source_node_s_ptr = std::shared_ptr<SourceNode>;

    struct ProcessorNode;
    using processor_node_ptr = ProcessorNode*;
    using processor_node_s_ptr = std::shared_ptr<ProcessorNode>;

    struct OutputNode;
    using output_node_ptr = OutputNode*;
    using output_node_s_ptr = std::shared_ptr<OutputNode>;

    // Graph - raw pointer back-references from nodes, owned by the Pipeline
    struct Graph;
    using graph_ptr = Graph*;
    using const_graph_ptr = const Graph*;
    using graph_s_ptr = std::shared_ptr<Graph>;

    struct Pipeline;
    using pipeline_ptr = Pipeline*;

    // Observers are externally managed, the graph only keeps raw pointers
    struct PipelineLifeCycleObserver;
    using observer_ptr = PipelineLifeCycleObserver*;
    using observer_s_ptr = std::shared_ptr<PipelineLifeCycleObserver>;

    // Buffers are immutable once published
    struct SignalBuffer;
    using signal_buffer_s_ptr = std::shared_ptr<const SignalBuffer>;
} // namespace pulsegraph

#endif // PULSEGRAPH_FORWARD_DECLARATIONS_H
