#ifndef PULSEGRAPH_PIPELINE_H
#define PULSEGRAPH_PIPELINE_H

#include <pulsegraph/runtime/observers/evaluation_profiler.h>
#include <pulsegraph/runtime/observers/evaluation_trace.h>
#include <pulsegraph/types/graph.h>

namespace pulsegraph {
    /**
     * Switches for the observers the pipeline installs on its graph.
     */
    struct PipelineConfiguration {
        bool trace{false};
        std::optional<std::string> trace_filter{};
        bool trace_updates{false};
        bool profile{false};
        bool profile_print{true};
    };

    /**
     * The processing chain: one source, followed by processors, followed by outputs.
     *
     * The pipeline registers every node it is given with its graph and keeps the upstream references in step with
     * the chain. Outputs added without an explicit parent are "floating": they always hang off the current end of
     * the processor chain, and follow it when the chain is edited.
     *
     * The pipeline has no clock, ``tick`` is called by whoever drives the acquisition.
     */
    struct PULSEGRAPH_EXPORT Pipeline {
        using ptr = Pipeline*;

        explicit Pipeline(PipelineConfiguration configuration = {});

        ~Pipeline();

        Pipeline(const Pipeline &) = delete;

        Pipeline &operator=(const Pipeline &) = delete;

        [[nodiscard]] Graph &graph();

        [[nodiscard]] const Graph &graph() const;

        [[nodiscard]] const PipelineConfiguration &configuration() const;

        [[nodiscard]] const source_node_s_ptr &source() const;

        /**
         * Replaces the source. Everything that was fed by the old source (the first processor, outputs attached to
         * it) is connected to the new one; the old source leaves the graph.
         */
        void set_source(source_node_s_ptr source);

        /**
         * Appends a processor to the chain, connecting it to the current end of the chain unless it already has an
         * upstream. Raises DuplicateNodeError if the processor is already part of the pipeline.
         */
        void add_processor(processor_node_s_ptr processor);

        /**
         * Adds an output fed by ``parent``, or by the end of the processor chain when no parent is given.
         * Raises DuplicateNodeError if the output is already part of the pipeline.
         */
        void add_output(output_node_s_ptr output, node_ptr parent = nullptr);

        [[nodiscard]] const std::vector<processor_node_s_ptr> &processors() const;

        [[nodiscard]] const std::vector<output_node_s_ptr> &outputs() const;

        /**
         * Source, processors then outputs, in the order they were added.
         */
        [[nodiscard]] std::vector<node_ptr> all_nodes() const;

        /**
         * The sampling frequency published by the source.
         */
        [[nodiscard]] double frequency() const;

        /**
         * Initialises every node that needs it, in topological order so that each node sees initialised
         * predecessors.
         */
        void initialize_all();

        /**
         * One update of every node, in topological order: a node always reads the output its upstream produced
         * during the same tick.
         */
        void tick();

        [[nodiscard]] int64_t tick_count() const;

        [[nodiscard]] const EvaluationProfiler *profiler() const;

        [[nodiscard]] const EvaluationTrace *trace() const;

    private:
        [[nodiscard]] std::vector<node_ptr> evaluation_order() const;

        [[nodiscard]] node_ptr last_node_before_outputs() const;

        // True when the node was added to the graph by this call
        bool ensure_registered(const node_s_ptr &node);

        void reconnect_floating_outputs();

        PipelineConfiguration _configuration;
        Graph _graph;
        source_node_s_ptr _source;
        std::vector<processor_node_s_ptr> _processors;
        std::vector<output_node_s_ptr> _outputs;
        // nullptr marks a floating output
        std::vector<node_ptr> _parents_of_outputs;
        std::unique_ptr<EvaluationTrace> _trace;
        std::unique_ptr<EvaluationProfiler> _profiler;
        int64_t _tick_count{0};
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_PIPELINE_H
