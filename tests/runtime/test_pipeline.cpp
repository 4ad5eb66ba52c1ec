/**
 * @file test_pipeline.cpp
 * @brief Tests for chain assembly and the tick driven propagation of changes through a pipeline.
 */

#include <catch2/catch_test_macros.hpp>

#include <pulsegraph/runtime/pipeline.h>

#include "../mock_nodes.h"

using namespace pulsegraph;
using namespace pulsegraph::testing;

namespace {
    struct ThreeNodePipeline {
        Pipeline pipeline;
        std::shared_ptr<MockSource> source{std::make_shared<MockSource>()};
        std::shared_ptr<MockProcessor> processor{std::make_shared<MockProcessor>()};
        std::shared_ptr<MockOutput> output{std::make_shared<MockOutput>()};

        ThreeNodePipeline() {
            pipeline.set_source(source);
            pipeline.add_processor(processor);
            pipeline.add_output(output);
        }
    };
} // namespace

// ============================================================================
// Assembly
// ============================================================================

TEST_CASE("Pipeline - nodes are chained in the order they are added", "[pipeline]") {
    ThreeNodePipeline fixture;
    auto &[pipeline, source, processor, output] = fixture;

    CHECK(processor->upstream() == source.get());
    CHECK(output->upstream() == processor.get());
    CHECK(pipeline.graph().size() == 3);

    auto nodes = pipeline.all_nodes();
    REQUIRE(nodes.size() == 3);
    CHECK(nodes[0] == source.get());
    CHECK(nodes[1] == processor.get());
    CHECK(nodes[2] == output.get());
}

TEST_CASE("Pipeline - floating outputs follow the end of the chain", "[pipeline]") {
    Pipeline pipeline;
    auto source = std::make_shared<MockSource>();
    auto floating = std::make_shared<MockOutput>();
    auto pinned = std::make_shared<MockOutput>();
    pipeline.set_source(source);
    pipeline.add_output(floating);
    pipeline.add_output(pinned, source.get());
    CHECK(floating->upstream() == source.get());

    auto first = std::make_shared<MockProcessor>();
    auto second = std::make_shared<MockProcessor>();
    pipeline.add_processor(first);
    CHECK(floating->upstream() == first.get());
    pipeline.add_processor(second);
    CHECK(second->upstream() == first.get());
    CHECK(floating->upstream() == second.get());
    CHECK(pinned->upstream() == source.get());
}

TEST_CASE("Pipeline - processors keep an upstream they already have", "[pipeline]") {
    Pipeline pipeline;
    auto source = std::make_shared<MockSource>();
    auto first = std::make_shared<MockProcessor>();
    auto branch = std::make_shared<MockProcessor>();
    pipeline.set_source(source);
    pipeline.add_processor(first);

    pipeline.graph().add_node(branch);
    branch->set_upstream(source.get());
    pipeline.add_processor(branch);
    CHECK(branch->upstream() == source.get());
    CHECK(source->listeners().size() == 2);
}

TEST_CASE("Pipeline - a processor added before the source is connected later", "[pipeline]") {
    Pipeline pipeline;
    auto processor = std::make_shared<MockProcessor>();
    auto output = std::make_shared<MockOutput>();
    pipeline.add_processor(processor);
    pipeline.add_output(output);
    CHECK(processor->upstream() == nullptr);
    CHECK(output->upstream() == processor.get());

    auto source = std::make_shared<MockSource>();
    pipeline.set_source(source);
    CHECK(processor->upstream() == source.get());
    CHECK(output->upstream() == processor.get());
}

TEST_CASE("Pipeline - duplicates and empty nodes are rejected", "[pipeline][protocol]") {
    ThreeNodePipeline fixture;
    auto &[pipeline, source, processor, output] = fixture;

    CHECK_THROWS_AS(pipeline.add_processor(processor), DuplicateNodeError);
    CHECK_THROWS_AS(pipeline.add_output(output), DuplicateNodeError);
    CHECK_THROWS_AS(pipeline.add_processor(nullptr), ProtocolViolation);
    CHECK_THROWS_AS(pipeline.add_output(nullptr), ProtocolViolation);
    CHECK_THROWS_AS(pipeline.set_source(nullptr), ProtocolViolation);
    CHECK(pipeline.processors().size() == 1);
    CHECK(pipeline.outputs().size() == 1);
}

TEST_CASE("Pipeline - a rejected output is not left in the graph", "[pipeline][protocol]") {
    ThreeNodePipeline fixture;
    auto &[pipeline, source, processor, output] = fixture;

    auto behind_output = std::make_shared<MockOutput>();
    CHECK_THROWS_AS(pipeline.add_output(behind_output, output.get()), ProtocolViolation);
    CHECK_FALSE(pipeline.graph().contains(*behind_output));
    CHECK(behind_output->graph() == nullptr);

    Graph other;
    auto foreign = other.emplace_node<MockSource>();
    auto behind_foreign = std::make_shared<MockOutput>();
    CHECK_THROWS_AS(pipeline.add_output(behind_foreign, foreign.get()), ProtocolViolation);
    CHECK_FALSE(pipeline.graph().contains(*behind_foreign));
    CHECK(foreign->listeners().empty());

    CHECK(pipeline.outputs().size() == 1);
    CHECK(pipeline.graph().size() == 3);
    CHECK(output->listeners().empty());

    // A node the caller registered itself stays registered
    auto registered = pipeline.graph().emplace_node<MockOutput>();
    CHECK_THROWS_AS(pipeline.add_output(registered, output.get()), ProtocolViolation);
    CHECK(pipeline.graph().contains(*registered));
    CHECK(pipeline.outputs().size() == 1);
}

TEST_CASE("Pipeline - replacing the source does not grow the graph", "[pipeline]") {
    ThreeNodePipeline fixture;
    auto &[pipeline, source, processor, output] = fixture;

    for (int i = 0; i < 10; ++i) {
        pipeline.set_source(std::make_shared<MockSource>());
        CHECK(pipeline.source()->node_ndx() <= 3);
        CHECK(pipeline.graph().size() == 3);
        CHECK(pipeline.graph().node(4) == nullptr);
    }
    CHECK(processor->upstream() == pipeline.source().get());
    CHECK(processor->node_ndx() == 1);
    CHECK(output->node_ndx() == 2);
}

TEST_CASE("Pipeline - frequency comes from the initialized source", "[pipeline]") {
    Pipeline empty;
    CHECK_THROWS_AS(empty.frequency(), ProtocolViolation);
    CHECK_THROWS_AS(empty.initialize_all(), ProtocolViolation);

    ThreeNodePipeline fixture;
    CHECK_THROWS_AS(fixture.pipeline.frequency(), ProtocolViolation);
    fixture.pipeline.initialize_all();
    CHECK(fixture.pipeline.frequency() == 100.0);
}

TEST_CASE("Pipeline - no frequency from a source that failed validation", "[pipeline][errors]") {
    Pipeline pipeline;
    auto source = std::make_shared<MockSource>(ChannelInfo::uniform(2, 0.0));
    pipeline.set_source(source);

    CHECK_THROWS_AS(pipeline.initialize_all(), ValidationError);
    CHECK_FALSE(source->is_initialized());
    CHECK_THROWS_AS(pipeline.frequency(), ProtocolViolation);
}

// ============================================================================
// Propagation
// ============================================================================

TEST_CASE("Pipeline - source to processor to output", "[pipeline][lifecycle]") {
    ThreeNodePipeline fixture;
    auto &[pipeline, source, processor, output] = fixture;

    pipeline.initialize_all();
    CHECK(source->is_initialized());
    CHECK(processor->is_initialized());
    CHECK(output->is_initialized());
    CHECK_FALSE(processor->has_pending_changes());
    CHECK_FALSE(output->has_pending_changes());

    source->next_output = zeros(2, 10);
    pipeline.tick();
    REQUIRE(output->received != nullptr);
    CHECK(output->received->channel_count() == 2);
    CHECK(output->received->sample_count() == 10);
    CHECK(processor->counts.update == 1);
    CHECK(pipeline.tick_count() == 1);

    SECTION("a processor attribute change resets only that processor") {
        processor->set_scale(2.0);
        CHECK(processor->reset_requested());

        pipeline.tick();
        CHECK(processor->counts.reset == 1);
        CHECK(processor->counts.update == 1);
        CHECK(output->upstream_changed());
        CHECK_FALSE(output->input_history_invalid());

        // The output sees the local change, finds nothing it depends on and carries on
        pipeline.tick();
        CHECK(processor->counts.update == 2);
        CHECK(output->counts.update == 2);
        CHECK(output->counts.initialize == 1);
        CHECK(output->counts.reset == 0);
        CHECK(output->counts.history_invalidation == 0);
    }

    SECTION("a processor reset that breaks continuity invalidates the output history") {
        processor->reset_invalidates_history = true;
        processor->set_scale(2.0);
        pipeline.tick();
        CHECK(output->input_history_invalid());

        pipeline.tick();
        CHECK(output->counts.history_invalidation == 1);
        CHECK(output->counts.update == 1);

        pipeline.tick();
        CHECK(output->counts.update == 2);
    }

    SECTION("replacing the source re-initializes the chain") {
        auto replacement = std::make_shared<MockSource>(ChannelInfo::uniform(4, 250.0));
        replacement->next_output = zeros(4, 25);
        pipeline.set_source(replacement);

        CHECK(pipeline.source() == replacement);
        CHECK(processor->upstream() == replacement.get());
        CHECK(processor->reinitialize_requested());
        CHECK(processor->input_history_invalid());
        CHECK(source->graph() == nullptr);
        CHECK(pipeline.graph().size() == 3);

        // Source initializes, the processor sees no input yet
        pipeline.tick();
        CHECK(replacement->is_initialized());
        CHECK(processor->counts.initialize == 1);

        pipeline.tick();
        CHECK(processor->counts.initialize == 2);
        CHECK_FALSE(processor->has_pending_changes());

        pipeline.tick();
        CHECK(output->counts.history_invalidation == 1);

        pipeline.tick();
        REQUIRE(output->received != nullptr);
        CHECK(output->received->channel_count() == 4);
        CHECK(pipeline.frequency() == 250.0);
    }
}

TEST_CASE("Pipeline - nodes are evaluated upstream first whatever the order they were added in",
          "[pipeline][lifecycle]") {
    Pipeline pipeline;
    auto source = std::make_shared<MockSource>();
    auto first = std::make_shared<MockProcessor>();
    auto second = std::make_shared<MockProcessor>();
    pipeline.set_source(source);
    pipeline.graph().add_node(second);
    pipeline.graph().add_node(first);
    first->set_upstream(source.get());
    second->set_upstream(first.get());
    pipeline.add_processor(second);
    pipeline.add_processor(first);
    REQUIRE(pipeline.all_nodes()[1] == second.get());

    pipeline.initialize_all();
    CHECK(first->is_initialized());
    CHECK(second->is_initialized());
    CHECK_FALSE(first->has_pending_changes());
    CHECK_FALSE(second->has_pending_changes());

    source->next_output = filled(2, 5, 1.0);
    pipeline.tick();
    CHECK(second->output() == source->output());

    source->next_output = filled(2, 5, 2.0);
    pipeline.tick();
    CHECK(first->output() == source->output());
    CHECK(second->output() == source->output());
    CHECK(second->counts.update == 2);
    CHECK(second->counts.initialize == 1);
}

TEST_CASE("Pipeline - initialize_all resolves pending re-initialisations", "[pipeline][lifecycle]") {
    ThreeNodePipeline fixture;
    auto &[pipeline, source, processor, output] = fixture;
    pipeline.initialize_all();

    // Nothing pending, nothing happens
    pipeline.initialize_all();
    CHECK(source->counts.initialize == 1);
    CHECK(processor->counts.initialize == 1);

    pipeline.set_source(std::make_shared<MockSource>());
    pipeline.initialize_all();
    CHECK(processor->counts.initialize == 2);
    CHECK(pipeline.source()->is_initialized());
    CHECK_FALSE(processor->reinitialize_requested());
}

TEST_CASE("Pipeline - a source that cannot initialize stops initialize_all", "[pipeline][lifecycle]") {
    Pipeline pipeline;
    auto source = std::make_shared<MockSource>(std::nullopt);
    auto processor = std::make_shared<MockProcessor>();
    pipeline.set_source(source);
    pipeline.add_processor(processor);

    CHECK_THROWS_AS(pipeline.initialize_all(), ValidationError);
    CHECK_FALSE(source->is_initialized());
    CHECK(processor->counts.initialize == 0);
}

TEST_CASE("Pipeline - fan out with different dependencies", "[pipeline][lifecycle]") {
    Pipeline pipeline;
    auto source = std::make_shared<MockSource>();
    auto montage_dependent = std::make_shared<MockProcessor>(upstream_dependencies_t{UpstreamDependency{"montage"}});
    auto independent = std::make_shared<MockProcessor>();
    pipeline.set_source(source);
    pipeline.add_processor(montage_dependent);
    pipeline.graph().add_node(independent);
    independent->set_upstream(source.get());
    pipeline.add_processor(independent);

    source->next_output = zeros(2, 10);
    pipeline.initialize_all();
    pipeline.tick();
    REQUIRE(montage_dependent->counts.update == 1);
    REQUIRE(independent->counts.update == 1);

    source->set_montage("biosemi64");
    pipeline.tick();
    CHECK(source->counts.reset == 1);
    CHECK(montage_dependent->upstream_changed());
    CHECK(independent->upstream_changed());

    pipeline.tick();
    CHECK(montage_dependent->counts.initialize == 2);
    CHECK(independent->counts.initialize == 1);
    CHECK(independent->counts.history_invalidation == 1);
}
