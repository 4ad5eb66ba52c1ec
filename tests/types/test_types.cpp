/**
 * @file test_types.cpp
 * @brief Unit tests for the value types carried through the graph.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <pulsegraph/types/attribute.h>
#include <pulsegraph/types/channel_info.h>
#include <pulsegraph/types/message.h>
#include <pulsegraph/types/signal_buffer.h>

#include <cmath>
#include <limits>

using namespace pulsegraph;

// ============================================================================
// Message
// ============================================================================

TEST_CASE("Message - fields are independent", "[types][message]") {
    constexpr Message local_change{true, false};
    STATIC_REQUIRE(local_change.changed());
    STATIC_REQUIRE_FALSE(local_change.history_invalid());

    constexpr Message only_history{false, true};
    STATIC_REQUIRE_FALSE(only_history.changed());
    STATIC_REQUIRE(only_history.history_invalid());
}

TEST_CASE("Message - everything_changed", "[types][message]") {
    constexpr auto message = Message::everything_changed();
    STATIC_REQUIRE(message.changed());
    STATIC_REQUIRE(message.history_invalid());
    STATIC_REQUIRE(message == Message{true, true});
    STATIC_REQUIRE_FALSE(message == Message{true, false});
}

// ============================================================================
// SignalBuffer
// ============================================================================

TEST_CASE("SignalBuffer - shape and row major layout", "[types][signal_buffer]") {
    SignalBuffer buffer{2, 3, std::vector<double>{1, 2, 3, 4, 5, 6}};

    CHECK(buffer.channel_count() == 2);
    CHECK(buffer.sample_count() == 3);
    CHECK(buffer.size() == 6);
    CHECK_FALSE(buffer.empty());
    CHECK(buffer(0, 2) == 3.0);
    CHECK(buffer(1, 0) == 4.0);

    auto second = buffer.channel(1);
    REQUIRE(second.size() == 3);
    CHECK(second[2] == 6.0);
}

TEST_CASE("SignalBuffer - data must match the shape", "[types][signal_buffer]") {
    CHECK_THROWS_AS((SignalBuffer{2, 3, std::vector<double>{1, 2, 3}}), ValidationError);
}

TEST_CASE("SignalBuffer - channel out of range", "[types][signal_buffer]") {
    SignalBuffer buffer{2, 3};
    CHECK_THROWS_AS(buffer.channel(2), std::out_of_range);
}

TEST_CASE("SignalBuffer - empty buffers mean nothing to emit", "[types][signal_buffer]") {
    CHECK(is_empty(nullptr));
    CHECK(is_empty(std::make_shared<const SignalBuffer>()));
    CHECK(is_empty(std::make_shared<const SignalBuffer>(2, 0)));
    CHECK_FALSE(is_empty(std::make_shared<const SignalBuffer>(2, 1)));
}

// ============================================================================
// ChannelInfo
// ============================================================================

TEST_CASE("ChannelInfo - uniform naming and lookups", "[types][channel_info]") {
    auto info = ChannelInfo::uniform(3, 250.0);
    info.bads = {"ch2"};

    CHECK(info.channel_count() == 3);
    CHECK(info.channel_names() == std::vector<std::string>{"ch1", "ch2", "ch3"});
    CHECK(info.index_of("ch3") == 2);
    CHECK_FALSE(info.index_of("Cz").has_value());
    CHECK(info.is_bad("ch2"));
    CHECK_FALSE(info.is_bad("ch1"));
    CHECK_NOTHROW(info.validate("test"));
}

TEST_CASE("ChannelInfo - validation failures", "[types][channel_info]") {
    using Catch::Matchers::ContainsSubstring;

    SECTION("no channels") {
        ChannelInfo info{{}, 100.0};
        CHECK_THROWS_WITH(info.validate("Source"), ContainsSubstring("0 channels"));
    }

    SECTION("no data channels") {
        ChannelInfo info{{{"EOG1", ChannelType::EOG}, {"STI", ChannelType::STIM}}, 100.0};
        CHECK_THROWS_AS(info.validate("Source"), ValidationError);
    }

    SECTION("meg channels are data channels") {
        ChannelInfo info{{{"MEG0111", ChannelType::MAG}}, 1000.0};
        CHECK_NOTHROW(info.validate("Source"));
    }

    SECTION("non positive sampling frequency") {
        auto info = ChannelInfo::uniform(2, 0.0);
        CHECK_THROWS_AS(info.validate("Source"), ValidationError);
        info.sampling_frequency = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(info.validate("Source"), ValidationError);
    }

    SECTION("duplicate names") {
        ChannelInfo info{{{"Cz", ChannelType::EEG}, {"Cz", ChannelType::EEG}}, 100.0};
        CHECK_THROWS_AS(info.validate("Source"), ValidationError);
    }

    SECTION("empty names") {
        ChannelInfo info{{{"", ChannelType::EEG}}, 100.0};
        CHECK_THROWS_AS(info.validate("Source"), ValidationError);
    }

    SECTION("unknown bad channel") {
        auto info = ChannelInfo::uniform(2, 100.0);
        info.bads = {"Fp1"};
        CHECK_THROWS_AS(info.validate("Source"), ValidationError);
    }
}

// ============================================================================
// Attributes and snapshot reducers
// ============================================================================

TEST_CASE("Snapshot reducers ignore what the node does not depend on", "[types][attribute]") {
    auto info = ChannelInfo::uniform(4, 500.0);
    auto with_bads = info;
    with_bads.bads = {"ch1"};
    auto resampled = info;
    resampled.sampling_frequency = 250.0;

    CHECK(AttributeValue{info} != AttributeValue{with_bads});
    CHECK(reduce_to_channel_labels(info) == reduce_to_channel_labels(with_bads));
    CHECK(reduce_to_channel_labels(info) == reduce_to_channel_labels(resampled));
    CHECK(reduce_to_channel_count(info) == AttributeValue{int64_t{4}});

    auto fewer = ChannelInfo::uniform(3, 500.0);
    CHECK(reduce_to_channel_labels(info) != reduce_to_channel_labels(fewer));
    CHECK(reduce_to_channel_count(info) != reduce_to_channel_count(fewer));
}

TEST_CASE("Snapshot reducers reject other values", "[types][attribute]") {
    CHECK_THROWS_AS(reduce_to_channel_labels(AttributeValue{1.5}), ValidationError);
    CHECK_THROWS_AS(reduce_to_channel_count(AttributeValue{std::string{"eeg"}}), ValidationError);
}

TEST_CASE("UpstreamDependency - snapshot without a reducer is the value itself", "[types][attribute]") {
    UpstreamDependency dependency{"montage"};
    AttributeValue value{std::string{"standard_1020"}};
    CHECK(dependency.snapshot_of(value) == value);

    UpstreamDependency reduced{"channel_info", reduce_to_channel_count};
    CHECK(reduced.snapshot_of(ChannelInfo::uniform(8, 100.0)) == AttributeValue{int64_t{8}});
}

TEST_CASE("AttributeValue - to_string", "[types][attribute]") {
    CHECK(to_string(AttributeValue{}) == "None");
    CHECK(to_string(AttributeValue{true}) == "True");
    CHECK(to_string(AttributeValue{std::string{"a"}}) == "'a'");
    CHECK(to_string(AttributeValue{std::vector<std::string>{"a", "b"}}) == "[a, b]");
    CHECK(to_string(AttributeValue{int64_t{3}}) == "3");
}
