#ifndef PULSEGRAPH_ATTRIBUTE_H
#define PULSEGRAPH_ATTRIBUTE_H

#include <pulsegraph/pulsegraph_base.h>
#include <pulsegraph/types/channel_info.h>

#include <cstdint>
#include <functional>
#include <variant>

namespace pulsegraph {
    // Well known attribute names
    inline constexpr std::string_view CHANNEL_INFO_ATTRIBUTE = "channel_info";
    inline constexpr std::string_view DISABLED_ATTRIBUTE = "disabled";

    /**
     * The values a node exposes to its descendants by name. Downstream nodes capture these at initialisation and
     * compare them on every upstream change to decide whether they need to rebuild.
     */
    using AttributeValue = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                        std::vector<std::string>, ChannelInfo>;

    /**
     * Reduces an upstream value to the part a node actually depends on. Comparing the full value of a mutable
     * upstream object would trigger a reinitialisation on every minor edit (e.g. a newly marked bad channel), so
     * nodes provide a reducer that keeps only what matters to them.
     */
    using SnapshotReducer = std::function<AttributeValue(const AttributeValue &)>;

    struct UpstreamDependency {
        std::string attribute;
        SnapshotReducer reducer{};

        [[nodiscard]] AttributeValue snapshot_of(const AttributeValue &value) const {
            return reducer ? reducer(value) : value;
        }
    };

    using upstream_dependencies_t = std::vector<UpstreamDependency>;
    using attribute_names_t = std::vector<std::string>;

    // Raises ValidationError (mentioning context) if the value does not hold a ChannelInfo
    [[nodiscard]] PULSEGRAPH_EXPORT const ChannelInfo &as_channel_info(const AttributeValue &value,
                                                                       std::string_view context);

    // ChannelInfo -> channel names, ignores sampling frequency and bad markers
    PULSEGRAPH_EXPORT AttributeValue reduce_to_channel_labels(const AttributeValue &value);

    // ChannelInfo -> number of channels
    PULSEGRAPH_EXPORT AttributeValue reduce_to_channel_count(const AttributeValue &value);

    [[nodiscard]] PULSEGRAPH_EXPORT std::string to_string(const AttributeValue &value);
} // namespace pulsegraph

#endif // PULSEGRAPH_ATTRIBUTE_H
