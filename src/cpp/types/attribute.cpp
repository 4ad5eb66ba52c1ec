#include <pulsegraph/types/attribute.h>

namespace pulsegraph {
    const ChannelInfo &as_channel_info(const AttributeValue &value, std::string_view context) {
        auto info = std::get_if<ChannelInfo>(&value);
        if (info == nullptr) {
            throw_error<ValidationError>("{} expected a channel info, got: {}", context, to_string(value));
        }
        return *info;
    }

    AttributeValue reduce_to_channel_labels(const AttributeValue &value) {
        return as_channel_info(value, "reduce_to_channel_labels").channel_names();
    }

    AttributeValue reduce_to_channel_count(const AttributeValue &value) {
        return static_cast<std::int64_t>(as_channel_info(value, "reduce_to_channel_count").channel_count());
    }

    std::string to_string(const AttributeValue &value) {
        return std::visit(
            [](const auto &v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "None";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "True" : "False";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format("'{}'", v);
                } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    return fmt::format("[{}]", fmt::join(v, ", "));
                } else if constexpr (std::is_same_v<T, ChannelInfo>) {
                    return fmt::format("ChannelInfo(nchan={}, sfreq={}, bads=[{}])", v.channel_count(),
                                       v.sampling_frequency, fmt::join(v.bads, ", "));
                } else {
                    return fmt::format("{}", v);
                }
            },
            value);
    }
} // namespace pulsegraph
