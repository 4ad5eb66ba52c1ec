#ifndef PULSEGRAPH_BUFFER_SOURCE_H
#define PULSEGRAPH_BUFFER_SOURCE_H

#include <pulsegraph/types/node.h>

#include <deque>

namespace pulsegraph {
    /**
     * A source fed by the acquisition layer: chunks are queued with push_chunk and published one per update.
     *
     * The channel info is checked when it is set, a broken descriptor never reaches the node. Changing the channel
     * info or the bad channels resets the source, which re-publishes the descriptor and tells everything downstream
     * that the history is no longer valid.
     */
    struct PULSEGRAPH_EXPORT BufferSource : SourceNode {
        using ptr = BufferSource*;
        using s_ptr = std::shared_ptr<BufferSource>;

        explicit BufferSource(ChannelInfo channel_info);

        [[nodiscard]] const ChannelInfo &configured_channel_info() const;

        void set_channel_info(ChannelInfo channel_info);

        void set_bad_channels(std::vector<std::string> bad_channels);

        /**
         * Queues a chunk (channels x samples). Raises ValidationError if its channel count does not match the
         * configured channel info.
         */
        void push_chunk(SignalBuffer chunk);

        [[nodiscard]] size_t pending_chunks() const;

        void clear_pending_chunks();

        [[nodiscard]] const attribute_names_t &reset_attributes() const override;

    protected:
        void do_initialize() override;

        void do_update() override;

    private:
        ChannelInfo _configured_channel_info;
        std::deque<SignalBuffer> _chunks;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_BUFFER_SOURCE_H
