#pragma once
#include <functional>
#include <memory>
#include <string>

namespace dingstream {

    struct DownstreamFrame;  // Forward-declaration
    struct EventData;        // Forward-declaration
    struct EventAck;         // Forward-declaration
    class ITransport;        // Forward-declaration

    /// Catch-all handler for EVENT frames; its result is acknowledged upstream.
    using EventHandler = std::function<EventAck(const EventData&)>;

    /// Topic handler receiving the undecoded CALLBACK frame.
    using RawTopicHandler = std::function<void(const DownstreamFrame&)>;

    /// Produces a fresh, unopened transport for each connection epoch.
    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

    /// Frames are shared read-only between the dispatcher and every topic consumer.
    using FramePtr = std::shared_ptr<const DownstreamFrame>;

}
