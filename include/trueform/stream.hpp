#pragma once

#include <memory>
#include <trueform/endpoint.hpp>

namespace trueform {

    // Abstract base class for message-framed duplex connections
    // Every send/recv carries one complete message
    class Stream {
      public:
        virtual ~Stream() = default;

        // Connection establishment - client side
        // Blocks until connected, failed, or timeout_ms elapsed
        virtual dp::Res<void> connect(const WsEndpoint &endpoint, dp::u32 timeout_ms) = 0;

        // Send one message
        // Blocks until the whole frame is handed to the OS
        virtual dp::Res<void> send(const Message &msg) = 0;

        // Receive one message
        // Blocks until a complete message arrives or the receive timeout passes
        // ERROR CATEGORIZATION:
        // - timeout: nothing arrived within the receive timeout (recoverable)
        // - not_found: connection closed by either side
        // - io_error: any other failure
        virtual dp::Res<Message> recv() = 0;

        // Set receive timeout in milliseconds
        // 0 means no timeout (blocking forever)
        virtual dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) = 0;

        // Close the connection and wake a blocked recv()
        // Safe to call from another thread and more than once
        virtual void close() = 0;

        // Check if the connection is active
        virtual bool is_connected() const = 0;
    };

} // namespace trueform
