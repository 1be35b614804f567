#pragma once

#include "processing_event.h"
#include <string>

namespace notification {

struct ChannelError {
    std::string message;
};

// Callbacks run on the channel's read loop and must return without blocking.
class ChannelObserver {
  public:
    virtual ~ChannelObserver() = default;

    virtual void on_processing_complete(const std::string& client_id,
                                        const ProcessingCompletionEvent& event)
        = 0;
    virtual void on_channel_error(const std::string& client_id, const ChannelError& error) = 0;
    virtual void on_channel_open(const std::string& client_id) { (void) client_id; }
};

} // namespace notification
