#pragma once

#include "channel_observer.h"
#include "notification_channel.h"
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace upload {
class UploadCoordinator;
}

namespace notification {

// Routes pushed completion events from each client's notification channel to the
// coordinator whose in-flight document they name. Events are handed over without
// blocking the channel's read loop.
class SessionCorrelator : public ChannelObserver {
  public:
    SessionCorrelator() = default;
    ~SessionCorrelator() override;

    SessionCorrelator(const SessionCorrelator&) = delete;
    SessionCorrelator& operator=(const SessionCorrelator&) = delete;

    // Returns false if a channel is already bound for the same client id.
    bool bind_channel(NotificationChannel& channel);
    void unbind_channel(const std::string& client_id);

    void attach(upload::UploadCoordinator& coordinator);
    void detach(upload::UploadCoordinator& coordinator);

    std::size_t session_count() const;
    std::size_t coordinator_count(const std::string& client_id) const;

    void on_processing_complete(const std::string& client_id,
                                const ProcessingCompletionEvent& event) override;
    void on_channel_error(const std::string& client_id, const ChannelError& error) override;
    void on_channel_open(const std::string& client_id) override;

  private:
    struct Binding {
        NotificationChannel* channel;
        NotificationChannel::SubscriptionId subscription;
    };

    std::vector<upload::UploadCoordinator*> coordinators_for(const std::string& client_id) const;

    mutable std::mutex mutex_;
    std::map<std::string, Binding> channels_;
    std::map<std::string, std::vector<upload::UploadCoordinator*>> sessions_;
};

} // namespace notification
