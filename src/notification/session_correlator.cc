#include "session_correlator.h"
#include "upload/upload_coordinator.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace notification {

SessionCorrelator::~SessionCorrelator() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [client_id, binding] : channels_) {
        binding.channel->unsubscribe(binding.subscription);
    }
    channels_.clear();
}

bool SessionCorrelator::bind_channel(NotificationChannel& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (channels_.contains(channel.client_id())) {
        spdlog::warn("[SessionCorrelator::bind_channel] Channel for {} is already bound",
                     channel.client_id());
        return false;
    }
    const auto subscription = channel.subscribe(*this);
    channels_.emplace(channel.client_id(), Binding{&channel, subscription});
    return true;
}

void SessionCorrelator::unbind_channel(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(client_id);
    if (it == channels_.end()) {
        return;
    }
    it->second.channel->unsubscribe(it->second.subscription);
    channels_.erase(it);
}

void SessionCorrelator::attach(upload::UploadCoordinator& coordinator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& coordinators = sessions_[coordinator.client_id()];
    if (std::find(coordinators.begin(), coordinators.end(), &coordinator) == coordinators.end()) {
        coordinators.push_back(&coordinator);
    }
}

void SessionCorrelator::detach(upload::UploadCoordinator& coordinator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(coordinator.client_id());
    if (it == sessions_.end()) {
        return;
    }
    std::erase(it->second, &coordinator);
    if (it->second.empty()) {
        sessions_.erase(it);
    }
}

std::size_t SessionCorrelator::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::size_t SessionCorrelator::coordinator_count(const std::string& client_id) const {
    return coordinators_for(client_id).size();
}

std::vector<upload::UploadCoordinator*> SessionCorrelator::coordinators_for(
    const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(client_id);
    if (it == sessions_.end()) {
        return {};
    }
    return it->second;
}

void SessionCorrelator::on_processing_complete(const std::string& client_id,
                                               const ProcessingCompletionEvent& event) {
    for (auto* coordinator : coordinators_for(client_id)) {
        if (coordinator->document_id() == event.document_id) {
            coordinator->notify_processing_complete(event);
            return;
        }
    }
    spdlog::debug("[SessionCorrelator] No upload in session {} is waiting for document {}",
                  client_id,
                  event.document_id);
}

void SessionCorrelator::on_channel_error(const std::string& client_id, const ChannelError& error) {
    spdlog::warn("[SessionCorrelator] Session {} lost its notification channel: {}",
                 client_id,
                 error.message);
    for (auto* coordinator : coordinators_for(client_id)) {
        coordinator->notify_channel_lost();
    }
}

void SessionCorrelator::on_channel_open(const std::string& client_id) {
    for (auto* coordinator : coordinators_for(client_id)) {
        coordinator->notify_channel_restored();
    }
}

} // namespace notification
