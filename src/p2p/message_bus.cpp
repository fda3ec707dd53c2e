#include "lanshare/p2p/message_bus.h"
#include "lanshare/base/logger.h"
#include <vector>

namespace lanshare {

SubscriptionId MessageBus::subscribe(TextCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::make_shared<TextCallback>(std::move(callback)));
    return id;
}

bool MessageBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

size_t MessageBus::publish(const std::string& sender, const std::string& payload) {
    std::vector<std::shared_ptr<TextCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            targets.push_back(callback);
        }
    }

    size_t delivered = 0;
    for (const auto& callback : targets) {
        try {
            (*callback)(sender, payload);
            ++delivered;
        } catch (const std::exception& e) {
            Logger::instance().error("Subscriber failed on message from {}: {}", sender, e.what());
        }
    }
    return delivered;
}

size_t MessageBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace lanshare
