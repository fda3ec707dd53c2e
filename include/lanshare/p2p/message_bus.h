#ifndef LANSHARE_P2P_MESSAGE_BUS_H
#define LANSHARE_P2P_MESSAGE_BUS_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lanshare {

using SubscriptionId = uint64_t;

// on_text_received(sender_identity, payload)
using TextCallback = std::function<void(const std::string&, const std::string&)>;

// Push channel from the receive path to subscribers. Callbacks run on the
// publishing thread, in subscription order.
class MessageBus {
public:
    SubscriptionId subscribe(TextCallback callback);
    bool unsubscribe(SubscriptionId id);

    // Returns the number of subscribers that received the message. A throwing
    // subscriber is logged and skipped.
    size_t publish(const std::string& sender, const std::string& payload);

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, std::shared_ptr<TextCallback>> subscribers_;
};

} // namespace lanshare

#endif // LANSHARE_P2P_MESSAGE_BUS_H
