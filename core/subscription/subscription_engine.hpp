/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace singleton::subscription {

  template <typename Event, typename... Arguments>
  class Subscriber;

  using SubscriptionSetId = uint32_t;

  /**
   * Fans events out to subscribers registered for the event key. Subscribers
   * are referenced weakly and detach themselves on destruction.
   * @tparam Event key of a subscription
   * @tparam EventParams payload passed to subscribers
   */
  template <typename Event, typename... EventParams>
  class SubscriptionEngine final {
   public:
    using EventType = Event;
    using SubscriberType = Subscriber<EventType, EventParams...>;

    SubscriptionEngine() = default;

    SubscriptionEngine(const SubscriptionEngine &) = delete;
    SubscriptionEngine &operator=(const SubscriptionEngine &) = delete;

    /// Subscribers run on the calling thread, outside of the engine lock
    void notify(const EventType &key, const EventParams &...args) {
      std::vector<std::pair<SubscriptionSetId, std::shared_ptr<SubscriberType>>>
          receivers;
      {
        std::shared_lock lock{mutex_};
        auto it = subscriptions_.find(key);
        if (it == subscriptions_.end()) {
          return;
        }
        for (const auto &entry : it->second) {
          if (auto subscriber = entry.subscriber.lock()) {
            receivers.emplace_back(entry.set_id, std::move(subscriber));
          }
        }
      }
      for (const auto &[set_id, subscriber] : receivers) {
        subscriber->onNotify(set_id, key, args...);
      }
    }

   private:
    friend SubscriberType;

    struct Entry {
      SubscriptionSetId set_id;
      std::weak_ptr<SubscriberType> subscriber;
    };
    /// iterators of a list stay valid while other entries are erased
    using Entries = std::list<Entry>;
    using Handle = typename Entries::iterator;

    Handle attach(SubscriptionSetId set_id,
                  const EventType &key,
                  std::weak_ptr<SubscriberType> subscriber) {
      std::unique_lock lock{mutex_};
      auto &entries = subscriptions_[key];
      return entries.insert(entries.end(),
                            Entry{set_id, std::move(subscriber)});
    }

    void detach(const EventType &key, Handle handle) {
      std::unique_lock lock{mutex_};
      if (auto it = subscriptions_.find(key); it != subscriptions_.end()) {
        it->second.erase(handle);
        if (it->second.empty()) {
          subscriptions_.erase(it);
        }
      }
    }

    std::shared_mutex mutex_;
    std::map<EventType, Entries> subscriptions_;
  };

}  // namespace singleton::subscription
