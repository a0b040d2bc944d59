/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "subscription/subscription_engine.hpp"

namespace singleton::subscription {

  /**
   * Receives events of the keys it is subscribed to from a SubscriptionEngine
   * and hands them to its callback. Must be owned by a shared_ptr.
   * @tparam Key is a type of a subscription Key.
   * @tparam Arguments is a set of types of event payload.
   */
  template <typename Key, typename... Arguments>
  class Subscriber final
      : public std::enable_shared_from_this<Subscriber<Key, Arguments...>> {
   public:
    using KeyType = Key;
    using EngineType = SubscriptionEngine<KeyType, Arguments...>;
    using CallbackFnType = std::function<void(
        SubscriptionSetId, const KeyType &, const Arguments &...)>;

    explicit Subscriber(std::shared_ptr<EngineType> engine)
        : engine_{std::move(engine)} {}

    ~Subscriber() {
      unsubscribe();
    }

    Subscriber(const Subscriber &) = delete;
    Subscriber &operator=(const Subscriber &) = delete;

    void setCallback(CallbackFnType &&callback) {
      std::lock_guard lock{callback_mutex_};
      callback_ = std::move(callback);
    }

    SubscriptionSetId generateSubscriptionSetId() {
      return ++last_set_id_;
    }

    /// Subscribing twice to the same key within one set has no effect
    void subscribe(SubscriptionSetId set_id, const KeyType &key) {
      std::lock_guard lock{subscriptions_mutex_};
      if (not keys_.emplace(set_id, key).second) {
        return;
      }
      handles_.emplace_back(
          key, engine_->attach(set_id, key, this->weak_from_this()));
    }

    /// Drops every subscription of every set
    void unsubscribe() {
      std::lock_guard lock{subscriptions_mutex_};
      for (auto &[key, handle] : handles_) {
        engine_->detach(key, handle);
      }
      handles_.clear();
      keys_.clear();
    }

    void onNotify(SubscriptionSetId set_id,
                  const KeyType &key,
                  const Arguments &...args) {
      CallbackFnType callback;
      {
        std::lock_guard lock{callback_mutex_};
        callback = callback_;
      }
      if (callback) {
        callback(set_id, key, args...);
      }
    }

   private:
    std::shared_ptr<EngineType> engine_;
    std::atomic<SubscriptionSetId> last_set_id_{0};

    std::mutex subscriptions_mutex_;
    std::set<std::pair<SubscriptionSetId, KeyType>> keys_;
    std::vector<std::pair<KeyType, typename EngineType::Handle>> handles_;

    std::mutex callback_mutex_;
    CallbackFnType callback_;
  };

}  // namespace singleton::subscription
