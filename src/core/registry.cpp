/**
 * @file registry.cpp
 * @brief Registry implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/registry.hpp"
#include "pubsubd/utils/base64.hpp"
#include "pubsubd/utils/logger.hpp"

#include <algorithm>

namespace pubsubd {
namespace core {

namespace {

bool inProject(const std::string& name, const std::string& project) {
    if (project.empty()) {
        return true;
    }
    return name.size() > project.size() &&
           name.compare(0, project.size(), project) == 0 &&
           name[project.size()] == '/';
}

// Walks an ordered name range after `startAfter`, keeping at most `limit`
// entries accepted by `filter`. The page token is the last name emitted.
template<typename It, typename Filter, typename Emit>
std::string collectPage(It begin, It end,
                        const std::string& startAfter,
                        size_t limit,
                        Filter filter,
                        Emit emit) {
    size_t emitted = 0;
    std::string last;

    for (It it = begin; it != end; ++it) {
        const std::string& name = *it;
        if (!startAfter.empty() && name <= startAfter) {
            continue;
        }
        if (!filter(name)) {
            continue;
        }
        if (emitted == limit) {
            // At least one more match exists beyond this page.
            return utils::Base64::encode(last);
        }
        emit(name);
        last = name;
        ++emitted;
    }
    return std::string();
}

// Adapts a std::map iterator to yield its key.
template<typename MapIt>
class KeyIterator {
public:
    explicit KeyIterator(MapIt it) : it_(it) {}
    const std::string& operator*() const { return it_->first; }
    KeyIterator& operator++() { ++it_; return *this; }
    bool operator!=(const KeyIterator& other) const { return it_ != other.it_; }

private:
    MapIt it_;
};

template<typename Map>
KeyIterator<typename Map::const_iterator> keysBegin(const Map& map, const std::string& startAfter) {
    return KeyIterator<typename Map::const_iterator>(
        startAfter.empty() ? map.begin() : map.upper_bound(startAfter));
}

template<typename Map>
KeyIterator<typename Map::const_iterator> keysEnd(const Map& map) {
    return KeyIterator<typename Map::const_iterator>(map.end());
}

}  // namespace

Registry::Registry(RegistryOptions options)
    : options_(options)
{
    LOG_DEBUG("Registry", "Created registry (retention={}, page_size={}/{})",
              options_.message_log_retention,
              options_.default_page_size, options_.max_page_size);
}

Status Registry::resolvePage(int32_t pageSize,
                             const std::string& pageToken,
                             size_t& outLimit,
                             std::string& outStartAfter) const {
    if (pageSize < 0) {
        return Status::invalidArgument("page_size must not be negative");
    }
    int32_t effective = pageSize == 0 ? options_.default_page_size : pageSize;
    effective = std::min(effective, options_.max_page_size);
    outLimit = static_cast<size_t>(std::max(effective, 1));

    outStartAfter.clear();
    if (!pageToken.empty()) {
        if (!utils::Base64::decode(pageToken, outStartAfter) || outStartAfter.empty()) {
            return Status::invalidArgument("Malformed page token");
        }
    }
    return Status::OK();
}

// =============================================================================
// Topics
// =============================================================================

Status Registry::createTopic(const std::string& name, TopicInfo& out) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (topics_.count(name) > 0) {
        return Status::alreadyExists("Topic already exists: " + name);
    }

    topics_.emplace(name, std::make_shared<Topic>(name, options_.message_log_retention));
    out.name = name;

    LOG_INFO("Registry", "Created topic {}", name);
    return Status::OK();
}

Status Registry::getTopic(const std::string& name, TopicInfo& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (topics_.count(name) == 0) {
        return Status::notFound("Topic not found: " + name);
    }
    out.name = name;
    return Status::OK();
}

Status Registry::deleteTopic(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = topics_.find(name);
    if (it == topics_.end()) {
        return Status::OK();
    }

    // Publishers hold mutex_ shared, so nothing reads the binding index here.
    const auto& topic = it->second;
    for (const auto& subName : topic->subscriptions) {
        auto subIt = subscriptions_.find(subName);
        if (subIt != subscriptions_.end()) {
            subIt->second->markTopicDeleted();
        }
    }

    LOG_INFO("Registry", "Deleted topic {} ({} subscription(s) detached)",
             name, topic->subscriptions.size());
    topics_.erase(it);
    return Status::OK();
}

Status Registry::listTopics(const std::string& project,
                            int32_t pageSize,
                            const std::string& pageToken,
                            ListPage<TopicInfo>& out) const {
    size_t limit = 0;
    std::string startAfter;
    Status status = resolvePage(pageSize, pageToken, limit, startAfter);
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    out.items.clear();
    out.next_page_token = collectPage(
        keysBegin(topics_, startAfter), keysEnd(topics_), startAfter, limit,
        [&project](const std::string& name) { return inProject(name, project); },
        [&out](const std::string& name) { out.items.push_back(TopicInfo{name}); });
    return Status::OK();
}

Status Registry::listTopicSubscriptions(const std::string& topic,
                                        int32_t pageSize,
                                        const std::string& pageToken,
                                        ListPage<std::string>& out) const {
    size_t limit = 0;
    std::string startAfter;
    Status status = resolvePage(pageSize, pageToken, limit, startAfter);
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return Status::notFound("Topic not found: " + topic);
    }

    std::lock_guard<std::mutex> topicLock(it->second->mutex);
    const auto& bound = it->second->subscriptions;

    out.items.clear();
    out.next_page_token = collectPage(
        startAfter.empty() ? bound.begin() : bound.upper_bound(startAfter), bound.end(),
        startAfter, limit,
        [](const std::string&) { return true; },
        [&out](const std::string& name) { out.items.push_back(name); });
    return Status::OK();
}

bool Registry::topicStats(const std::string& name, TopicStats& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = topics_.find(name);
    if (it == topics_.end()) {
        return false;
    }

    std::lock_guard<std::mutex> topicLock(it->second->mutex);
    out.name = name;
    out.published = it->second->log.totalAppended();
    out.retained = it->second->log.retainedCount();
    out.retained_bytes = it->second->log.retainedBytes();
    out.bound_subscriptions = it->second->subscriptions.size();
    return true;
}

PublishScope Registry::beginPublish(const std::string& topic) const {
    PublishScope scope;
    scope.registryLock_ = std::shared_lock<std::shared_mutex>(mutex_);

    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return PublishScope();
    }

    scope.topic_ = it->second;
    scope.topicLock_ = std::unique_lock<std::mutex>(scope.topic_->mutex);

    scope.subscriptions_.reserve(scope.topic_->subscriptions.size());
    for (const auto& subName : scope.topic_->subscriptions) {
        auto subIt = subscriptions_.find(subName);
        if (subIt != subscriptions_.end()) {
            scope.subscriptions_.push_back(subIt->second);
        }
    }
    return scope;
}

// =============================================================================
// Subscriptions
// =============================================================================

Status Registry::createSubscription(const SubscriptionInfo& request,
                                    std::shared_ptr<Subscription>& out) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (subscriptions_.count(request.name) > 0) {
        return Status::alreadyExists("Subscription already exists: " + request.name);
    }

    auto topicIt = topics_.find(request.topic);
    if (topicIt == topics_.end()) {
        return Status::notFound("Topic not found: " + request.topic);
    }

    auto subscription = std::make_shared<Subscription>(
        request.name, request.topic, request.ack_deadline_seconds, request.push_config);

    {
        std::lock_guard<std::mutex> topicLock(topicIt->second->mutex);
        topicIt->second->subscriptions.insert(request.name);
    }
    subscriptions_.emplace(request.name, subscription);

    LOG_INFO("Registry", "Created subscription {} on {}", request.name, request.topic);
    out = std::move(subscription);
    return Status::OK();
}

std::shared_ptr<Subscription> Registry::findSubscription(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = subscriptions_.find(name);
    if (it == subscriptions_.end()) {
        return nullptr;
    }
    return it->second;
}

Status Registry::deleteSubscription(const std::string& name) {
    std::shared_ptr<Subscription> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = subscriptions_.find(name);
        if (it == subscriptions_.end()) {
            return Status::OK();
        }
        removed = it->second;
        subscriptions_.erase(it);

        auto topicIt = topics_.find(removed->topic());
        if (topicIt != topics_.end()) {
            std::lock_guard<std::mutex> topicLock(topicIt->second->mutex);
            topicIt->second->subscriptions.erase(name);
        }
    }

    removed->close();
    LOG_INFO("Registry", "Deleted subscription {}", name);
    return Status::OK();
}

Status Registry::listSubscriptions(const std::string& project,
                                   int32_t pageSize,
                                   const std::string& pageToken,
                                   ListPage<SubscriptionInfo>& out) const {
    size_t limit = 0;
    std::string startAfter;
    Status status = resolvePage(pageSize, pageToken, limit, startAfter);
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    out.items.clear();
    out.next_page_token = collectPage(
        keysBegin(subscriptions_, startAfter), keysEnd(subscriptions_), startAfter, limit,
        [&project](const std::string& name) { return inProject(name, project); },
        [this, &out](const std::string& name) {
            out.items.push_back(subscriptions_.at(name)->info());
        });
    return Status::OK();
}

std::vector<std::shared_ptr<Subscription>> Registry::allSubscriptions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::shared_ptr<Subscription>> result;
    result.reserve(subscriptions_.size());
    for (const auto& [name, subscription] : subscriptions_) {
        result.push_back(subscription);
    }
    return result;
}

size_t Registry::topicCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return topics_.size();
}

size_t Registry::subscriptionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return subscriptions_.size();
}

}  // namespace core
}  // namespace pubsubd
