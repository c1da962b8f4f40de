#include "crashrelay/network/MemoryRelay.hpp"

#include <algorithm>
#include <iterator>
#include <thread>

namespace crashrelay::network {

namespace {

class MemoryChannel : public Channel {
public:
    MemoryChannel(std::string url, std::shared_ptr<MemoryRelay> relay)
        : url_(std::move(url)), relay_(std::move(relay)) {}

    ~MemoryChannel() override { disconnect(); }

    const std::string& url() const noexcept override { return url_; }

    Status connect(std::chrono::milliseconds) override {
        if (!relay_) {
            return Status::failure(ErrorCode::Transport, "unknown relay " + url_);
        }
        if (relay_->offline()) {
            return Status::failure(ErrorCode::Transport, "connection refused by " + url_);
        }
        relay_->note_connect();
        connected_ = true;
        return Status::success();
    }

    Status publish(const TransportEvent& event, std::chrono::milliseconds timeout) override {
        if (!connected_) {
            return Status::failure(ErrorCode::Transport, "not connected");
        }
        return relay_->accept(event, timeout);
    }

    bool query_by_id(const std::string& id, std::uint16_t kind, std::chrono::milliseconds) override {
        if (!connected_ || relay_->offline()) {
            return false;
        }
        return relay_->contains(id, kind);
    }

    void disconnect() noexcept override { connected_ = false; }

private:
    std::string url_;
    std::shared_ptr<MemoryRelay> relay_;
    bool connected_{false};
};

}  // namespace

MemoryRelay::MemoryRelay(std::string url)
    : url_(std::move(url)) {}

void MemoryRelay::set_offline(bool offline) {
    std::scoped_lock lock(mutex_);
    offline_ = offline;
}

void MemoryRelay::set_fail_publish(bool fail) {
    std::scoped_lock lock(mutex_);
    fail_publish_ = fail;
}

void MemoryRelay::set_drop_published(bool drop) {
    std::scoped_lock lock(mutex_);
    drop_published_ = drop;
}

void MemoryRelay::set_publish_delay(std::chrono::milliseconds delay) {
    std::scoped_lock lock(mutex_);
    publish_delay_ = delay;
}

bool MemoryRelay::offline() const {
    std::scoped_lock lock(mutex_);
    return offline_;
}

Status MemoryRelay::accept(const TransportEvent& event, std::chrono::milliseconds timeout) {
    std::chrono::milliseconds delay{0};
    {
        std::scoped_lock lock(mutex_);
        ++publish_attempts_;
        delay = publish_delay_;
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(std::min(delay, timeout));
        if (delay > timeout) {
            return Status::failure(ErrorCode::Timeout, "publish to " + url_ + " timed out");
        }
    }

    std::scoped_lock lock(mutex_);
    if (offline_) {
        return Status::failure(ErrorCode::Transport, url_ + " went offline");
    }
    if (fail_publish_) {
        return Status::failure(ErrorCode::Transport, url_ + " rejected event");
    }
    ++publish_count_;
    if (!drop_published_) {
        const auto duplicate = std::any_of(events_.begin(), events_.end(), [&](const TransportEvent& stored) {
            return stored.id == event.id;
        });
        if (!duplicate) {
            events_.push_back(event);
        }
    }
    return Status::success();
}

bool MemoryRelay::contains(const std::string& id, std::uint16_t kind) const {
    std::scoped_lock lock(mutex_);
    return std::any_of(events_.begin(), events_.end(), [&](const TransportEvent& event) {
        return event.id == id && event.kind == kind;
    });
}

std::optional<TransportEvent> MemoryRelay::find(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = std::find_if(events_.begin(), events_.end(), [&](const TransportEvent& event) {
        return event.id == id;
    });
    if (it == events_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<TransportEvent> MemoryRelay::events() const {
    std::scoped_lock lock(mutex_);
    return events_;
}

std::vector<TransportEvent> MemoryRelay::events_of_kind(std::uint16_t kind) const {
    std::scoped_lock lock(mutex_);
    std::vector<TransportEvent> matching;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(matching), [kind](const TransportEvent& event) {
        return event.kind == kind;
    });
    return matching;
}

std::size_t MemoryRelay::publish_count() const {
    std::scoped_lock lock(mutex_);
    return publish_count_;
}

std::size_t MemoryRelay::publish_attempts() const {
    std::scoped_lock lock(mutex_);
    return publish_attempts_;
}

std::size_t MemoryRelay::connect_count() const {
    std::scoped_lock lock(mutex_);
    return connect_count_;
}

void MemoryRelay::note_connect() {
    std::scoped_lock lock(mutex_);
    ++connect_count_;
}

MemoryRelayNetwork::MemoryRelayNetwork(const std::vector<std::string>& urls) {
    for (const auto& url : urls) {
        add_relay(url);
    }
}

MemoryRelay& MemoryRelayNetwork::add_relay(const std::string& url) {
    std::scoped_lock lock(mutex_);
    auto& slot = relays_[url];
    if (!slot) {
        slot = std::make_shared<MemoryRelay>(url);
    }
    return *slot;
}

MemoryRelay* MemoryRelayNetwork::relay(const std::string& url) const {
    std::scoped_lock lock(mutex_);
    const auto it = relays_.find(url);
    return it == relays_.end() ? nullptr : it->second.get();
}

std::vector<std::string> MemoryRelayNetwork::urls() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(relays_.size());
    for (const auto& [url, relay] : relays_) {
        result.push_back(url);
    }
    return result;
}

std::unique_ptr<Channel> MemoryRelayNetwork::open(const std::string& url) {
    std::shared_ptr<MemoryRelay> relay;
    {
        std::scoped_lock lock(mutex_);
        const auto it = relays_.find(url);
        if (it != relays_.end()) {
            relay = it->second;
        }
    }
    return std::make_unique<MemoryChannel>(url, std::move(relay));
}

}  // namespace crashrelay::network
