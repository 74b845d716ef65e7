#pragma once

#include "core/services/IMacLookup.hpp"
#include "core/services/INotificationSink.hpp"
#include "core/services/IProber.hpp"
#include "core/services/IResolver.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace connmon::test {

/**
 * @brief Resolver answering from a fixed table; unknown names fail.
 *
 * IP literals are returned unchanged without counting as a lookup.
 */
class FakeResolver : public core::IResolver {
public:
    std::optional<std::string> resolve(const std::string& hostname) override {
        std::lock_guard lock(mutex_);
        auto it = answers_.find(hostname);
        if (it != answers_.end()) {
            ++lookups_;
            return it->second;
        }
        bool literal = !hostname.empty() &&
                       hostname.find_first_not_of("0123456789.") == std::string::npos;
        if (literal) {
            return hostname;
        }
        ++lookups_;
        return std::nullopt;
    }

    void setAnswer(const std::string& hostname, const std::string& ip) {
        std::lock_guard lock(mutex_);
        answers_[hostname] = ip;
    }

    void clearAnswers() {
        std::lock_guard lock(mutex_);
        answers_.clear();
    }

    int lookups() const {
        std::lock_guard lock(mutex_);
        return lookups_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> answers_;
    int lookups_{0};
};

/**
 * @brief Prober whose outcome per target identity key is set by the test.
 *
 * Targets without an outcome fail with "unreachable". A handler, when set,
 * overrides the table.
 */
class ScriptedProber : public core::IProber {
public:
    using Handler = std::function<core::ProbeResult(const std::string&, const core::Target&)>;

    core::ProbeResult probe(const std::string& resolvedIp, const core::Target& target) override {
        Handler handler;
        std::optional<double> latency;
        bool known = false;
        {
            std::lock_guard lock(mutex_);
            ++calls_;
            probedIps_.push_back(resolvedIp);
            handler = handler_;
            auto it = outcomes_.find(target.identityKey());
            if (it != outcomes_.end()) {
                known = true;
                latency = it->second;
            }
        }

        if (handler) {
            return handler(resolvedIp, target);
        }
        if (known && latency) {
            core::ProbeResult result;
            result.connected = true;
            result.latencyMs = latency;
            result.timestamp = std::chrono::system_clock::now();
            return result;
        }
        return core::ProbeResult::failure("unreachable");
    }

    void setUp(const std::string& key, double latencyMs) {
        std::lock_guard lock(mutex_);
        outcomes_[key] = latencyMs;
    }

    void setDown(const std::string& key) {
        std::lock_guard lock(mutex_);
        outcomes_[key] = std::nullopt;
    }

    void setHandler(Handler handler) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    int calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::vector<std::string> probedIps() const {
        std::lock_guard lock(mutex_);
        return probedIps_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::optional<double>> outcomes_;
    Handler handler_;
    std::vector<std::string> probedIps_;
    int calls_{0};
};

class FixedMacLookup : public core::IMacLookup {
public:
    explicit FixedMacLookup(std::optional<std::string> mac) : mac_(std::move(mac)) {}

    std::optional<std::string> lookup(const std::string& /*ip*/) override {
        ++calls;
        return mac_;
    }

    int calls{0};

private:
    std::optional<std::string> mac_;
};

class RecordingSink : public core::INotificationSink {
public:
    struct Message {
        std::string group;
        std::string text;
    };

    bool send(const std::string& group, const std::string& message) override {
        std::lock_guard lock(mutex_);
        messages_.push_back({group, message});
        return accept;
    }

    std::vector<Message> messages() const {
        std::lock_guard lock(mutex_);
        return messages_;
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return messages_.size();
    }

    bool accept{true};

private:
    mutable std::mutex mutex_;
    std::vector<Message> messages_;
};

/**
 * @brief Clock the test advances by hand. Copies of clock() share state.
 */
class ManualClock {
public:
    ManualClock() : state_(std::make_shared<State>()) {
        state_->now = std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50));
    }

    std::function<std::chrono::system_clock::time_point()> clock() const {
        auto state = state_;
        return [state] {
            std::lock_guard lock(state->mutex);
            return state->now;
        };
    }

    void advance(std::chrono::system_clock::duration by) {
        std::lock_guard lock(state_->mutex);
        state_->now += by;
    }

    std::chrono::system_clock::time_point now() const {
        std::lock_guard lock(state_->mutex);
        return state_->now;
    }

private:
    struct State {
        std::mutex mutex;
        std::chrono::system_clock::time_point now;
    };
    std::shared_ptr<State> state_;
};

} // namespace connmon::test
