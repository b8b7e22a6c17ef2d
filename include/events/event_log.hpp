#pragma once

#include "access/role_table.hpp"
#include "utils/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace events {

enum class EventKind {
    ContractAdded,
    ContractDescriptionUpdated,
    ContractRemoved,
    LoopLimitUpdated,
    RoleGranted
};

struct RegistryEvent {
    std::uint64_t sequence = 0;
    EventKind kind = EventKind::ContractAdded;
    std::string contractAddress;
    // New description for updates, the stored one for additions.
    std::string description;
    std::string oldDescription;
    bool exists = false;
    std::uint64_t oldLimit = 0;
    std::uint64_t newLimit = 0;
    access::Role role = access::Role::Manager;
    std::string account;
    std::string sender;

    static RegistryEvent contractAdded(std::string contractAddress, std::string description);
    static RegistryEvent descriptionUpdated(std::string contractAddress,
                                            std::string oldDescription,
                                            std::string newDescription);
    static RegistryEvent contractRemoved(std::string contractAddress);
    static RegistryEvent loopLimitUpdated(std::uint64_t oldLimit, std::uint64_t newLimit);
    static RegistryEvent roleGranted(access::Role role, std::string account, std::string sender);
};

[[nodiscard]] std::string toString(EventKind kind);
[[nodiscard]] std::string format(const RegistryEvent& event);

using EventListener = std::function<void(const RegistryEvent&)>;

class EventLog {
public:
    // Listener failures are reported to the logger, never to the publisher.
    explicit EventLog(std::size_t maxEntries = 1'000, Logger* logger = nullptr);

    // Appends the whole batch with consecutive sequence numbers. Listeners are not called.
    std::vector<RegistryEvent> record(std::vector<RegistryEvent> batch);
    // Calls every listener subscribed at call time, without holding the log's lock.
    void notify(const std::vector<RegistryEvent>& recorded) const;
    void publish(std::vector<RegistryEvent> batch);

    [[nodiscard]] std::size_t subscribe(EventListener listener);
    [[nodiscard]] bool unsubscribe(std::size_t id);

    [[nodiscard]] std::vector<RegistryEvent> entries() const;
    [[nodiscard]] std::vector<RegistryEvent> entriesSince(std::uint64_t sequence) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::uint64_t lastSequence() const;
    [[nodiscard]] std::size_t maxEntries() const;

private:
    std::size_t maxEntries_ = 1'000;
    std::deque<RegistryEvent> entries_;
    std::uint64_t lastSequence_ = 0;
    std::size_t nextListenerId_ = 1;
    std::map<std::size_t, EventListener> listeners_;
    Logger* logger_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace events
