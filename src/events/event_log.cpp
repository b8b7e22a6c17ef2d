#include "events/event_log.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <utility>

namespace events {

RegistryEvent RegistryEvent::contractAdded(std::string contractAddress, std::string description) {
    RegistryEvent event;
    event.kind = EventKind::ContractAdded;
    event.contractAddress = std::move(contractAddress);
    event.description = std::move(description);
    event.exists = true;
    return event;
}

RegistryEvent RegistryEvent::descriptionUpdated(std::string contractAddress,
                                                std::string oldDescription,
                                                std::string newDescription) {
    RegistryEvent event;
    event.kind = EventKind::ContractDescriptionUpdated;
    event.contractAddress = std::move(contractAddress);
    event.oldDescription = std::move(oldDescription);
    event.description = std::move(newDescription);
    event.exists = true;
    return event;
}

RegistryEvent RegistryEvent::contractRemoved(std::string contractAddress) {
    RegistryEvent event;
    event.kind = EventKind::ContractRemoved;
    event.contractAddress = std::move(contractAddress);
    event.exists = false;
    return event;
}

RegistryEvent RegistryEvent::loopLimitUpdated(std::uint64_t oldLimit, std::uint64_t newLimit) {
    RegistryEvent event;
    event.kind = EventKind::LoopLimitUpdated;
    event.oldLimit = oldLimit;
    event.newLimit = newLimit;
    return event;
}

RegistryEvent RegistryEvent::roleGranted(access::Role role, std::string account, std::string sender) {
    RegistryEvent event;
    event.kind = EventKind::RoleGranted;
    event.role = role;
    event.account = std::move(account);
    event.sender = std::move(sender);
    return event;
}

std::string toString(EventKind kind) {
    switch (kind) {
    case EventKind::ContractAdded:
        return "ContractAdded";
    case EventKind::ContractDescriptionUpdated:
        return "ContractDescriptionUpdated";
    case EventKind::ContractRemoved:
        return "ContractRemoved";
    case EventKind::LoopLimitUpdated:
        return "LoopLimitUpdated";
    case EventKind::RoleGranted:
        return "RoleGranted";
    }

    return "Unknown";
}

std::string format(const RegistryEvent& event) {
    std::ostringstream out;
    out << '#' << event.sequence << ' ' << toString(event.kind);
    switch (event.kind) {
    case EventKind::ContractAdded:
        out << " address=" << event.contractAddress << " description=\"" << event.description
            << "\" exists=" << std::boolalpha << event.exists;
        break;
    case EventKind::ContractDescriptionUpdated:
        out << " address=" << event.contractAddress << " old=\"" << event.oldDescription << "\" new=\""
            << event.description << '"';
        break;
    case EventKind::ContractRemoved:
        out << " address=" << event.contractAddress << " exists=" << std::boolalpha << event.exists;
        break;
    case EventKind::LoopLimitUpdated:
        out << " old=" << event.oldLimit << " new=" << event.newLimit;
        break;
    case EventKind::RoleGranted:
        out << " role=" << access::toString(event.role) << " account=" << event.account
            << " sender=" << event.sender;
        break;
    }
    return out.str();
}

EventLog::EventLog(std::size_t maxEntries, Logger* logger)
    : maxEntries_(std::max<std::size_t>(1, maxEntries)), logger_(logger) {}

std::vector<RegistryEvent> EventLog::record(std::vector<RegistryEvent> batch) {
    std::lock_guard<std::mutex> guard(mutex_);
    for (auto& event : batch) {
        event.sequence = ++lastSequence_;
        if (entries_.size() >= maxEntries_) {
            entries_.pop_front();
        }
        entries_.push_back(event);
    }
    return batch;
}

void EventLog::notify(const std::vector<RegistryEvent>& recorded) const {
    if (recorded.empty()) {
        return;
    }

    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto& event : recorded) {
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& ex) {
                if (logger_ != nullptr) {
                    logger_->error("events", "listener failed on #" + std::to_string(event.sequence) + " " +
                                                 toString(event.kind) + ": " + ex.what());
                }
            }
        }
    }
}

void EventLog::publish(std::vector<RegistryEvent> batch) {
    notify(record(std::move(batch)));
}

std::size_t EventLog::subscribe(EventListener listener) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!listener) {
        return 0;
    }
    const std::size_t id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool EventLog::unsubscribe(std::size_t id) {
    std::lock_guard<std::mutex> guard(mutex_);
    return listeners_.erase(id) > 0;
}

std::vector<RegistryEvent> EventLog::entries() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return std::vector<RegistryEvent>(entries_.begin(), entries_.end());
}

std::vector<RegistryEvent> EventLog::entriesSince(std::uint64_t sequence) const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<RegistryEvent> out;
    for (const auto& event : entries_) {
        if (event.sequence > sequence) {
            out.push_back(event);
        }
    }
    return out;
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

bool EventLog::empty() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.empty();
}

std::uint64_t EventLog::lastSequence() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return lastSequence_;
}

std::size_t EventLog::maxEntries() const {
    return maxEntries_;
}

} // namespace events
