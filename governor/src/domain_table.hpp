#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Per-domain state, each entry behind its own mutex. The map lock is held
// only to find or insert an entry, so unrelated domains never wait on each other.
// Entries live as long as the table.
template <typename State>
class DomainTable {
public:
    // Runs fn(State&) with the domain's lock held, creating the entry if needed.
    template <typename Fn>
    auto with(const std::string& domain, Fn&& fn) {
        Entry& entry = entry_for(domain);
        std::lock_guard<std::mutex> lock(entry.mutex);
        return fn(entry.state);
    }

    // Like with(), but returns false without calling fn when the domain is unknown.
    template <typename Fn>
    bool with_existing(const std::string& domain, Fn&& fn) {
        Entry* entry = nullptr;
        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            auto it = entries_.find(domain);
            if (it == entries_.end()) {
                return false;
            }
            entry = it->second.get();
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        fn(entry->state);
        return true;
    }

    std::vector<std::string> domains() const {
        std::lock_guard<std::mutex> lock(map_mutex_);
        std::vector<std::string> keys;
        keys.reserve(entries_.size());
        for (const auto& [domain, entry] : entries_) {
            keys.push_back(domain);
        }
        return keys;
    }

private:
    struct Entry {
        std::mutex mutex;
        State state;
    };

    Entry& entry_for(const std::string& domain) {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto& slot = entries_[domain];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        return *slot;
    }

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};
