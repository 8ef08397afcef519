//
// Created by gregorian-rayne on 2/5/26.
//

#include "pinch/resolve/resolution_cache.hpp"
#include "pinch/utils/path_utils.hpp"
#include "pinch/utils/string_utils.hpp"

#include <exception>
#include <memory>

namespace pinch::resolve {

    namespace {

        std::string identity_key(const std::string_view identity) {
            return "id:" + string_utils::to_lower(string_utils::trim(identity));
        }

        std::string directory_key(const fs::path& directory) {
            return "dir:" + path_utils::canonical_key(directory);
        }

    }  // namespace

    std::string ResolutionCache::key_for_locked(const ResolutionRoot& root) const {
        if (!string_utils::trim(root.identity).empty()) {
            return identity_key(root.identity);
        }
        auto key = directory_key(root.directory);
        if (const auto it = aliases_.find(key); it != aliases_.end()) {
            return it->second;
        }
        return key;
    }

    std::string ResolutionCache::key_for(const ResolutionRoot& root) const {
        std::lock_guard lock(mutex_);
        return key_for_locked(root);
    }

    ResolutionCache::Outcome ResolutionCache::get_or_resolve(const ResolutionRoot& root,
                                                             const PackageResolver& resolver) {
        auto promise = std::make_shared<std::promise<Outcome>>();
        std::string key;
        {
            std::unique_lock lock(mutex_);
            key = key_for_locked(root);
            if (const auto it = entries_.find(key); it != entries_.end()) {
                const auto pending = it->second;
                lock.unlock();
                return pending.get();
            }
            entries_.emplace(key, promise->get_future().share());
            if (!root.directory.empty()) {
                if (auto dir = directory_key(root.directory); dir != key) {
                    aliases_.emplace(std::move(dir), key);
                }
            }
        }

        ++invocations_;
        Outcome outcome = [&] {
            try {
                return resolver.resolve(root);
            } catch (const std::exception& e) {
                return Outcome::failure(Error::resolution_error(e.what(), root.directory.string()));
            } catch (...) {
                // Waiters share this entry, so the outcome must be set either way
                return Outcome::failure(Error::resolution_error("resolver threw a non-standard exception",
                                                                root.directory.string()));
            }
        }();

        {
            std::lock_guard lock(mutex_);
            if (outcome.is_ok()) {
                const auto resolved = identity_key(outcome.value().identity);
                if (resolved != key) {
                    entries_.emplace(resolved, entries_.at(key));
                    if (!root.directory.empty()) {
                        aliases_[directory_key(root.directory)] = resolved;
                    }
                }
            }
        }

        promise->set_value(outcome);
        return outcome;
    }

    std::size_t ResolutionCache::size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void ResolutionCache::clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        aliases_.clear();
        invocations_ = 0;
    }

}  // namespace pinch::resolve
