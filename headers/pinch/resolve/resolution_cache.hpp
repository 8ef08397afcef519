//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef PINCH_RESOLUTION_CACHE_HPP
#define PINCH_RESOLUTION_CACHE_HPP

/**
 * @file resolution_cache.hpp
 * @brief Memoized package resolution keyed by canonical root.
 *
 * Keys are "id:<identity>" when the package identity is known and
 * "dir:<canonical directory>" otherwise. Once a directory resolves to an
 * identity, the directory key becomes an alias of the identity key, so a
 * later root that names the same package through another path is a
 * cache hit.
 *
 * Failures are cached as well. Concurrent requests for one key wait on
 * the first request instead of starting a second resolution.
 */

#include "pinch/resolve/package_resolver.hpp"

#include <atomic>
#include <cstddef>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace pinch::resolve {

    class ResolutionCache {
    public:
        using Outcome = Result<ResolvedPackage, Error>;

        ResolutionCache() = default;

        ResolutionCache(const ResolutionCache&) = delete;
        ResolutionCache& operator=(const ResolutionCache&) = delete;

        /**
         * Returns the cached outcome for the root, resolving it first if
         * no equivalent root has been seen. Thread-safe.
         */
        Outcome get_or_resolve(const ResolutionRoot& root, const PackageResolver& resolver);

        /**
         * Cache key the root maps to right now.
         */
        [[nodiscard]] std::string key_for(const ResolutionRoot& root) const;

        /**
         * Number of times a resolver was actually invoked.
         */
        [[nodiscard]] std::size_t invocation_count() const noexcept {
            return invocations_.load();
        }

        [[nodiscard]] std::size_t size() const;

        void clear();

    private:
        [[nodiscard]] std::string key_for_locked(const ResolutionRoot& root) const;

        mutable std::mutex mutex_;
        std::map<std::string, std::shared_future<Outcome>> entries_;
        std::map<std::string, std::string> aliases_;
        std::atomic<std::size_t> invocations_{0};
    };

}  // namespace pinch::resolve

#endif //PINCH_RESOLUTION_CACHE_HPP
