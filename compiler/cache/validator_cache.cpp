#include "validator_cache.hpp"

#include "../planner/canonical.hpp"

#include <exception>
#include <utility>

namespace vetter
{
    ValidatorCache& ValidatorCache::instance()
    {
        static ValidatorCache cache;
        return cache;
    }

    CompileOutcome ValidatorCache::getOrCompile(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options)
    {
        if (!specSet)
        {
            return compileValidator(specSet, options);
        }

        const std::string descriptor = canonicalDescriptor(*specSet, options);

        std::promise<CompileOutcome> promise;
        std::shared_future<CompileOutcome> future;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const auto it = m_entries.find(descriptor);
            if (it != m_entries.end())
            {
                future = it->second;
            }
            else
            {
                future = promise.get_future().share();
                m_entries.emplace(descriptor, future);
                ++m_compilations;
                owner = true;
            }
        }

        if (owner)
        {
            // Compilation runs outside the lock; other descriptors stay available meanwhile.
            try
            {
                promise.set_value(compileValidator(specSet, options));
            }
            catch (...)
            {
                // Waiters receive the same exception; the next request compiles again.
                promise.set_exception(std::current_exception());
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_entries.erase(descriptor);
                }
                throw;
            }
        }

        return future.get();
    }

    std::size_t ValidatorCache::size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    std::size_t ValidatorCache::compilationCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_compilations;
    }

    CompileOutcome getOrCompile(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options)
    {
        return ValidatorCache::instance().getOrCompile(specSet, options);
    }
} // namespace vetter
