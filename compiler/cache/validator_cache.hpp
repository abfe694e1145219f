#pragma once

#include "../codegen/builder.hpp"
#include "../planner/compilation_plan.hpp"
#include "../spec/parameter_spec.hpp"

#include <cstddef>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vetter
{
    /**
     * Process-wide store of compiled validators keyed by canonical descriptor.
     * Entries are created on first request and never evicted. Concurrent requests for a
     * descriptor that is still compiling wait for that single compilation.
     */
    class ValidatorCache
    {
    public:
        [[nodiscard]] static ValidatorCache& instance();

        ValidatorCache() = default;
        ValidatorCache(const ValidatorCache&) = delete;
        ValidatorCache& operator=(const ValidatorCache&) = delete;

        [[nodiscard]] CompileOutcome getOrCompile(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options);

        [[nodiscard]] std::size_t size() const;
        /// Number of compilations actually run, as opposed to requests served.
        [[nodiscard]] std::size_t compilationCount() const;

    private:
        mutable std::mutex m_mutex;
        std::unordered_map<std::string, std::shared_future<CompileOutcome>> m_entries;
        std::size_t m_compilations{0};
    };

    [[nodiscard]] CompileOutcome getOrCompile(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options);
} // namespace vetter
