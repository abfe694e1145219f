#pragma once

#include "../common/value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vetter
{
    struct CheckResult
    {
        bool valid{true};
        std::string reason;

        [[nodiscard]] static CheckResult accept()
        {
            return CheckResult{};
        }

        [[nodiscard]] static CheckResult reject(std::string reason)
        {
            return CheckResult{false, std::move(reason)};
        }
    };

    /// Precompiled predicate used by the specialized routine. Returns true when the value is accepted.
    using InlinePredicate = bool (*)(const Value& value, const void* context);

    struct InlineCheck
    {
        InlinePredicate predicate{nullptr};
        const void* context{nullptr};
        /// Source-like rendering of the check for the argument reference it was emitted for.
        std::string fragment;
    };

    /**
     * Contract every type plugged into a validator must satisfy.
     * check() is mandatory. emitInlineCheck() is optional: a capability returning std::nullopt
     * forces the whole validator onto the generic path.
     * An emitted predicate must accept exactly the values check() accepts.
     */
    class TypeCapability
    {
    public:
        virtual ~TypeCapability() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual CheckResult check(const Value& value) const = 0;

        [[nodiscard]] virtual std::optional<InlineCheck> emitInlineCheck(std::string_view argumentReference) const
        {
            (void)argumentReference;
            return std::nullopt;
        }
    };

    using TypeCapabilityPtr = std::shared_ptr<const TypeCapability>;
} // namespace vetter
