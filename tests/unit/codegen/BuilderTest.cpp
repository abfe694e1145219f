#include <gtest/gtest.h>

#include <optional>
#include <utility>
#include <vector>

#include "builder.hpp"
#include "builtin_types.hpp"
#include "planner.hpp"
#include "spec_binder.hpp"

namespace vetter
{
namespace
{
    ParameterSpecSetPtr giftSpecs()
    {
        SpecBinder binder{{
            requiredParameter("present_name", types::nonEmptyStringType()),
            defaultedParameter("qty", types::positiveIntegerType(), Value{1}),
        }};
        return binder.bind();
    }

    CompilationPlan planFor(const ParameterSpecSetPtr& specSet, const ValidatorOptions& options)
    {
        Planner planner{specSet, options};
        std::optional<CompilationPlan> plan = planner.plan();
        EXPECT_TRUE(plan.has_value());
        return std::move(*plan);
    }

    TEST(BuilderTest, BuildsFastRoutineForInlinablePlan)
    {
        ValidatorBuilder builder{planFor(giftSpecs(), ValidatorOptions{})};
        const CompiledValidatorPtr validator = builder.build();

        ASSERT_NE(validator, nullptr);
        EXPECT_TRUE(builder.diagnostics().empty());
        EXPECT_EQ(validator->strategy(), ExecutionStrategy::FastPath);
        EXPECT_EQ(validator->plan().steps.size(), 2u);
    }

    TEST(BuilderTest, BuildsGenericRoutineWhenPlanAsksForIt)
    {
        CompilationPlan plan = planFor(giftSpecs(), ValidatorOptions{});
        plan.strategy = ExecutionStrategy::GenericFallback;

        ValidatorBuilder builder{std::move(plan)};
        const CompiledValidatorPtr validator = builder.build();
        ASSERT_NE(validator, nullptr);
        EXPECT_EQ(validator->strategy(), ExecutionStrategy::GenericFallback);
    }

    TEST(BuilderTest, RefusesPlanThatFailsVerification)
    {
        CompilationPlan plan = planFor(giftSpecs(), ValidatorOptions{});
        plan.steps.pop_back();

        ValidatorBuilder builder{std::move(plan)};
        EXPECT_EQ(builder.build(), nullptr);
        ASSERT_EQ(builder.diagnostics().size(), 1u);
        EXPECT_EQ(builder.diagnostics().front().code, "VETTER-E2100");
    }

    TEST(BuilderTest, CompileValidatorReturnsPlannerDiagnostics)
    {
        ValidatorOptions options;
        options.outputMode = OutputMode::OrderedList;
        options.extraValues = types::anyType();

        const CompileOutcome outcome = compileValidator(giftSpecs(), options);
        EXPECT_FALSE(outcome.ok());
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().code, "VETTER-E2002");
    }

    TEST(BuilderTest, CompileValidatorProducesWorkingValidator)
    {
        ValidatorOptions options;
        options.name = "gift";

        const CompileOutcome outcome = compileValidator(giftSpecs(), options);
        ASSERT_TRUE(outcome.ok());
        EXPECT_TRUE(outcome.diagnostics.empty());
        EXPECT_EQ(outcome.validator->name(), "gift");

        const ValidationResult result = outcome.validator->validate(NamedArguments{{"present_name", Value{"Teddy Bear"}}});
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(*result.values->find("qty"), Value{1});
    }

    TEST(BuilderTest, ValidatorOutlivesCallerSpecSet)
    {
        CompiledValidatorPtr validator;
        {
            const CompileOutcome outcome = compileValidator(giftSpecs(), ValidatorOptions{});
            ASSERT_TRUE(outcome.ok());
            validator = outcome.validator;
        }

        const ValidationResult result = validator->validate(NamedArguments{{"present_name", Value{"Kite"}}, {"qty", Value{3}}});
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result.values->size(), 2u);
    }
} // namespace
} // namespace vetter
