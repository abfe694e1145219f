#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "builtin_types.hpp"
#include "planner.hpp"
#include "spec_binder.hpp"

namespace vetter
{
namespace
{
    ParameterSpecSetPtr bindSpecs(std::vector<ParameterDeclaration> declarations)
    {
        SpecBinder binder{std::move(declarations)};
        ParameterSpecSetPtr specSet = binder.bind();
        EXPECT_TRUE(binder.diagnostics().empty());
        return specSet;
    }

    ParameterSpecSetPtr giftSpecs()
    {
        return bindSpecs({
            requiredParameter("present_name", types::nonEmptyStringType()),
            defaultedParameter("qty", types::positiveIntegerType(), Value{1}),
        });
    }

    TEST(PlannerTest, NamedPlanFetchesByKeyInDeclarationOrder)
    {
        Planner planner{giftSpecs(), ValidatorOptions{}};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());
        EXPECT_TRUE(planner.diagnostics().empty());

        ASSERT_EQ(plan->steps.size(), 2u);
        EXPECT_EQ(plan->steps[0].fetch, FetchKind::ByKey);
        EXPECT_EQ(plan->steps[0].key, "present_name");
        EXPECT_TRUE(plan->steps[0].required);
        EXPECT_EQ(plan->steps[0].defaultHandling, DefaultHandling::None);

        EXPECT_EQ(plan->steps[1].key, "qty");
        EXPECT_FALSE(plan->steps[1].required);
        EXPECT_EQ(plan->steps[1].defaultHandling, DefaultHandling::Constant);
        EXPECT_EQ(plan->steps[1].index, 1u);
    }

    TEST(PlannerTest, InlinableChecksSelectFastPath)
    {
        Planner planner{giftSpecs(), ValidatorOptions{}};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());

        EXPECT_EQ(plan->strategy, ExecutionStrategy::FastPath);
        ASSERT_TRUE(plan->steps[1].inlineCheck.has_value());
        EXPECT_EQ(plan->steps[1].inlineCheck->fragment, "is_integral(args[\"qty\"]) && args[\"qty\"] > 0");
    }

    TEST(PlannerTest, PositionalPlanFetchesByIndex)
    {
        ValidatorOptions options;
        options.sourceMode = SourceMode::Positional;
        options.outputMode = OutputMode::OrderedList;

        Planner planner{giftSpecs(), options};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());

        EXPECT_EQ(plan->steps[0].fetch, FetchKind::ByIndex);
        EXPECT_EQ(plan->steps[0].index, 0u);
        EXPECT_TRUE(plan->steps[0].key.empty());
        EXPECT_EQ(plan->steps[1].inlineCheck->fragment, "is_integral(args[1]) && args[1] > 0");
    }

    TEST(PlannerTest, OneOpaqueCheckForcesGenericFallback)
    {
        const auto even = types::makePredicateType(
            "even", [](const Value& value) { return value.isInteger() && value.asInteger() % 2 == 0; }, "an even integer");

        Planner planner{bindSpecs({
                            requiredParameter("present_name", types::nonEmptyStringType()),
                            requiredParameter("pairs", even),
                        }),
                        ValidatorOptions{}};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());

        EXPECT_EQ(plan->strategy, ExecutionStrategy::GenericFallback);
        EXPECT_TRUE(plan->steps[0].inlineCheck.has_value());
        EXPECT_FALSE(plan->steps[1].inlineCheck.has_value());
    }

    TEST(PlannerTest, OpaqueExtraValuesTypeForcesGenericFallback)
    {
        ValidatorOptions options;
        options.extraValues = types::makePredicateType(
            "short-text", [](const Value& value) { return value.isString() && value.asString().size() < 4; }, "short text");

        Planner planner{giftSpecs(), options};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());
        EXPECT_EQ(plan->strategy, ExecutionStrategy::GenericFallback);
        EXPECT_FALSE(plan->extraInlineCheck.has_value());
    }

    TEST(PlannerTest, InlinableExtraValuesKeepFastPath)
    {
        ValidatorOptions options;
        options.extraValues = types::stringType();

        Planner planner{giftSpecs(), options};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());
        EXPECT_EQ(plan->strategy, ExecutionStrategy::FastPath);
        ASSERT_TRUE(plan->extraInlineCheck.has_value());
        EXPECT_EQ(plan->extraInlineCheck->fragment, "is_string(args[extra])");
    }

    TEST(PlannerTest, RequiredAfterOptionalFailsOnlyForPositionalInput)
    {
        auto specSet = bindSpecs({
            optionalParameter("note", types::stringType()),
            requiredParameter("present_name", types::nonEmptyStringType()),
        });

        Planner named{specSet, ValidatorOptions{}};
        EXPECT_TRUE(named.plan().has_value());

        ValidatorOptions options;
        options.sourceMode = SourceMode::Positional;
        options.outputMode = OutputMode::OrderedList;
        Planner positional{specSet, options};
        EXPECT_FALSE(positional.plan().has_value());
        ASSERT_EQ(positional.diagnostics().size(), 1u);
        EXPECT_EQ(positional.diagnostics().front().code, "VETTER-E2001");
        EXPECT_EQ(positional.diagnostics().front().parameterName, "present_name");
    }

    TEST(PlannerTest, ExtraValuesNeedAMatchingOutputShape)
    {
        ValidatorOptions options;
        options.outputMode = OutputMode::OrderedList;
        options.extraValues = types::anyType();

        Planner planner{giftSpecs(), options};
        EXPECT_FALSE(planner.plan().has_value());
        ASSERT_EQ(planner.diagnostics().size(), 1u);
        EXPECT_EQ(planner.diagnostics().front().code, "VETTER-E2002");
    }

    TEST(PlannerTest, MissingSpecSetFails)
    {
        Planner planner{nullptr, ValidatorOptions{}};
        EXPECT_FALSE(planner.plan().has_value());
        ASSERT_EQ(planner.diagnostics().size(), 1u);
        EXPECT_EQ(planner.diagnostics().front().code, "VETTER-E2000");
    }

    TEST(PlannerTest, CopiesOptionsIntoPlan)
    {
        ValidatorOptions options;
        options.name = "gift";
        options.strict = false;

        Planner planner{giftSpecs(), options};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());
        EXPECT_EQ(plan->validatorName, "gift");
        EXPECT_FALSE(plan->strict);
        EXPECT_EQ(plan->sourceMode, SourceMode::Named);
        EXPECT_EQ(plan->outputMode, OutputMode::Mapped);
    }

    TEST(PlannerTest, EmptySpecSetPlansNoSteps)
    {
        Planner planner{bindSpecs({}), ValidatorOptions{}};
        const auto plan = planner.plan();
        ASSERT_TRUE(plan.has_value());
        EXPECT_TRUE(plan->steps.empty());
        EXPECT_EQ(plan->strategy, ExecutionStrategy::FastPath);
    }
} // namespace
} // namespace vetter
