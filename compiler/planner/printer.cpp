#include "printer.hpp"

#include <ostream>

namespace vetter
{
    namespace
    {
        void printIndent(std::ostream& stream, int level)
        {
            for (int i = 0; i < level; ++i)
            {
                stream << "  ";
            }
        }

        const char* defaultLabel(DefaultHandling handling)
        {
            switch (handling)
            {
            case DefaultHandling::Constant:
                return "constant";
            case DefaultHandling::Factory:
                return "factory";
            case DefaultHandling::None:
                break;
            }
            return "none";
        }
    } // namespace

    void print(const CompilationPlan& plan, std::ostream& stream)
    {
        stream << "validator " << (plan.validatorName.empty() ? "<anonymous>" : plan.validatorName) << " {\n";
        printIndent(stream, 1);
        stream << "source " << sourceModeName(plan.sourceMode) << ", output " << outputModeName(plan.outputMode)
               << (plan.strict ? ", strict" : ", lenient") << "\n";
        printIndent(stream, 1);
        stream << "strategy " << strategyName(plan.strategy) << "\n";

        for (const auto& step : plan.steps)
        {
            printIndent(stream, 1);
            if (step.fetch == FetchKind::ByKey)
            {
                stream << "fetch key \"" << step.key << "\"";
            }
            else
            {
                stream << "fetch index " << step.index;
            }
            stream << (step.required ? " required" : " optional");
            if (step.defaultHandling != DefaultHandling::None)
            {
                stream << " default=" << defaultLabel(step.defaultHandling);
                if (step.defaultHandling == DefaultHandling::Constant && step.parameter != nullptr)
                {
                    stream << '(' << step.parameter->defaultValue->constantValue().describe() << ')';
                }
            }
            if (step.type != nullptr)
            {
                stream << " type " << step.type->name();
            }
            stream << "\n";

            printIndent(stream, 2);
            if (step.inlineCheck.has_value())
            {
                stream << "inline " << step.inlineCheck->fragment << "\n";
            }
            else
            {
                stream << "call check()\n";
            }
        }

        if (plan.extraValues)
        {
            printIndent(stream, 1);
            stream << "extra values type " << plan.extraValues->name() << "\n";
            printIndent(stream, 2);
            if (plan.extraInlineCheck.has_value())
            {
                stream << "inline " << plan.extraInlineCheck->fragment << "\n";
            }
            else
            {
                stream << "call check()\n";
            }
        }
        else if (plan.strict)
        {
            printIndent(stream, 1);
            stream << (plan.sourceMode == SourceMode::Named ? "reject undeclared keys\n" : "reject surplus values\n");
        }

        stream << "}\n";
    }
} // namespace vetter
