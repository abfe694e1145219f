#pragma once

#include "compilation_plan.hpp"

#include <ostream>

namespace vetter
{
    void print(const CompilationPlan& plan, std::ostream& stream);
}
