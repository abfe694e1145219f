#pragma once

#include "compilation_plan.hpp"

namespace vetter
{
    /**
     * Check the structural invariants of a plan before it is built.
     * Returns true when every step matches its parameter and the chosen strategy is executable.
     */
    bool verify(const CompilationPlan& plan);
}
