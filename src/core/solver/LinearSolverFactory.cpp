#include "LinearSolverFactory.hpp"
#ifdef MENTOR_MATCH_HAVE_ORTOOLS
#include "OrToolsLinearSolver.hpp"
#endif

namespace mentor_match::solver {

std::unique_ptr<ILinearSolver> LinearSolverFactory::createSolver(const SolverParams& params) {
#ifdef MENTOR_MATCH_HAVE_ORTOOLS
    return std::make_unique<OrToolsLinearSolver>(params.backend);
#else
    (void)params;
    return nullptr;
#endif
}

} // namespace mentor_match::solver
