#ifndef PARETO_LIBRARY_H
#define PARETO_LIBRARY_H

#include "../src/common/errors.hpp"
#include "../src/common/model.hpp"
#include "../src/common/flatten.hpp"
#include "../src/common/save_load.hpp"
#include "../src/common/config.hpp"

#include "../src/data/stream.hpp"
#include "../src/data/simplex.hpp"
#include "../src/loss/loss.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/evaluation/evaluation.hpp"

#include "../src/exploration/boundary.hpp"
#include "../src/exploration/estimator.hpp"
#include "../src/exploration/momentum.hpp"
#include "../src/exploration/hvp.hpp"
#include "../src/exploration/options.hpp"
#include "../src/exploration/controller.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Everything is header-only; modules live under src/ and are pulled in here.
//  - Min-norm and Krylov solvers are supplied by the caller through the
//    AlphaSolver / LinearSolver boundaries in exploration/boundary.hpp.

#endif // PARETO_LIBRARY_H
