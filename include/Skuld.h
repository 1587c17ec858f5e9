#ifndef SKULD_LIBRARY_H
#define SKULD_LIBRARY_H

// Public umbrella header: the Planner facade plus every module factory it routes to.
#include "../src/core.hpp"
#include "../src/common/error.hpp"
#include "../src/common/cancellation.hpp"
#include "../src/config/config.hpp"
#include "../src/plan/plan.hpp"
#include "../src/graph/graph.hpp"
#include "../src/encoding/encoding.hpp"
#include "../src/model/model.hpp"
#include "../src/store/store.hpp"
#include "../src/pipeline/pipeline.hpp"
#include "../src/search/search.hpp"

#endif // SKULD_LIBRARY_H
