#ifndef SKULD_SEARCH_HPP
#define SKULD_SEARCH_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/space.hpp"
#include "details/search.hpp"

namespace Skuld::Search {
    using SearchSpaceOptions = Details::SearchSpaceOptions;
    using SearchSpace = Details::SearchSpace;
    using SearchStatus = Details::SearchStatus;
    using RankedPlan = Details::RankedPlan;
    using SkippedPlan = Details::SkippedPlan;
    using SearchResult = Details::SearchResult;
    using SearchOptions = Details::SearchOptions;
    using PlanSearch = Details::PlanSearch;

    using Details::to_string;
    using Details::ranks_before;
    using Details::predict_plans;
}

#endif // SKULD_SEARCH_HPP
