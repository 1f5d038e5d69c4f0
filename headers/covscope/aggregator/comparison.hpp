//
// Created by gregorian-rayne on 02/15/26.
//

#ifndef COVSCOPE_COMPARISON_HPP
#define COVSCOPE_COMPARISON_HPP

#include "covscope/types.hpp"
#include "covscope/result.hpp"

namespace covscope::aggregator {

    /**
     * Computes current minus baseline.
     *
     * improved_classes lists baseline worst classes absent from the current
     * list; new_worst_classes lists current worst classes absent from the
     * baseline list. Both keep the order of the list they come from.
     *
     * @return The delta, or InvalidArgument if either summary is a failure.
     */
    [[nodiscard]] Result<CoverageDelta> compare_summaries(
        const CoverageSummary& baseline,
        const CoverageSummary& current
    );

}  // namespace covscope::aggregator

#endif //COVSCOPE_COMPARISON_HPP
