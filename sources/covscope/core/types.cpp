//
// Created by gregorian-rayne on 02/10/26.
//

#include "covscope/types.hpp"
#include "covscope/utils/string_utils.hpp"

#include <iterator>

namespace covscope
{
    namespace {

        std::set<std::string> to_set(const std::string_view list) {
            auto entries = string_utils::split_list(list);
            return {std::make_move_iterator(entries.begin()), std::make_move_iterator(entries.end())};
        }

    }  // namespace

    ScopeQuery ScopeQuery::from_lists(
        const std::string_view modules,
        const std::string_view packages,
        const std::string_view classes
    ) {
        ScopeQuery query;
        query.target_modules = to_set(modules);
        query.target_packages = to_set(packages);
        query.target_classes = to_set(classes);
        return query;
    }

}  // namespace covscope
