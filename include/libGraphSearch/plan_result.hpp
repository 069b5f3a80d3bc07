#pragma once

#include <algorithm>
#include <utility>
#include <vector>

#include "node.hpp"

namespace libGraphSearch
{
    /*! \brief Flattened solution of a search

        \tparam State Custom state for the search. Needs to be copy'able
        \tparam Action Custom action for the search. Needs to be copy'able
        \tparam Cost Custom Cost type (integer or floating point types)
    */
    template <typename State, typename Action, typename Cost>
    struct PlanResult
    {
        //! states from start to goal and the cost to reach each of them
        std::vector<std::pair<State, Cost> > states;
        //! actions and their cost
        std::vector<std::pair<Action, Cost> > actions;
        //! actual cost of the result
        Cost cost = Cost(0);
    };

    // Fills plan from a found result. Returns false and leaves plan empty otherwise.
    template <typename State, typename Action, typename Cost>
    bool make_plan_result(const SearchResult<State, Action, Cost>& result, PlanResult<State, Action, Cost>& plan)
    {
        plan.states.clear();
        plan.actions.clear();
        plan.cost = Cost(0);

        if (!result.is_found())
        {
            return false;
        }

        for (const Node<State, Action, Cost>* current = result.node().get(); current != nullptr;
             current = current->parent.get())
        {
            plan.states.push_back(std::make_pair(current->state, current->path_cost));
            if (current->parent)
            {
                plan.actions.push_back(
                    std::make_pair(*current->action, current->path_cost - current->parent->path_cost));
            }
        }

        std::reverse(plan.states.begin(), plan.states.end());
        std::reverse(plan.actions.begin(), plan.actions.end());
        plan.cost = result.path_cost();

        return true;
    }

}  // namespace libGraphSearch
