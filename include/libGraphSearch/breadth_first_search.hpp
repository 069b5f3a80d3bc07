#pragma once

#include <deque>
#include <functional>
#include <iostream>
#include <unordered_set>

#include "expand.hpp"
#include "node.hpp"
#include "problem.hpp"

namespace libGraphSearch
{

/*!
  \example route_search.cpp Route finding on a weighted road map loaded from
  YAML
*/

    struct SearchStatistics
    {
        //! nodes taken from the frontier
        size_t num_expanded_nodes = 0;
        //! children produced by expand
        size_t num_generated_nodes = 0;
        //! nodes pushed to the frontier, including the root
        size_t num_enqueued_nodes = 0;

        friend std::ostream& operator<<(std::ostream& os, const SearchStatistics& statistics)
        {
            return os << "expanded: " << statistics.num_expanded_nodes
                      << " generated: " << statistics.num_generated_nodes
                      << " enqueued: " << statistics.num_enqueued_nodes;
        }
    };

/*! \brief Breadth-first search

This class implements uninformed breadth-first search. The frontier is a FIFO
queue, the reached set stores every state that entered the frontier so that no
state is queued twice. Children are goal tested as soon as they are generated.

The returned path has the minimum number of actions. Action costs are summed
along that path but never used to order the search, so on a weighted problem
the result is not necessarily the cheapest path.

\tparam State Custom state for the search. Needs to be copy'able
\tparam Action Custom action for the search. Needs to be copy'able
\tparam Cost Custom Cost type (integer or floating point types)
\tparam StateHasher A class to convert a state to a hash value. Default:
   std::hash<State>
*/
    template <typename State, typename Action, typename Cost, typename StateHasher = std::hash<State> >
    class BreadthFirstSearch
    {
    public:
        using ProblemType = Problem<State, Action, Cost>;
        using ResultType = SearchResult<State, Action, Cost>;
        using NodeHandle = NodePtr<State, Action, Cost>;

    private:
        ProblemType& problem;
        SearchStatistics search_statistics;

    public:
        explicit BreadthFirstSearch(ProblemType& input_problem) : problem(input_problem) {}

        // Returns true and a Found result if a goal state is reachable.
        bool search(ResultType& result)
        {
            search_statistics = SearchStatistics();

            NodeHandle root = make_root<State, Action, Cost>(problem.initial());
            if (problem.is_goal(root->state))
            {
                result = ResultType::found(root);

                return true;
            }

            std::deque<NodeHandle> frontier;
            std::unordered_set<State, StateHasher> reached;

            frontier.push_back(root);
            reached.insert(root->state);
            problem.on_discover(*root);
            ++search_statistics.num_enqueued_nodes;

            while (!frontier.empty())
            {
                NodeHandle current = frontier.front();
                frontier.pop_front();

                problem.on_expand_node(*current);
                ++search_statistics.num_expanded_nodes;

                for (const NodeHandle& child : expand(problem, current))
                {
                    ++search_statistics.num_generated_nodes;

                    if (problem.is_goal(child->state))
                    {
                        result = ResultType::found(child);

                        return true;
                    }

                    if (reached.insert(child->state).second)
                    {
                        problem.on_discover(*child);
                        ++search_statistics.num_enqueued_nodes;
                        frontier.push_back(child);
                    }
                }
            }

            result = ResultType::not_found();

            return false;
        }

        const SearchStatistics& statistics() const
        {
            return search_statistics;
        }
    };

    template <typename State, typename Action, typename Cost>
    SearchResult<State, Action, Cost> breadth_first_search(Problem<State, Action, Cost>& problem)
    {
        BreadthFirstSearch<State, Action, Cost> bfs(problem);
        SearchResult<State, Action, Cost> result;
        if (!bfs.search(result))
        {
            return SearchResult<State, Action, Cost>::not_found();
        }

        return result;
    }

}  // namespace libGraphSearch
