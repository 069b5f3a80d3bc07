#pragma once

#include <utility>
#include <vector>

#include <boost/iterator/transform_iterator.hpp>

#include "node.hpp"
#include "problem.hpp"

namespace libGraphSearch
{

/*! \brief Lazily generated children of a search node

The applicable actions are enumerated once on construction. Every dereference of
an iterator applies the problem's result and action_cost functions and allocates
a new child node, so walking the range twice generates the children twice.
Neither the problem nor the parent node is modified.

The range must not outlive the problem it was created from.
*/
    template <typename State, typename Action, typename Cost>
    class Expansion
    {
    public:
        using ProblemType = Problem<State, Action, Cost>;
        using NodeType = Node<State, Action, Cost>;
        using NodeHandle = NodePtr<State, Action, Cost>;

    private:
        class ChildMaker
        {
        private:
            const ProblemType* problem;
            NodeHandle parent;

        public:
            ChildMaker(const ProblemType* input_problem, NodeHandle input_parent)
                    : problem(input_problem),
                      parent(std::move(input_parent))
            {}

            NodeHandle operator()(const Action& action) const
            {
                State next_state = problem->result(parent->state, action);
                Cost path_cost = parent->path_cost + problem->action_cost(parent->state, action, next_state);

                return make_child<State, Action, Cost>(parent, next_state, action, path_cost);
            }
        };

        const ProblemType* problem;
        NodeHandle parent;
        std::vector<Action> applicable_actions;

    public:
        using const_iterator = boost::transform_iterator<ChildMaker, typename std::vector<Action>::const_iterator,
                                                         NodeHandle, NodeHandle>;
        using iterator = const_iterator;

        Expansion(const ProblemType& input_problem, NodeHandle input_parent)
                : problem(&input_problem),
                  parent(std::move(input_parent)),
                  applicable_actions(input_problem.actions(parent->state))
        {}

        const_iterator begin() const
        {
            return const_iterator(applicable_actions.begin(), ChildMaker(problem, parent));
        }

        const_iterator end() const
        {
            return const_iterator(applicable_actions.end(), ChildMaker(problem, parent));
        }

        size_t size() const
        {
            return applicable_actions.size();
        }

        bool empty() const
        {
            return applicable_actions.empty();
        }
    };

    template <typename State, typename Action, typename Cost>
    Expansion<State, Action, Cost> expand(const Problem<State, Action, Cost>& problem,
                                          const NodePtr<State, Action, Cost>& node)
    {
        return Expansion<State, Action, Cost>(problem, node);
    }

}  // namespace libGraphSearch
