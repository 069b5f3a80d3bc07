#pragma once

#include <iostream>
#include <utility>
#include <vector>

#include "node.hpp"

namespace libGraphSearch
{

/*! \brief Abstract search problem

This class describes a search domain for the uninformed search algorithms of
this library. A domain derives from it and provides at least the successor
logic.

\tparam State Custom state for the search. Needs to be copy'able, hashable,
    equality comparable and printable with operator<<
\tparam Action Custom action for the search. Needs to be copy'able
\tparam Cost Custom Cost type (integer or floating point types)

A derived class needs to provide the following functions:
  - `std::vector<Action> actions(const State& s) const`\n
    Enumerate the actions applicable in s. The order of the returned actions is
    the order in which children are generated.

  - `State result(const State& s, const Action& a) const`\n
    Return the successor state of s after applying a.

It can override:
  - `bool is_goal(const State& s) const`\n
    Default compares s to the goal state.

  - `Cost action_cost(const State& s, const Action& a, const State& s1) const`\n
    Default returns 1. Must not be negative.

  - `void on_expand_node(const Node&)`\n
    This function is called on every expansion and can be used for statistical
    purposes.

  - `void on_discover(const Node&)`\n
    This function is called whenever a node enters the frontier and can be used
    for statistical purposes.
*/
    template <typename State, typename Action, typename Cost>
    class Problem
    {
    public:
        using NodeType = Node<State, Action, Cost>;

    private:
        State initial_state;
        State goal_state;

    public:
        Problem(State input_initial, State input_goal)
                : initial_state(std::move(input_initial)),
                  goal_state(std::move(input_goal))
        {}

        virtual ~Problem() = default;

        const State& initial() const
        {
            return initial_state;
        }

        const State& goal() const
        {
            return goal_state;
        }

        virtual std::vector<Action> actions(const State& state) const = 0;

        virtual State result(const State& state, const Action& action) const = 0;

        virtual bool is_goal(const State& state) const
        {
            return state == goal_state;
        }

        virtual Cost action_cost(const State& /*state*/, const Action& /*action*/,
                                 const State& /*next_state*/) const
        {
            return Cost(1);
        }

        virtual void on_expand_node(const NodeType& /*node*/) {}

        virtual void on_discover(const NodeType& /*node*/) {}

        virtual void print(std::ostream& os) const
        {
            os << "Problem(" << initial_state << ", " << goal_state << ")";
        }

        friend std::ostream& operator<<(std::ostream& os, const Problem& problem)
        {
            problem.print(os);

            return os;
        }
    };

}  // namespace libGraphSearch
