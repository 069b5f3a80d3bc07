#pragma once

#include <algorithm>
#include <iostream>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

namespace libGraphSearch
{

/*! \brief Element of a search tree

A node pairs a state with the action and the parent it was reached from and the
accumulated cost of that path. Nodes are immutable after construction and are
shared through NodePtr: a node lives as long as the frontier, a search result
or one of its descendants refers to it.

\tparam State Custom state for the search. Needs to be copy'able
\tparam Action Custom action for the search. Needs to be copy'able
\tparam Cost Custom Cost type (integer or floating point types)
*/
    template <typename State, typename Action, typename Cost>
    class Node
    {
    public:
        //! state of this node
        State state;
        //! node this one was generated from, empty at the root. Mutable so the
        //! destructor can unlink the chain.
        mutable std::shared_ptr<const Node> parent;
        //! action applied to the parent's state, empty at the root
        boost::optional<Action> action;
        //! cost of the path from the root
        Cost path_cost;

    public:
        explicit Node(const State& input_state)
                : state(input_state),
                  parent(),
                  action(),
                  path_cost(0)
        {}

        Node(const State& input_state, std::shared_ptr<const Node> input_parent, const Action& input_action, Cost input_path_cost)
                : state(input_state),
                  parent(std::move(input_parent)),
                  action(input_action),
                  path_cost(input_path_cost)
        {}

        Node(const Node&) = default;
        Node& operator=(const Node&) = default;

        // Releases the ancestors this node owns alone in a loop, so freeing a
        // deep path does not recurse once per ancestor.
        ~Node()
        {
            std::shared_ptr<const Node> ancestor = std::move(parent);
            while (ancestor && ancestor.use_count() == 1)
            {
                ancestor = std::move(ancestor->parent);
            }
        }

        bool is_root() const
        {
            return !parent;
        }

        // number of ancestors
        size_t depth() const
        {
            size_t depth = 0;
            for (const Node* current = parent.get(); current != nullptr; current = current->parent.get())
            {
                ++depth;
            }

            return depth;
        }

        // Used by cost ordered frontiers only.
        bool operator<(const Node& other) const
        {
            return path_cost < other.path_cost;
        }

        friend std::ostream& operator<<(std::ostream& os, const Node& node)
        {
            return os << "<" << node.state << ">";
        }
    };

    template <typename State, typename Action, typename Cost>
    using NodePtr = std::shared_ptr<const Node<State, Action, Cost> >;

    template <typename State, typename Action, typename Cost>
    NodePtr<State, Action, Cost> make_root(const State& state)
    {
        return std::make_shared<Node<State, Action, Cost> >(state);
    }

    template <typename State, typename Action, typename Cost>
    NodePtr<State, Action, Cost> make_child(const NodePtr<State, Action, Cost>& parent, const State& state,
                                            const Action& action, Cost path_cost)
    {
        return std::make_shared<Node<State, Action, Cost> >(state, parent, action, path_cost);
    }

    // Actions from the root to node, root first.
    template <typename State, typename Action, typename Cost>
    std::vector<Action> path_actions(const NodePtr<State, Action, Cost>& node)
    {
        std::vector<Action> actions;
        for (const Node<State, Action, Cost>* current = node.get();
             current != nullptr && current->parent; current = current->parent.get())
        {
            actions.push_back(*current->action);
        }
        std::reverse(actions.begin(), actions.end());

        return actions;
    }

    // States from the root to node, root first. Empty for a null node.
    template <typename State, typename Action, typename Cost>
    std::vector<State> path_states(const NodePtr<State, Action, Cost>& node)
    {
        std::vector<State> states;
        for (const Node<State, Action, Cost>* current = node.get(); current != nullptr;
             current = current->parent.get())
        {
            states.push_back(current->state);
        }
        std::reverse(states.begin(), states.end());

        return states;
    }

    enum class SearchOutcome
    {
        Found,
        NotFound,
        Cutoff,
    };

    inline std::ostream& operator<<(std::ostream& os, const SearchOutcome& outcome)
    {
        switch (outcome)
        {
            case SearchOutcome::Found:
                os << "found";
                break;
            case SearchOutcome::NotFound:
                os << "failure";
                break;
            case SearchOutcome::Cutoff:
                os << "cutoff";
                break;
        }

        return os;
    }

    template <typename Cost>
    Cost unbounded_cost()
    {
        return std::numeric_limits<Cost>::has_infinity ? std::numeric_limits<Cost>::infinity()
                                                       : std::numeric_limits<Cost>::max();
    }

/*! \brief Outcome of a search

Holds the goal node when the outcome is Found. NotFound means the frontier was
exhausted, Cutoff is reserved for depth limited searches. Both carry no node and
report an unbounded path cost.
*/
    template <typename State, typename Action, typename Cost>
    class SearchResult
    {
    public:
        using NodeType = Node<State, Action, Cost>;

    private:
        SearchOutcome search_outcome;
        NodePtr<State, Action, Cost> goal_node;

        SearchResult(SearchOutcome input_outcome, NodePtr<State, Action, Cost> input_node)
                : search_outcome(input_outcome),
                  goal_node(std::move(input_node))
        {}

    public:
        SearchResult() : search_outcome(SearchOutcome::NotFound), goal_node() {}

        static SearchResult found(NodePtr<State, Action, Cost> node)
        {
            return SearchResult(SearchOutcome::Found, std::move(node));
        }

        static SearchResult not_found()
        {
            return SearchResult(SearchOutcome::NotFound, nullptr);
        }

        static SearchResult cutoff()
        {
            return SearchResult(SearchOutcome::Cutoff, nullptr);
        }

        SearchOutcome outcome() const
        {
            return search_outcome;
        }

        bool is_found() const
        {
            return search_outcome == SearchOutcome::Found;
        }

        // null unless found
        const NodePtr<State, Action, Cost>& node() const
        {
            return goal_node;
        }

        Cost path_cost() const
        {
            return is_found() ? goal_node->path_cost : unbounded_cost<Cost>();
        }

        friend std::ostream& operator<<(std::ostream& os, const SearchResult& result)
        {
            if (result.is_found())
            {
                return os << *result.goal_node;
            }

            return os << "<" << result.search_outcome << ">";
        }
    };

    template <typename State, typename Action, typename Cost>
    std::vector<State> path_states(const SearchResult<State, Action, Cost>& result)
    {
        if (!result.is_found())
        {
            return std::vector<State>();
        }

        return path_states<State, Action, Cost>(result.node());
    }

    template <typename State, typename Action, typename Cost>
    std::vector<Action> path_actions(const SearchResult<State, Action, Cost>& result)
    {
        if (!result.is_found())
        {
            return std::vector<Action>();
        }

        return path_actions<State, Action, Cost>(result.node());
    }

}  // namespace libGraphSearch
