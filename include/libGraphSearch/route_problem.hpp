//
// Route finding between two places of a road map.
//

#ifndef LIBGRAPHSEARCH_ROUTE_PROBLEM_HPP
#define LIBGRAPHSEARCH_ROUTE_PROBLEM_HPP

#include <algorithm>
#include <iostream>
#include <vector>

#include "map.hpp"
#include "problem.hpp"

namespace libGraphSearch
{
    template <typename Vertex, typename Distance = double>
    struct RouteProblemConfig
    {
        using MapType = Map<Vertex, Distance>;

        RouteProblemConfig(const Vertex& input_initial, const Vertex& input_goal, const MapType& input_map)
                : initial(input_initial),
                  goal(input_goal),
                  map(input_map)
        {}

        // the map is kept by reference
        RouteProblemConfig(const Vertex&, const Vertex&, MapType&&) = delete;

        Vertex initial;
        Vertex goal;
        //! must outlive every problem built from this config
        const MapType& map;
    };

/*! \brief Find a route between two places of a Map

Actions and states are both vertices: the action is the place to drive to next.
Several problems may share one map since the map is only read.
*/
    template <typename Vertex, typename Distance = double>
    class RouteProblem : public Problem<Vertex, Vertex, Distance>
    {
    public:
        using MapType = Map<Vertex, Distance>;

    private:
        const MapType& map;

    public:
        RouteProblem(const Vertex& input_initial, const Vertex& input_goal, const MapType& input_map)
                : Problem<Vertex, Vertex, Distance>(input_initial, input_goal),
                  map(input_map)
        {}

        RouteProblem(const Vertex&, const Vertex&, MapType&&) = delete;

        explicit RouteProblem(const RouteProblemConfig<Vertex, Distance>& config)
                : RouteProblem(config.initial, config.goal, config.map)
        {}

        const MapType& road_map() const
        {
            return map;
        }

        std::vector<Vertex> actions(const Vertex& state) const override
        {
            return map.neighbors(state);
        }

        // Driving to a place that is not adjacent leaves the state unchanged.
        Vertex result(const Vertex& state, const Vertex& action) const override
        {
            const std::vector<Vertex>& neighbors = map.neighbors(state);
            if (std::find(neighbors.begin(), neighbors.end(), action) != neighbors.end())
            {
                return action;
            }

            return state;
        }

        // Throws std::out_of_range if state and next_state are not adjacent.
        Distance action_cost(const Vertex& state, const Vertex& /*action*/,
                             const Vertex& next_state) const override
        {
            return map.distance(state, next_state);
        }

        void print(std::ostream& os) const override
        {
            os << "RouteProblem(" << this->initial() << ", " << this->goal() << ")";
        }
    };

}  // namespace libGraphSearch

#endif  // LIBGRAPHSEARCH_ROUTE_PROBLEM_HPP
