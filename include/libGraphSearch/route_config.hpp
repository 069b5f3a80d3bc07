//
// YAML description of a road map and a route query.
//

#ifndef LIBGRAPHSEARCH_ROUTE_CONFIG_HPP
#define LIBGRAPHSEARCH_ROUTE_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>
#include <yaml-cpp/yaml.h>

#include "map.hpp"

namespace libGraphSearch
{
    using RoadMap = Map<std::string, double>;

    // map:
    //   directed: false
    //   links:
    //     - [A, B, 2.5]
    //     - [B, C]          # distance 1
    //   locations:
    //     A: [0.0, 1.0]
    // query:
    //   initial: A
    //   goal: C
    struct RouteConfig
    {
        std::vector<RoadMap::LinkType> links;
        std::unordered_map<std::string, Coordinate> locations;
        bool directed = false;
        boost::optional<std::string> initial;
        boost::optional<std::string> goal;

        RoadMap build_map() const
        {
            return RoadMap(links, locations, directed);
        }
    };

    // Throws std::invalid_argument on a malformed layout, YAML::Exception on
    // values of the wrong type.
    inline RouteConfig load_route_config(const YAML::Node& config)
    {
        RouteConfig route_config;

        const YAML::Node& map = config["map"];
        if (!map || !map["links"] || !map["links"].IsSequence())
        {
            throw std::invalid_argument("route config: map.links must be a sequence");
        }

        if (map["directed"])
        {
            route_config.directed = map["directed"].as<bool>();
        }

        for (const auto& node : map["links"])
        {
            if (!node.IsSequence() || (node.size() != 2 && node.size() != 3))
            {
                throw std::invalid_argument("route config: a link is [from, to] or [from, to, distance]");
            }

            double distance = node.size() == 3 ? node[2].as<double>() : 1.0;
            route_config.links.emplace_back(node[0].as<std::string>(), node[1].as<std::string>(), distance);
        }

        if (map["locations"])
        {
            for (const auto& entry : map["locations"])
            {
                const YAML::Node& position = entry.second;
                if (!position.IsSequence() || position.size() != 2)
                {
                    throw std::invalid_argument("route config: a location is [x, y]");
                }

                route_config.locations[entry.first.as<std::string>()] =
                    Coordinate(position[0].as<double>(), position[1].as<double>());
            }
        }

        const YAML::Node& query = config["query"];
        if (query)
        {
            if (query["initial"])
            {
                route_config.initial = query["initial"].as<std::string>();
            }
            if (query["goal"])
            {
                route_config.goal = query["goal"].as<std::string>();
            }
        }

        return route_config;
    }

    inline RouteConfig load_route_config_file(const std::string& filename)
    {
        return load_route_config(YAML::LoadFile(filename));
    }

}  // namespace libGraphSearch

#endif  // LIBGRAPHSEARCH_ROUTE_CONFIG_HPP
