//
// Weighted road map used by the route finding domain.
//

#ifndef LIBGRAPHSEARCH_MAP_HPP
#define LIBGRAPHSEARCH_MAP_HPP

#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/functional/hash.hpp>

namespace libGraphSearch
{
    // 2D position of a vertex
    struct Coordinate
    {
        double x = 0;
        double y = 0;

        Coordinate() = default;

        Coordinate(double input_x, double input_y) : x(input_x), y(input_y) {}

        bool operator==(const Coordinate& other) const
        {
            return x == other.x && y == other.y;
        }

        friend std::ostream& operator<<(std::ostream& os, const Coordinate& coordinate)
        {
            return os << "(" << coordinate.x << "," << coordinate.y << ")";
        }
    };

    template <typename Vertex, typename Distance>
    struct Link
    {
        Vertex from;
        Vertex to;
        Distance distance;

        Link(const Vertex& input_from, const Vertex& input_to, Distance input_distance)
                : from(input_from),
                  to(input_to),
                  distance(input_distance)
        {}
    };

/*! \brief Graph of places connected by weighted edges

The edges are kept in declaration order. Unless the map is directed every edge
(v1, v2) gets a mirrored edge (v2, v1) with the same distance: mirrored edges
that were not declared are appended after the declared ones, a mirrored edge
that was declared as well takes the distance of its counterpart.

The neighbor list of a vertex follows the order of the edge table. A map is
never modified after construction.
*/
    template <typename Vertex, typename Distance = double>
    class Map
    {
    public:
        using Edge = std::pair<Vertex, Vertex>;
        using LinkType = Link<Vertex, Distance>;

    private:
        bool is_directed;
        std::vector<std::pair<Edge, Distance> > edges;
        std::unordered_map<Edge, size_t, boost::hash<Edge> > edge_index;
        std::unordered_map<Vertex, std::vector<Vertex> > adjacency;
        std::vector<Vertex> vertex_list;
        std::unordered_map<Vertex, Coordinate> vertex_locations;

    public:
        // Every link gets distance 1.
        explicit Map(const std::vector<Edge>& input_links,
                     std::unordered_map<Vertex, Coordinate> input_locations = {},
                     bool input_directed = false)
                : is_directed(input_directed),
                  vertex_locations(std::move(input_locations))
        {
            for (const Edge& link : input_links)
            {
                set_distance(link, Distance(1));
            }

            build();
        }

        explicit Map(const std::vector<LinkType>& input_links,
                     std::unordered_map<Vertex, Coordinate> input_locations = {},
                     bool input_directed = false)
                : is_directed(input_directed),
                  vertex_locations(std::move(input_locations))
        {
            for (const LinkType& link : input_links)
            {
                if (!(link.distance > Distance(0)))
                {
                    throw std::invalid_argument("Map: link distances must be positive");
                }

                set_distance(Edge(link.from, link.to), link.distance);
            }

            build();
        }

        bool directed() const
        {
            return is_directed;
        }

        // Vertices adjacent to vertex, empty for unknown vertices.
        const std::vector<Vertex>& neighbors(const Vertex& vertex) const
        {
            static const std::vector<Vertex> no_neighbors;

            auto iter = adjacency.find(vertex);
            if (iter == adjacency.end())
            {
                return no_neighbors;
            }

            return iter->second;
        }

        bool has_edge(const Vertex& from, const Vertex& to) const
        {
            return edge_index.find(Edge(from, to)) != edge_index.end();
        }

        // Throws std::out_of_range if there is no edge from -> to.
        Distance distance(const Vertex& from, const Vertex& to) const
        {
            auto iter = edge_index.find(Edge(from, to));
            if (iter == edge_index.end())
            {
                throw std::out_of_range("Map: no edge between the given vertices");
            }

            return edges[iter->second].second;
        }

        // (0, 0) for vertices without a known location
        Coordinate location(const Vertex& vertex) const
        {
            auto iter = vertex_locations.find(vertex);
            if (iter == vertex_locations.end())
            {
                return Coordinate(0, 0);
            }

            return iter->second;
        }

        // edge table in order, including mirrored edges
        const std::vector<std::pair<Edge, Distance> >& distances() const
        {
            return edges;
        }

        // in order of first appearance in the edge table
        const std::vector<Vertex>& vertices() const
        {
            return vertex_list;
        }

        size_t num_edges() const
        {
            return edges.size();
        }

    private:
        void set_distance(const Edge& edge, Distance distance)
        {
            auto iter = edge_index.find(edge);
            if (iter != edge_index.end())
            {
                edges[iter->second].second = distance;

                return;
            }

            edge_index.insert(std::make_pair(edge, edges.size()));
            edges.emplace_back(edge, distance);
        }

        void build()
        {
            if (!is_directed)
            {
                std::vector<Edge> declared;
                declared.reserve(edges.size());
                for (const auto& entry : edges)
                {
                    declared.push_back(entry.first);
                }

                for (const Edge& edge : declared)
                {
                    set_distance(Edge(edge.second, edge.first), edges[edge_index.at(edge)].second);
                }
            }

            std::unordered_set<Vertex> seen;
            for (const auto& entry : edges)
            {
                const Edge& edge = entry.first;
                adjacency[edge.first].push_back(edge.second);

                if (seen.insert(edge.first).second)
                {
                    vertex_list.push_back(edge.first);
                }
                if (seen.insert(edge.second).second)
                {
                    vertex_list.push_back(edge.second);
                }
            }
        }
    };

}  // namespace libGraphSearch

#endif  // LIBGRAPHSEARCH_MAP_HPP
