#include <fstream>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <libGraphSearch/breadth_first_search.hpp>
#include <libGraphSearch/plan_result.hpp>
#include <libGraphSearch/route_config.hpp>
#include <libGraphSearch/route_problem.hpp>

using namespace std;
using libGraphSearch::BreadthFirstSearch;
using libGraphSearch::PlanResult;
using libGraphSearch::RoadMap;
using libGraphSearch::RouteConfig;
using libGraphSearch::RouteProblem;
using libGraphSearch::SearchResult;

using Place = string;

int main(int argc, char* argv[])
{
    namespace po = boost::program_options;
    // Declare the supported options.
    po::options_description desc("Allowed options");

    string input_filename;
    string output_filename;
    string start;
    string goal;

    desc.add_options()("help", "produce help message")
    ("input,i", po::value<string>(&input_filename)->required(), "input map (YAML)")
    ("output,o", po::value<string>(&output_filename), "output file (YAML)")
    ("start,s", po::value<string>(&start), "start place, overrides query.initial")
    ("goal,g", po::value<string>(&goal), "goal place, overrides query.goal");

    try
    {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help") != 0u)
        {
            cout << desc << "\n";

            return 0;
        }

        po::notify(vm);
    }
    catch (po::error& e)
    {
        cerr << e.what() << endl << endl;
        cerr << desc << endl;

        return 1;
    }

    RouteConfig config;
    boost::optional<RoadMap> road_map;
    try
    {
        config = libGraphSearch::load_route_config_file(input_filename);
        road_map.emplace(config.build_map());
    }
    catch (YAML::Exception& e)
    {
        cerr << input_filename << ": " << e.what() << endl;

        return 1;
    }
    catch (invalid_argument& e)
    {
        cerr << input_filename << ": " << e.what() << endl;

        return 1;
    }

    if (start.empty() && config.initial)
    {
        start = *config.initial;
    }
    if (goal.empty() && config.goal)
    {
        goal = *config.goal;
    }
    if (start.empty() || goal.empty())
    {
        cerr << "start and goal are required (--start/--goal or query in " << input_filename << ")" << endl;

        return 1;
    }

    cout << road_map->vertices().size() << " places, " << road_map->num_edges() << " directed edges" << endl;

    RouteProblem<Place> problem(start, goal, *road_map);
    BreadthFirstSearch<Place, Place, double> bfs(problem);
    SearchResult<Place, Place, double> result;

    bool success = bfs.search(result);
    cout << problem << " " << bfs.statistics() << endl;

    PlanResult<Place, Place, double> solution;
    if (success && libGraphSearch::make_plan_result(result, solution))
    {
        cout << "GoalStateWithPath:" << result.node()->state << endl;

        cout << "[";
        for (size_t i = 0; i < solution.states.size(); ++i)
        {
            cout << (i == 0 ? "" : ", ") << solution.states[i].first;
        }
        cout << "]" << endl;

        cout << "Total Distance=" << solution.cost << " Kilometers" << endl;
    }
    else
    {
        cout << "Planning NOT successful!" << endl;
    }

    if (!output_filename.empty())
    {
        ofstream out(output_filename);
        if (!out)
        {
            cerr << "cannot write " << output_filename << endl;

            return 1;
        }

        out << "result:" << endl;
        out << "  found: " << (success ? "true" : "false") << endl;
        if (success)
        {
            out << "  cost: " << solution.cost << endl;
            out << "  path:" << endl;
            for (const auto& state : solution.states)
            {
                out << "    - place: " << state.first << endl
                    << "      cost: " << state.second << endl;
            }
        }
        out << "  statistics:" << endl
            << "    expanded: " << bfs.statistics().num_expanded_nodes << endl
            << "    generated: " << bfs.statistics().num_generated_nodes << endl
            << "    enqueued: " << bfs.statistics().num_enqueued_nodes << endl;
    }

    return 0;
}

// ./route_search -i ../example/data/chain.yaml -o output.yaml
// ./route_search -i ../example/data/chain.yaml --start D --goal A
