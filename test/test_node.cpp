// Google Test for Node, path reconstruction and SearchResult
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <libGraphSearch/breadth_first_search.hpp>
#include <libGraphSearch/node.hpp>
#include <libGraphSearch/problem.hpp>

using libGraphSearch::make_child;
using libGraphSearch::make_root;
using libGraphSearch::path_actions;
using libGraphSearch::path_states;
using libGraphSearch::SearchOutcome;

using Place = std::string;
using PlaceNode = libGraphSearch::Node<Place, Place, double>;
using PlaceNodePtr = libGraphSearch::NodePtr<Place, Place, double>;
using PlaceResult = libGraphSearch::SearchResult<Place, Place, double>;

// 0 -> 1 -> 2 -> ... with a single action adding one.
class CountingProblem : public libGraphSearch::Problem<int, int, int> {
public:
    explicit CountingProblem(int input_goal) : Problem(0, input_goal) {}

    std::vector<int> actions(const int& /*state*/) const override { return std::vector<int>({1}); }

    int result(const int& state, const int& action) const override { return state + action; }
};

static PlaceNodePtr make_abc_path() {
    PlaceNodePtr a = make_root<Place, Place, double>("A");
    PlaceNodePtr b = make_child<Place, Place, double>(a, "B", "B", 2.0);
    return make_child<Place, Place, double>(b, "C", "C", 5.0);
}

TEST(Node, Root) {
    PlaceNodePtr root = make_root<Place, Place, double>("A");

    EXPECT_TRUE(root->is_root());
    EXPECT_EQ(root->depth(), 0u);
    EXPECT_DOUBLE_EQ(root->path_cost, 0.0);
    EXPECT_FALSE(root->action);
    EXPECT_TRUE(path_actions(root).empty());
    EXPECT_EQ(path_states(root), std::vector<Place>({"A"}));
}

TEST(Node, PathFromRoot) {
    PlaceNodePtr c = make_abc_path();

    EXPECT_FALSE(c->is_root());
    EXPECT_EQ(c->depth(), 2u);
    EXPECT_DOUBLE_EQ(c->path_cost, 5.0);
    EXPECT_EQ(*c->action, "C");
    EXPECT_EQ(c->parent->state, "B");
    EXPECT_EQ(path_actions(c), std::vector<Place>({"B", "C"}));
    EXPECT_EQ(path_states(c), std::vector<Place>({"A", "B", "C"}));
    EXPECT_EQ(path_actions(c).size(), path_states(c).size() - 1);
}

TEST(Node, NullNodeHasNoPath) {
    PlaceNodePtr none;

    EXPECT_TRUE(path_states(none).empty());
    EXPECT_TRUE(path_actions(none).empty());
}

TEST(Node, DeepChain) {
    PlaceNodePtr node = make_root<Place, Place, double>("s");
    for (int i = 0; i < 5000; ++i) {
        node = make_child<Place, Place, double>(node, "s", "s", node->path_cost + 1.0);
    }

    EXPECT_EQ(node->depth(), 5000u);
    EXPECT_DOUBLE_EQ(node->path_cost, 5000.0);
    EXPECT_EQ(path_states(node).size(), 5001u);
    EXPECT_EQ(path_actions(node).size(), 5000u);
}

TEST(Node, ReleasingVeryDeepChain) {
    std::weak_ptr<const libGraphSearch::Node<int, int, int> > root;
    {
        libGraphSearch::NodePtr<int, int, int> node = make_root<int, int, int>(0);
        root = node;
        for (int i = 1; i <= 1000000; ++i) {
            node = make_child<int, int, int>(node, i, 1, i);
        }
        EXPECT_EQ(node->depth(), 1000000u);
        EXPECT_FALSE(root.expired());
    }

    EXPECT_TRUE(root.expired());
}

TEST(Node, ReleasingSharedAncestorsKeepsTheirOtherBranch) {
    PlaceNodePtr a = make_root<Place, Place, double>("A");
    PlaceNodePtr b = make_child<Place, Place, double>(a, "B", "B", 1.0);
    PlaceNodePtr c = make_child<Place, Place, double>(b, "C", "C", 2.0);
    PlaceNodePtr d = make_child<Place, Place, double>(b, "D", "D", 2.0);
    a.reset();
    b.reset();

    c.reset();

    EXPECT_EQ(path_states(d), std::vector<Place>({"A", "B", "D"}));
}

TEST(SearchResult, ReleasingMillionStepPath) {
    using CountNode = libGraphSearch::Node<int, int, int>;
    std::weak_ptr<const CountNode> goal;
    {
        CountingProblem problem(1000000);
        libGraphSearch::SearchResult<int, int, int> result = libGraphSearch::breadth_first_search(problem);

        ASSERT_TRUE(result.is_found());
        EXPECT_EQ(result.path_cost(), 1000000);
        EXPECT_EQ(path_states(result).size(), 1000001u);
        goal = result.node();
    }

    EXPECT_TRUE(goal.expired());
}

TEST(Node, OrderedByPathCost) {
    PlaceNodePtr a = make_root<Place, Place, double>("A");
    PlaceNodePtr b = make_child<Place, Place, double>(a, "B", "B", 7.0);
    PlaceNodePtr z = make_child<Place, Place, double>(a, "Z", "Z", 3.0);

    EXPECT_TRUE(*a < *z);
    EXPECT_TRUE(*z < *b);
    EXPECT_FALSE(*b < *z);
}

TEST(Node, ParentsLiveAsLongAsDescendants) {
    PlaceNodePtr c = make_abc_path();
    std::weak_ptr<const PlaceNode> root = c->parent->parent;

    EXPECT_FALSE(root.expired());
    c.reset();
    EXPECT_TRUE(root.expired());
}

TEST(Node, Print) {
    std::ostringstream os;
    os << *make_abc_path();

    EXPECT_EQ(os.str(), "<C>");
}

TEST(SearchResult, Found) {
    PlaceResult result = PlaceResult::found(make_abc_path());

    EXPECT_TRUE(result.is_found());
    EXPECT_EQ(result.outcome(), SearchOutcome::Found);
    EXPECT_DOUBLE_EQ(result.path_cost(), 5.0);
    EXPECT_EQ(path_states(result), std::vector<Place>({"A", "B", "C"}));
    EXPECT_EQ(path_actions(result), std::vector<Place>({"B", "C"}));
}

TEST(SearchResult, NotFound) {
    PlaceResult result = PlaceResult::not_found();
    std::ostringstream os;
    os << result;

    EXPECT_FALSE(result.is_found());
    EXPECT_EQ(result.outcome(), SearchOutcome::NotFound);
    EXPECT_FALSE(result.node());
    EXPECT_TRUE(std::isinf(result.path_cost()));
    EXPECT_TRUE(path_states(result).empty());
    EXPECT_TRUE(path_actions(result).empty());
    EXPECT_EQ(os.str(), "<failure>");
}

TEST(SearchResult, Cutoff) {
    PlaceResult result = PlaceResult::cutoff();
    std::ostringstream os;
    os << result;

    EXPECT_EQ(result.outcome(), SearchOutcome::Cutoff);
    EXPECT_TRUE(std::isinf(result.path_cost()));
    EXPECT_TRUE(path_states(result).empty());
    EXPECT_EQ(os.str(), "<cutoff>");
}

TEST(SearchResult, DefaultIsNotFound) {
    PlaceResult result;

    EXPECT_EQ(result.outcome(), SearchOutcome::NotFound);
}

TEST(SearchResult, IntegerCostIsUnbounded) {
    libGraphSearch::SearchResult<int, int, int> result = libGraphSearch::SearchResult<int, int, int>::not_found();

    EXPECT_EQ(result.path_cost(), std::numeric_limits<int>::max());
}
