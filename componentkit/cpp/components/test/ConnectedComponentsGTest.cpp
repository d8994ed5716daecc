// componentkit-format

#include <map>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include <componentkit/components/ComponentsErrors.hpp>
#include <componentkit/components/ConnectedComponents.hpp>
#include <componentkit/graph/Graph.hpp>

namespace ComponentKit {

class ConnectedComponentsGTest : public testing::Test {};

TEST_F(ConnectedComponentsGTest, testWeaklyConnectedComponents) {
    Graph G(6, false, true);
    G.addEdge(0, 1);
    G.addEdge(2, 1);
    G.addEdge(3, 4);

    WeaklyConnectedComponents wcc(G);
    EXPECT_FALSE(wcc.hasFinished());
    EXPECT_THROW(wcc.numberOfComponents(), std::runtime_error);

    wcc.run();
    EXPECT_TRUE(wcc.hasFinished());
    EXPECT_EQ(wcc.numberOfComponents(), 3u);
    EXPECT_EQ(wcc.componentOfNode(0), wcc.componentOfNode(2));
    EXPECT_NE(wcc.componentOfNode(0), wcc.componentOfNode(3));
    EXPECT_EQ(wcc.componentOfNode(5), 2u);

    const std::map<index, count> expectedSizes{{0, 3}, {1, 2}, {2, 1}};
    EXPECT_EQ(wcc.getComponentSizes(), expectedSizes);

    const auto components = wcc.getComponents();
    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[1], std::vector<node>({3, 4}));
    EXPECT_EQ(wcc.toString(), "WeaklyConnectedComponents");
}

TEST_F(ConnectedComponentsGTest, testComponentOfRemovedNode) {
    Graph G(3);
    G.addEdge(0, 2);
    G.removeNode(1);

    WeaklyConnectedComponents wcc(G);
    wcc.run();
    EXPECT_EQ(wcc.numberOfComponents(), 1u);
    EXPECT_THROW(wcc.componentOfNode(1), std::runtime_error);
    EXPECT_THROW(wcc.componentOfNode(3), std::runtime_error);
}

TEST_F(ConnectedComponentsGTest, testStronglyConnectedComponents) {
    Graph G(5, false, true);
    G.addEdge(0, 1);
    G.addEdge(1, 2);
    G.addEdge(2, 0);
    G.addEdge(2, 3);
    G.addEdge(3, 4);
    G.addEdge(4, 3);

    StronglyConnectedComponents scc(G);
    scc.run();

    EXPECT_EQ(scc.numberOfComponents(), 2u);
    // the sink component is found first
    EXPECT_EQ(scc.componentOfNode(3), 0u);
    EXPECT_EQ(scc.componentOfNode(4), 0u);
    EXPECT_EQ(scc.componentOfNode(0), 1u);
    EXPECT_EQ(scc.componentOfNode(1), 1u);
    EXPECT_EQ(scc.componentOfNode(2), 1u);

    const std::map<index, count> expectedSizes{{0, 2}, {1, 3}};
    EXPECT_EQ(scc.getComponentSizes(), expectedSizes);
}

TEST_F(ConnectedComponentsGTest, testStronglyConnectedComponentsUndirected) {
    Graph G(2);
    G.addEdge(0, 1);

    StronglyConnectedComponents scc(G);
    EXPECT_THROW(scc.run(), WrongDirectionalityError);
    EXPECT_FALSE(scc.hasFinished());
    EXPECT_THROW(scc.getComponents(), std::runtime_error);
}

TEST_F(ConnectedComponentsGTest, testExtractLargestWeaklyConnectedComponent) {
    Graph G(5, false, true);
    G.addEdge(3, 4);
    G.addEdge(4, 2);
    G.addEdge(0, 1);

    const Graph S = WeaklyConnectedComponents::extractLargestWeaklyConnectedComponent(G, true);
    EXPECT_EQ(S.numberOfNodes(), 3u);
    EXPECT_EQ(S.numberOfEdges(), 2u);
    EXPECT_TRUE(S.isDirected());
    // 2 -> 0, 3 -> 1, 4 -> 2
    EXPECT_TRUE(S.hasEdge(1, 2));
    EXPECT_TRUE(S.hasEdge(2, 0));
}

} // namespace ComponentKit
