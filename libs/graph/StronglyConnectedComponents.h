// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __STRONGLY_CONNECTED_COMPONENTS_H
#define __STRONGLY_CONNECTED_COMPONENTS_H 1

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace plrank
{
  namespace graph
  {
    /**
     * @class StronglyConnectedComponents
     * @brief Iterative Kosaraju decomposition of a directed graph given as an edge list.
     *
     * Nodes are derived from edge endpoints only, so a graph cannot contain an
     * isolated node. The traversal never recurses: both passes drive an explicit
     * work list, which keeps very large graphs safe from call stack exhaustion.
     *
     * Pass 1 walks the forward graph and records the finishing (postorder) list.
     * Each work item carries a two-phase marker: a Pending item expands the node
     * and re-pushes it as Finished; popping a Finished item appends the node to
     * the finishing list, reproducing recursive DFS postorder.
     *
     * Pass 2 consumes the finishing list last-first and floods each unassigned
     * node's root over the transpose graph.
     *
     * Nodes and adjacency lists are kept in first-seen order, so for a given edge
     * sequence the root labels are reproducible. Callers should still only rely on
     * the partition (which nodes share a root), never on which node is the root.
     *
     * @tparam Node Node identity; must be copyable, equality comparable and hashable.
     * @tparam Hash Hash functor for Node.
     */
    template <class Node, class Hash = std::hash<Node>>
    class StronglyConnectedComponents
    {
    public:
      using Edge = std::pair<Node, Node>;
      using RootMap = std::unordered_map<Node, Node, Hash>;

      /**
       * @brief Computes the SCC partition of the graph described by @p edges.
       * @param edges Directed edges in (source, destination) form. Duplicates are harmless.
       * @return Mapping node -> root; two nodes share a root iff they are mutually reachable.
       */
      static RootMap analyze(const std::vector<Edge>& edges)
      {
        StronglyConnectedComponents<Node, Hash> graph(edges);
        return graph.assignRoots(graph.finishingOrder());
      }

      /**
       * @brief Number of distinct roots in a mapping returned by analyze().
       */
      static std::size_t countComponents(const RootMap& roots)
      {
        std::unordered_set<Node, Hash> distinctRoots;
        for (const auto& entry : roots)
          distinctRoots.insert(entry.second);

        return distinctRoots.size();
      }

    private:
      enum class Phase
      {
        PENDING,
        FINISHED
      };

      struct WorkItem
      {
        Phase phase;
        std::size_t node;
      };

      explicit StronglyConnectedComponents(const std::vector<Edge>& edges)
      {
        for (const auto& edge : edges)
          {
            std::size_t source = indexOf(edge.first);
            std::size_t destination = indexOf(edge.second);

            if (mOutNeighborSets[source].insert(destination).second)
              {
                mOutNeighbors[source].push_back(destination);
                mInNeighbors[destination].push_back(source);
              }
          }
      }

      std::size_t indexOf(const Node& node)
      {
        auto it = mNodeIndex.find(node);
        if (it != mNodeIndex.end())
          return it->second;

        std::size_t index = mNodes.size();
        mNodeIndex.emplace(node, index);
        mNodes.push_back(node);
        mOutNeighbors.emplace_back();
        mInNeighbors.emplace_back();
        mOutNeighborSets.emplace_back();

        return index;
      }

      std::vector<std::size_t> finishingOrder() const
      {
        const std::size_t numNodes = mNodes.size();
        std::vector<bool> visited(numNodes, false);
        std::vector<std::size_t> finished;
        std::vector<WorkItem> workList;

        finished.reserve(numNodes);

        for (std::size_t start = 0; start < numNodes; ++start)
          {
            if (visited[start])
              continue;

            workList.push_back(WorkItem{Phase::PENDING, start});
            while (!workList.empty())
              {
                WorkItem item = workList.back();
                workList.pop_back();

                if (item.phase == Phase::FINISHED)
                  {
                    finished.push_back(item.node);
                    continue;
                  }

                if (visited[item.node])
                  continue;

                visited[item.node] = true;
                workList.push_back(WorkItem{Phase::FINISHED, item.node});
                for (std::size_t neighbor : mOutNeighbors[item.node])
                  {
                    if (!visited[neighbor])
                      workList.push_back(WorkItem{Phase::PENDING, neighbor});
                  }
              }
          }

        return finished;
      }

      RootMap assignRoots(std::vector<std::size_t> finished) const
      {
        constexpr std::size_t kUnassigned = static_cast<std::size_t>(-1);
        std::vector<std::size_t> rootOf(mNodes.size(), kUnassigned);
        std::vector<std::size_t> pending;

        while (!finished.empty())
          {
            std::size_t root = finished.back();
            finished.pop_back();

            if (rootOf[root] != kUnassigned)
              continue;

            pending.push_back(root);
            while (!pending.empty())
              {
                std::size_t u = pending.back();
                pending.pop_back();

                if (rootOf[u] != kUnassigned)
                  continue;

                rootOf[u] = root;
                for (std::size_t v : mInNeighbors[u])
                  {
                    if (rootOf[v] == kUnassigned)
                      pending.push_back(v);
                  }
              }
          }

        RootMap roots;
        roots.reserve(mNodes.size());
        for (std::size_t i = 0; i < mNodes.size(); ++i)
          roots.emplace(mNodes[i], mNodes[rootOf[i]]);

        return roots;
      }

      std::vector<Node> mNodes;
      std::unordered_map<Node, std::size_t, Hash> mNodeIndex;
      std::vector<std::vector<std::size_t>> mOutNeighbors;
      std::vector<std::vector<std::size_t>> mInNeighbors;
      std::vector<std::unordered_set<std::size_t>> mOutNeighborSets;
    };
  }
}

#endif
