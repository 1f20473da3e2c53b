/*
  Flow analysis — path decomposition, node balances and invariant checks.

  The decomposition walks a single path from the source along out-edges that
  still carry flow, using a per-node pointer that only advances (edges only
  ever lose remaining flow here). Each emitted path, cancelled cycle or
  stranded prefix zeroes at least one edge, so the walk is O(n*m).
*/
#include "waternet/core/flow_analysis.hpp"
#include "waternet/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace waternet::core {

namespace {

// Subtracts b from every listed edge; the bottleneck edge lands on exactly 0.
void subtract(std::vector<Flow>& remaining, std::span<const EdgeId> edges, Flow b, double tol) {
  for (auto e : edges) {
    auto& r = remaining[static_cast<std::size_t>(e)];
    r -= b;
    if (r <= tol) r = 0.0;
  }
}

Flow bottleneck(const std::vector<Flow>& remaining, std::span<const EdgeId> edges) {
  Flow b = std::numeric_limits<Flow>::infinity();
  for (auto e : edges) b = std::min(b, remaining[static_cast<std::size_t>(e)]);
  return b;
}

} // namespace

FlowDecomposition decompose_flow(const FlowNetwork& g,
                                 std::span<const Flow> edge_flows,
                                 NodeId src, NodeId dst,
                                 double tolerance) {
  const auto N = g.num_nodes();
  if (edge_flows.size() != static_cast<std::size_t>(g.num_edges())) {
    throw std::invalid_argument("decompose_flow: edge_flows length must equal num_edges");
  }
  if (src < 0 || src >= N || dst < 0 || dst >= N) {
    throw std::out_of_range("decompose_flow: src/dst out of range");
  }
  FlowDecomposition out;
  if (src == dst) return out;

  std::vector<Flow> remaining(edge_flows.begin(), edge_flows.end());
  for (auto& r : remaining) {
    if (r <= tolerance) r = 0.0;
  }
  auto row = g.row_offsets_view();
  auto aei = g.adj_edge_index_view();
  auto head = g.edge_dst_view();
  std::vector<std::int32_t> next(row.begin(), row.end() - 1);
  std::vector<std::int32_t> pos(static_cast<std::size_t>(N), -1);
  std::vector<NodeId> nodes {src};
  std::vector<EdgeId> edges;
  pos[static_cast<std::size_t>(src)] = 0;

  auto restart = [&]() {
    for (auto v : nodes) pos[static_cast<std::size_t>(v)] = -1;
    nodes.assign(1, src);
    edges.clear();
    pos[static_cast<std::size_t>(src)] = 0;
  };

  while (true) {
    const NodeId cur = nodes.back();
    if (cur == dst) {
      Flow b = bottleneck(remaining, edges);
      out.paths.push_back(FlowPath{nodes, edges, b});
      out.delivered += b;
      subtract(remaining, edges, b, tolerance);
      restart();
      continue;
    }
    auto u = static_cast<std::size_t>(cur);
    while (next[u] < row[u + 1] && remaining[static_cast<std::size_t>(aei[static_cast<std::size_t>(next[u])])] <= 0.0) {
      ++next[u];
    }
    if (next[u] == row[u + 1]) {
      if (cur == src) break;
      // Dead end: this prefix carries excess that never reaches dst.
      Flow b = bottleneck(remaining, edges);
      out.stranded += b;
      subtract(remaining, edges, b, tolerance);
      restart();
      continue;
    }
    EdgeId e = aei[static_cast<std::size_t>(next[u])];
    NodeId v = head[static_cast<std::size_t>(e)];
    auto at = pos[static_cast<std::size_t>(v)];
    if (at >= 0) {
      // Closing a cycle at position `at`: cancel it and resume from v.
      std::vector<EdgeId> cycle(edges.begin() + at, edges.end());
      cycle.push_back(e);
      Flow b = bottleneck(remaining, cycle);
      out.cycles += b;
      subtract(remaining, cycle, b, tolerance);
      for (auto i = static_cast<std::size_t>(at) + 1; i < nodes.size(); ++i) {
        pos[static_cast<std::size_t>(nodes[i])] = -1;
      }
      nodes.resize(static_cast<std::size_t>(at) + 1);
      edges.resize(static_cast<std::size_t>(at));
      continue;
    }
    pos[static_cast<std::size_t>(v)] = static_cast<std::int32_t>(nodes.size());
    nodes.push_back(v);
    edges.push_back(e);
  }
  VLOG(2) << "decompose_flow: " << out.paths.size() << " paths, delivered " << out.delivered
          << ", stranded " << out.stranded << ", cycles " << out.cycles;
  return out;
}

std::vector<Flow> path_edge_flows(const FlowNetwork& g, const FlowDecomposition& d) {
  std::vector<Flow> flows(static_cast<std::size_t>(g.num_edges()), 0.0);
  for (const auto& p : d.paths) {
    for (auto e : p.edges) flows[static_cast<std::size_t>(e)] += p.amount;
  }
  // Summation order can overshoot capacity by an ulp.
  auto cap = g.capacity_view();
  for (std::size_t i = 0; i < flows.size(); ++i) flows[i] = std::min(flows[i], cap[i]);
  return flows;
}

std::vector<NodeBalance> node_balances(const FlowNetwork& g, std::span<const Flow> edge_flows) {
  if (edge_flows.size() != static_cast<std::size_t>(g.num_edges())) {
    throw std::invalid_argument("node_balances: edge_flows length must equal num_edges");
  }
  std::vector<NodeBalance> out(static_cast<std::size_t>(g.num_nodes()));
  for (NodeId v = 0; v < g.num_nodes(); ++v) out[static_cast<std::size_t>(v)].node = v;
  auto src = g.edge_src_view();
  auto dst = g.edge_dst_view();
  for (std::size_t e = 0; e < edge_flows.size(); ++e) {
    out[static_cast<std::size_t>(src[e])].outflow += edge_flows[e];
    out[static_cast<std::size_t>(dst[e])].inflow += edge_flows[e];
  }
  return out;
}

Flow flow_value(const FlowNetwork& g, std::span<const Flow> edge_flows, NodeId src) {
  auto bal = node_balances(g, edge_flows);
  return bal.at(static_cast<std::size_t>(src)).net();
}

void validate_flow(const FlowNetwork& g, std::span<const Flow> edge_flows,
                   NodeId src, NodeId dst, double tolerance) {
  if (edge_flows.size() != static_cast<std::size_t>(g.num_edges())) {
    throw std::invalid_argument("validate_flow: edge_flows length must equal num_edges");
  }
  if (src < 0 || src >= g.num_nodes() || dst < 0 || dst >= g.num_nodes()) {
    throw std::out_of_range("validate_flow: src/dst out of range");
  }
  // Summation rounding is relative to magnitude, so never check tighter
  // than a few ulps even when the run itself used tolerance 0.
  const double tol = std::max(tolerance, 64 * std::numeric_limits<double>::epsilon());
  auto cap = g.capacity_view();
  std::vector<double> scale(static_cast<std::size_t>(g.num_nodes()), 1.0);
  auto esrc = g.edge_src_view();
  auto edst = g.edge_dst_view();
  for (std::size_t e = 0; e < edge_flows.size(); ++e) {
    const double slack = tol * std::max(1.0, cap[e]);
    const Flow f = edge_flows[e];
    if (!std::isfinite(f) || f < -slack || f > cap[e] + slack) {
      LOG(ERROR) << "capacity violated on " << g.edge_label(static_cast<EdgeId>(e))
                 << ": flow " << f << ", capacity " << cap[e];
      throw NumericInstability(absl::StrCat("flow on edge ", g.edge_label(static_cast<EdgeId>(e)),
                                            " outside [0, ", cap[e], "]: ", f));
    }
    scale[static_cast<std::size_t>(esrc[e])] += cap[e];
    scale[static_cast<std::size_t>(edst[e])] += cap[e];
  }
  auto bal = node_balances(g, edge_flows);
  for (const auto& b : bal) {
    if (b.node == src || b.node == dst) continue;
    if (std::abs(b.net()) > tol * scale[static_cast<std::size_t>(b.node)]) {
      LOG(ERROR) << "conservation violated at " << g.node_name(b.node)
                 << ": inflow " << b.inflow << ", outflow " << b.outflow;
      throw NumericInstability(absl::StrCat("flow not conserved at node ", g.node_name(b.node),
                                            ": inflow=", b.inflow, " outflow=", b.outflow));
    }
  }
  if (src != dst) {
    const Flow out_src = bal[static_cast<std::size_t>(src)].net();
    const Flow in_dst = -bal[static_cast<std::size_t>(dst)].net();
    const double slack = tol * std::max(scale[static_cast<std::size_t>(src)],
                                              scale[static_cast<std::size_t>(dst)]);
    if (std::abs(out_src - in_dst) > slack) {
      LOG(ERROR) << "source outflow " << out_src << " != sink inflow " << in_dst;
      throw NumericInstability(absl::StrCat("source outflow ", out_src,
                                            " disagrees with sink inflow ", in_dst));
    }
  }
}

} // namespace waternet::core
