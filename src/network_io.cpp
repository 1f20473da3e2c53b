/*
  CSV edge-list loader. Column lookup is by header name so extra columns
  (pipe ids, diameters, notes) are ignored.
*/
#include "waternet/core/network_io.hpp"
#include "waternet/core/error.hpp"

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace waternet::core {

namespace {

std::vector<std::string_view> split_row(std::string_view line, char delim) {
  std::vector<std::string_view> cells = absl::StrSplit(line, delim);
  for (auto& c : cells) c = absl::StripAsciiWhitespace(c);
  return cells;
}

std::size_t column_index(const std::vector<std::string_view>& header, std::string_view name) {
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) return i;
  }
  throw InvalidNetwork(absl::StrCat("csv header is missing column '", name, "'"));
}

} // namespace

FlowNetwork load_network_csv(std::string_view text, const CsvOptions& opts) {
  std::vector<std::string_view> lines = absl::StrSplit(text, '\n');
  std::size_t lineno = 0;
  std::optional<std::vector<std::string_view>> header;
  char delim = opts.delimiter;
  std::size_t cu = 0, cv = 0, cc = 0;

  std::vector<NodeSpec> nodes;
  std::map<std::string, NodeId, std::less<>> node_index;
  std::vector<EdgeSpec> edges;
  std::map<std::pair<std::string, std::string>, std::size_t> edge_index;

  auto intern = [&](std::string_view name) {
    if (node_index.find(name) != node_index.end()) return;
    NodeRole role = NodeRole::Intermediate;
    if (name == opts.source_name) role = NodeRole::Source;
    else if (name == opts.sink_name) role = NodeRole::Sink;
    node_index.emplace(std::string(name), static_cast<NodeId>(nodes.size()));
    nodes.push_back(NodeSpec{std::string(name), role});
  };

  for (auto raw : lines) {
    ++lineno;
    auto line = absl::StripAsciiWhitespace(raw);
    if (line.empty()) continue;
    if (!header) {
      if (delim == 0) delim = (line.find('\t') != std::string_view::npos) ? '\t' : ',';
      header = split_row(line, delim);
      cu = column_index(*header, opts.from_column);
      cv = column_index(*header, opts.to_column);
      cc = column_index(*header, opts.capacity_column);
      continue;
    }
    auto cells = split_row(line, delim);
    if (cells.size() != header->size()) {
      throw InvalidNetwork(absl::StrCat("line ", lineno, ": expected ", header->size(),
                                        " fields, got ", cells.size()));
    }
    double cap = 0.0;
    if (!absl::SimpleAtod(cells[cc], &cap)) {
      throw InvalidNetwork(absl::StrCat("line ", lineno, ": capacity '", cells[cc],
                                        "' is not a number"));
    }
    if (cells[cu].empty() || cells[cv].empty()) {
      throw InvalidNetwork(absl::StrCat("line ", lineno, ": empty node identifier"));
    }
    intern(cells[cu]);
    intern(cells[cv]);
    auto key = std::make_pair(std::string(cells[cu]), std::string(cells[cv]));
    auto it = edge_index.find(key);
    if (it != edge_index.end()) {
      if (!opts.merge_parallel) {
        throw InvalidNetwork(absl::StrCat("line ", lineno, ": duplicate pipe ",
                                          key.first, "->", key.second));
      }
      edges[it->second].capacity += cap;
      continue;
    }
    edge_index.emplace(key, edges.size());
    edges.push_back(EdgeSpec{key.first, key.second, cap});
  }
  if (!header) throw InvalidNetwork("csv input is empty");
  if (node_index.find(opts.source_name) == node_index.end()) {
    throw InvalidNetwork(absl::StrCat("source node '", opts.source_name, "' does not appear in any pipe"));
  }
  if (node_index.find(opts.sink_name) == node_index.end()) {
    throw InvalidNetwork(absl::StrCat("sink node '", opts.sink_name, "' does not appear in any pipe"));
  }
  VLOG(1) << "loaded " << nodes.size() << " nodes and " << edges.size() << " pipes from csv";
  return FlowNetwork::build(nodes, edges);
}

FlowNetwork load_network_csv_file(const std::string& path, const CsvOptions& opts) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error(absl::StrCat("cannot open '", path, "'"));
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return load_network_csv(buf.str(), opts);
}

} // namespace waternet::core
