/* Edge-list CSV loading for water networks. */
#pragma once

#include <string>
#include <string_view>

#include "waternet/core/flow_network.hpp"

namespace waternet::core {

struct CsvOptions {
  std::string from_column {"u"};
  std::string to_column {"v"};
  std::string capacity_column {"capacity_mld"};
  std::string source_name {"S"};
  std::string sink_name {"T"};
  // Sum capacities of repeated (u, v) rows instead of rejecting them.
  bool merge_parallel {false};
  // 0 = detect per file: tab if the header contains one, else comma.
  char delimiter {0};
};

// Parses a header row followed by one edge per row. Nodes are created in
// first-seen order. Throws InvalidNetwork (with the line number) on malformed
// rows, and for every FlowNetwork construction error.
[[nodiscard]] FlowNetwork load_network_csv(std::string_view text, const CsvOptions& opts = {});

// Reads `path` and forwards to load_network_csv. Throws std::runtime_error
// when the file cannot be read.
[[nodiscard]] FlowNetwork load_network_csv_file(const std::string& path, const CsvOptions& opts = {});

} // namespace waternet::core
