/*
  Pybind11 module exposing the waternet flow engine to Python.

  Notes:
    - Index arrays are NumPy int32 / float64 (C-contiguous) and are viewed as
      spans without copying; result arrays are fresh copies.
    - Runs release the GIL; compare_algorithms and sweep_leakage also run
      their variants on worker threads.
    - InvalidNetwork / InvalidScenario surface as ValueError subclasses and
      NumericInstability as an ArithmeticError subclass.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <chrono>
#include <cstring>

#include "waternet/core/engine.hpp"
#include "waternet/core/error.hpp"
#include "waternet/core/flow_analysis.hpp"
#include "waternet/core/flow_network.hpp"
#include "waternet/core/max_flow.hpp"
#include "waternet/core/min_cut.hpp"
#include "waternet/core/network_io.hpp"
#include "waternet/core/scenario.hpp"
#include "waternet/core/trace.hpp"
#include "waternet/core/types.hpp"

namespace py = pybind11;
using namespace waternet::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + ": expected a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

template <typename T>
static py::array_t<T> to_array(const std::vector<T>& v) {
  py::array_t<T> arr(v.size());
  if (!v.empty()) std::memcpy(arr.mutable_data(), v.data(), v.size() * sizeof(T));
  return arr;
}

// Borrowed view tied to the owning Python object's lifetime.
template <typename T>
static py::array borrowed_view(py::object owner, std::span<const T> s) {
  return py::array(
      py::buffer_info(
          const_cast<T*>(s.data()),
          sizeof(T),
          py::format_descriptor<T>::format(),
          1,
          { s.size() },
          { sizeof(T) }),
      owner);
}

static RunOptions make_options(std::int64_t max_iterations, double tolerance, bool trace,
                               py::object time_limit_ms) {
  RunOptions opts;
  opts.max_iterations = max_iterations;
  opts.tolerance = tolerance;
  opts.trace = trace;
  if (!time_limit_ms.is_none()) {
    opts.time_limit = std::chrono::milliseconds(py::cast<std::int64_t>(time_limit_ms));
  }
  return opts;
}

PYBIND11_MODULE(_waternet_core, m) {
  m.doc() = "Water network max-flow / min-cut engine";

  py::register_exception<InvalidNetwork>(m, "InvalidNetwork", PyExc_ValueError);
  py::register_exception<InvalidScenario>(m, "InvalidScenario", PyExc_ValueError);
  py::register_exception<NumericInstability>(m, "NumericInstability", PyExc_ArithmeticError);

  py::enum_<NodeRole>(m, "NodeRole")
      .value("INTERMEDIATE", NodeRole::Intermediate)
      .value("SOURCE", NodeRole::Source)
      .value("SINK", NodeRole::Sink);

  py::enum_<AlgorithmKind>(m, "Algorithm")
      .value("AUGMENTING_PATH", AlgorithmKind::AugmentingPath)
      .value("BLOCKING_FLOW", AlgorithmKind::BlockingFlow)
      .value("PREFLOW_PUSH", AlgorithmKind::PreflowPush);

  py::enum_<TerminationReason>(m, "TerminationReason")
      .value("CONVERGED", TerminationReason::Converged)
      .value("BUDGET_EXCEEDED", TerminationReason::BudgetExceeded)
      .value("CANCELLED", TerminationReason::Cancelled);

  py::enum_<EventKind>(m, "EventKind")
      .value("PHASE_START", EventKind::PhaseStart)
      .value("PATH_FOUND", EventKind::PathFound)
      .value("PUSH", EventKind::Push)
      .value("RELABEL", EventKind::Relabel);

  py::class_<NodeSpec>(m, "NodeSpec")
      .def(py::init([](std::string name, NodeRole role) { return NodeSpec{std::move(name), role}; }),
           py::arg("name"), py::arg("role") = NodeRole::Intermediate)
      .def_readwrite("name", &NodeSpec::name)
      .def_readwrite("role", &NodeSpec::role);

  py::class_<EdgeSpec>(m, "EdgeSpec")
      .def(py::init([](std::string from, std::string to, double capacity) {
             return EdgeSpec{std::move(from), std::move(to), capacity};
           }),
           py::arg("from_"), py::arg("to"), py::arg("capacity"))
      .def_readwrite("from_", &EdgeSpec::from)
      .def_readwrite("to", &EdgeSpec::to)
      .def_readwrite("capacity", &EdgeSpec::capacity);

  py::class_<FlowNetwork>(m, "FlowNetwork")
      .def_static("build",
          [](const std::vector<NodeSpec>& nodes, const std::vector<EdgeSpec>& edges) {
            return FlowNetwork::build(nodes, edges);
          },
          py::arg("nodes"), py::arg("edges"))
      .def_static("from_arrays",
          [](std::int32_t num_nodes, py::array src, py::array dst, py::array capacity,
             std::int32_t source, std::int32_t sink) {
            auto src_s = as_span<std::int32_t>(src, "src");
            auto dst_s = as_span<std::int32_t>(dst, "dst");
            auto cap_s = as_span<double>(capacity, "capacity");
            return FlowNetwork::from_arrays(num_nodes, src_s, dst_s, cap_s, source, sink);
          },
          py::arg("num_nodes"), py::arg("src"), py::arg("dst"), py::arg("capacity"),
          py::kw_only(), py::arg("source"), py::arg("sink"))
      .def("num_nodes", &FlowNetwork::num_nodes)
      .def("num_edges", &FlowNetwork::num_edges)
      .def_property_readonly("source", &FlowNetwork::source)
      .def_property_readonly("sink", &FlowNetwork::sink)
      .def("role", &FlowNetwork::role, py::arg("node"))
      .def("node_name", &FlowNetwork::node_name, py::arg("node"))
      .def("find_node", &FlowNetwork::find_node, py::arg("name"))
      .def("find_edge",
          [](const FlowNetwork& g, const std::string& from, const std::string& to) {
            return g.find_edge(std::string_view(from), std::string_view(to));
          },
          py::arg("from_"), py::arg("to"))
      .def("edge_label", &FlowNetwork::edge_label, py::arg("edge"))
      .def("capacity_view", [](py::object self_obj, const FlowNetwork& g) {
        return borrowed_view(self_obj, g.capacity_view());
      })
      .def("edge_src_view", [](py::object self_obj, const FlowNetwork& g) {
        return borrowed_view(self_obj, g.edge_src_view());
      })
      .def("edge_dst_view", [](py::object self_obj, const FlowNetwork& g) {
        return borrowed_view(self_obj, g.edge_dst_view());
      });

  py::class_<Scenario>(m, "Scenario")
      .def(py::init<>())
      .def_readwrite("default_leakage", &Scenario::default_leakage)
      .def_readwrite("edge_leakage", &Scenario::edge_leakage)
      .def_readwrite("failed_edges", &Scenario::failed_edges);

  m.def("apply_scenario", &apply_scenario, py::arg("network"), py::arg("scenario"));
  m.def("parse_edge_ref", &parse_edge_ref, py::arg("network"), py::arg("ref"));

  py::class_<ScenarioBuilder>(m, "ScenarioBuilder")
      .def(py::init<const FlowNetwork&>(), py::arg("base"), py::keep_alive<1, 2>())
      .def("leakage", &ScenarioBuilder::leakage, py::arg("fraction"), py::return_value_policy::reference_internal)
      .def("leakage_percent", &ScenarioBuilder::leakage_percent, py::arg("percent"), py::return_value_policy::reference_internal)
      .def("leak",
          [](ScenarioBuilder& b, const std::string& from, const std::string& to, double f) -> ScenarioBuilder& {
            return b.leak(std::string_view(from), std::string_view(to), f);
          },
          py::arg("from_"), py::arg("to"), py::arg("fraction"), py::return_value_policy::reference_internal)
      .def("fail",
          [](ScenarioBuilder& b, const std::string& from, const std::string& to) -> ScenarioBuilder& {
            return b.fail(std::string_view(from), std::string_view(to));
          },
          py::arg("from_"), py::arg("to"), py::return_value_policy::reference_internal)
      .def("fail_ref",
          [](ScenarioBuilder& b, const std::string& ref) -> ScenarioBuilder& {
            return b.fail(std::string_view(ref));
          },
          py::arg("ref"), py::return_value_policy::reference_internal)
      .def("fail_all",
          [](ScenarioBuilder& b, const std::string& refs) -> ScenarioBuilder& {
            return b.fail_all(std::string_view(refs));
          },
          py::arg("refs"), py::return_value_policy::reference_internal)
      .def_property_readonly("scenario", &ScenarioBuilder::scenario)
      .def("apply", &ScenarioBuilder::apply);

  py::class_<AlgorithmEvent>(m, "AlgorithmEvent")
      .def_readonly("sequence", &AlgorithmEvent::sequence)
      .def_readonly("kind", &AlgorithmEvent::kind)
      .def_readonly("iteration", &AlgorithmEvent::iteration)
      .def_readonly("node", &AlgorithmEvent::node)
      .def_readonly("target", &AlgorithmEvent::target)
      .def_readonly("arcs", &AlgorithmEvent::arcs)
      .def_readonly("amount", &AlgorithmEvent::amount)
      .def_readonly("total_flow", &AlgorithmEvent::total_flow)
      .def_readonly("level", &AlgorithmEvent::level);

  m.def("describe", &describe, py::arg("network"), py::arg("event"));

  py::class_<FlowResult>(m, "FlowResult")
      .def_readonly("total_flow", &FlowResult::total_flow)
      .def_readonly("algorithm", &FlowResult::algorithm)
      .def_readonly("source", &FlowResult::source)
      .def_readonly("sink", &FlowResult::sink)
      .def_readonly("iterations", &FlowResult::iterations)
      .def_readonly("termination", &FlowResult::termination)
      .def_readonly("tolerance", &FlowResult::tolerance)
      .def_readonly("trace", &FlowResult::trace)
      .def_property_readonly("is_maximal", &FlowResult::is_maximal)
      .def_property_readonly("edge_flows", [](const FlowResult& r) { return to_array(r.edge_flows); });

  py::class_<MinCut>(m, "MinCut")
      .def_readonly("capacity", &MinCut::capacity)
      .def_readonly("separating", &MinCut::separating)
      .def_property_readonly("edges", [](const MinCut& mc) { return to_array(mc.edges); })
      .def_property_readonly("source_side", [](const MinCut& mc) { return to_array(mc.source_side); })
      .def_property_readonly("sink_side", [](const MinCut& mc) { return to_array(mc.sink_side); })
      .def_property_readonly("reachable", [](const MinCut& mc) {
        py::array_t<bool> arr(mc.reachable.size());
        auto* out = arr.mutable_data();
        for (std::size_t i = 0; i < mc.reachable.size(); ++i) out[i] = static_cast<bool>(mc.reachable[i]);
        return arr;
      });

  m.def("run",
        [](const FlowNetwork& g, AlgorithmKind algorithm, std::int64_t max_iterations,
           double tolerance, bool trace, py::object time_limit_ms) {
          auto opts = make_options(max_iterations, tolerance, trace, time_limit_ms);
          py::gil_scoped_release release;
          auto res = run(g, algorithm, opts);
          py::gil_scoped_acquire acquire;
          return res;
        },
        py::arg("network"), py::arg("algorithm") = AlgorithmKind::AugmentingPath, py::kw_only(),
        py::arg("max_iterations") = kDefaultMaxIterations, py::arg("tolerance") = kDefaultTolerance,
        py::arg("trace") = false, py::arg("time_limit_ms") = py::none());

  m.def("extract_min_cut",
        [](const FlowNetwork& g, const FlowResult& r) {
          py::gil_scoped_release release;
          auto mc = extract_min_cut(g, r);
          py::gil_scoped_acquire acquire;
          return mc;
        },
        py::arg("network"), py::arg("result"));

  m.def("compare_algorithms",
        [](const FlowNetwork& g, std::int64_t max_iterations, double tolerance, bool trace,
           py::object time_limit_ms) {
          auto opts = make_options(max_iterations, tolerance, trace, time_limit_ms);
          py::gil_scoped_release release;
          auto out = compare_algorithms(g, opts);
          py::gil_scoped_acquire acquire;
          return out;
        },
        py::arg("network"), py::kw_only(), py::arg("max_iterations") = kDefaultMaxIterations,
        py::arg("tolerance") = kDefaultTolerance, py::arg("trace") = false,
        py::arg("time_limit_ms") = py::none());

  m.def("sweep_leakage",
        [](const FlowNetwork& base, py::array fractions, AlgorithmKind algorithm,
           std::int64_t max_iterations, double tolerance) {
          auto f = as_span<double>(fractions, "fractions");
          auto opts = make_options(max_iterations, tolerance, false, py::none());
          py::gil_scoped_release release;
          auto out = sweep_leakage(base, f, algorithm, opts);
          py::gil_scoped_acquire acquire;
          return out;
        },
        py::arg("base"), py::arg("fractions"), py::arg("algorithm") = AlgorithmKind::AugmentingPath,
        py::kw_only(), py::arg("max_iterations") = kDefaultMaxIterations,
        py::arg("tolerance") = kDefaultTolerance);

  m.def("parse_algorithm", &parse_algorithm, py::arg("name"));

  py::class_<FlowPath>(m, "FlowPath")
      .def_readonly("nodes", &FlowPath::nodes)
      .def_readonly("edges", &FlowPath::edges)
      .def_readonly("amount", &FlowPath::amount);

  py::class_<FlowDecomposition>(m, "FlowDecomposition")
      .def_readonly("paths", &FlowDecomposition::paths)
      .def_readonly("delivered", &FlowDecomposition::delivered)
      .def_readonly("stranded", &FlowDecomposition::stranded)
      .def_readonly("cycles", &FlowDecomposition::cycles);

  m.def("decompose_flow",
        [](const FlowNetwork& g, const FlowResult& r) {
          return decompose_flow(g, r.edge_flows, r.source, r.sink, r.tolerance);
        },
        py::arg("network"), py::arg("result"));

  m.def("node_balances",
        [](const FlowNetwork& g, const FlowResult& r) {
          auto bal = node_balances(g, r.edge_flows);
          py::array_t<double> inflow(bal.size());
          py::array_t<double> outflow(bal.size());
          auto* in = inflow.mutable_data();
          auto* out = outflow.mutable_data();
          for (std::size_t i = 0; i < bal.size(); ++i) {
            in[i] = bal[i].inflow;
            out[i] = bal[i].outflow;
          }
          return py::make_tuple(inflow, outflow);
        },
        py::arg("network"), py::arg("result"));

  py::class_<CsvOptions>(m, "CsvOptions")
      .def(py::init<>())
      .def_readwrite("from_column", &CsvOptions::from_column)
      .def_readwrite("to_column", &CsvOptions::to_column)
      .def_readwrite("capacity_column", &CsvOptions::capacity_column)
      .def_readwrite("source_name", &CsvOptions::source_name)
      .def_readwrite("sink_name", &CsvOptions::sink_name)
      .def_readwrite("merge_parallel", &CsvOptions::merge_parallel)
      .def_readwrite("delimiter", &CsvOptions::delimiter);

  m.def("load_network_csv",
        [](const std::string& text, const CsvOptions& opts) { return load_network_csv(text, opts); },
        py::arg("text"), py::arg("options") = CsvOptions{});
  m.def("load_network_csv_file", &load_network_csv_file, py::arg("path"), py::arg("options") = CsvOptions{});
}
