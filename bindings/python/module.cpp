/*
  Pybind11 module exposing DemoNet-Core C++ APIs to Python.

  Notes:
    - Accepts NumPy arrays (C-contiguous) and converts to spans for zero-copy
      views where possible.
    - Ratios are converted once at the boundary: float/int -> scalar,
      dict -> sparse, list/tuple/ndarray -> dense. Anything else raises
      UnsupportedScaleType.
    - Field views are returned as copies indexed like the C++ arrays
      (length N+1, slot 0 is the sentinel).
    - Generators passed as a list are advanced in place.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include "demonet/core/distribute.hpp"
#include "demonet/core/error.hpp"
#include "demonet/core/network.hpp"
#include "demonet/core/networks.hpp"
#include "demonet/core/options.hpp"
#include "demonet/core/profiler.hpp"
#include "demonet/core/random.hpp"
#include "demonet/core/scale.hpp"
#include "demonet/core/types.hpp"

namespace py = pybind11;
using namespace demonet::core;

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
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

template <typename T>
static py::array_t<T> to_array(ConservedView<const T> v) {
  auto buf = v.span();
  py::array_t<T> arr(buf.size());
  if (!buf.empty()) std::memcpy(arr.mutable_data(), buf.data(), buf.size() * sizeof(T));
  return arr;
}

static std::optional<ScaleRatio> to_ratio(const py::object& obj, const char* name) {
  if (obj.is_none()) return std::nullopt;
  if (py::isinstance<py::bool_>(obj)) {
    throw UnsupportedScaleType(std::string(name) + ": cannot scale by a bool");
  }
  if (py::isinstance<py::float_>(obj) || py::isinstance<py::int_>(obj)) {
    return ScaleRatio{py::cast<double>(obj)};
  }
  if (py::isinstance<py::dict>(obj)) {
    SparseRatio sparse;
    for (auto item : py::reinterpret_borrow<py::dict>(obj)) {
      sparse[py::cast<NodeId>(item.first)] = py::cast<double>(item.second);
    }
    return ScaleRatio{std::move(sparse)};
  }
  if (py::isinstance<py::array>(obj) || py::isinstance<py::list>(obj) ||
      py::isinstance<py::tuple>(obj)) {
    return ScaleRatio{py::cast<DenseRatio>(obj)};
  }
  throw UnsupportedScaleType(std::string(name) + ": cannot scale by an object of type " +
                             std::string(py::str(py::type::of(obj).attr("__name__"))));
}

// Borrow the caller's generators so that draws made in C++ advance the Python
// objects themselves.
static std::vector<RandomGenerator*> borrow_generators(const py::list& rngs) {
  std::vector<RandomGenerator*> out;
  out.reserve(rngs.size());
  for (auto item : rngs) out.push_back(&py::cast<RandomGenerator&>(item));
  return out;
}

template <typename Fn>
static RemainderSummary with_generators(const py::list& rngs, py::object opts_obj,
                                        py::object profiler_obj, Fn&& fn) {
  DistributeOptions opts;
  if (!opts_obj.is_none()) opts = py::cast<DistributeOptions>(opts_obj);
  Profiler* profiler = &null_profiler();
  if (!profiler_obj.is_none()) profiler = py::cast<Profiler*>(profiler_obj);
  auto owners = borrow_generators(rngs);
  std::vector<RandomGenerator> working;
  working.reserve(owners.size());
  for (auto* g : owners) working.push_back(*g);
  RemainderSummary summary;
  {
    py::gil_scoped_release release;
    summary = fn(std::span<RandomGenerator>(working), opts, *profiler);
  }
  for (std::size_t k = 0; k < owners.size(); ++k) *owners[k] = working[k];
  return summary;
}

PYBIND11_MODULE(_demonet_core, m) {
  m.doc() = "DemoNet-Core C++ bindings";

  py::register_exception<InvalidArgument>(m, "InvalidArgument", PyExc_ValueError);
  py::register_exception<UnsupportedScaleType>(m, "UnsupportedScaleType", PyExc_TypeError);

  py::class_<Nodes>(m, "Nodes")
      .def_static("from_arrays", [](py::array play_suscept) {
            return Nodes::from_arrays(as_span<double>(play_suscept, "play_suscept"));
          }, py::arg("play_suscept"))
      .def("__len__", &Nodes::size)
      .def_property_readonly("play_suscept", [](const Nodes& n) { return to_array(n.play_suscept_view()); })
      .def_property_readonly("save_play_suscept", [](const Nodes& n) { return to_array(n.save_play_suscept_view()); })
      .def("reset", &Nodes::reset);

  py::class_<Links>(m, "Links")
      .def_static("from_arrays",
          [](std::int32_t num_nodes, py::array ifrom, py::array ito, py::array weight) {
            auto from_s = as_span<std::int32_t>(ifrom, "ifrom");
            auto to_s = as_span<std::int32_t>(ito, "ito");
            auto w_s = as_span<double>(weight, "weight");
            return Links::from_arrays(num_nodes, from_s, to_s, w_s);
          }, py::arg("num_nodes"), py::arg("ifrom"), py::arg("ito"), py::arg("weight"))
      .def("__len__", &Links::size)
      .def_property_readonly("num_nodes", &Links::num_nodes)
      .def_property_readonly("weight", [](const Links& l) { return to_array(l.weight_view()); })
      .def_property_readonly("suscept", [](const Links& l) { return to_array(l.suscept_view()); })
      .def_property_readonly("ifrom", [](const Links& l) { return to_array(l.ifrom_view()); })
      .def_property_readonly("ito", [](const Links& l) { return to_array(l.ito_view()); })
      .def("reset", &Links::reset);

  py::class_<Network>(m, "Network")
      .def(py::init<Nodes, Links>(), py::arg("nodes"), py::arg("links"))
      .def_static("from_arrays",
          [](py::array play_suscept, py::array ifrom, py::array ito, py::array weight) {
            return Network::from_arrays(as_span<double>(play_suscept, "play_suscept"),
                                        as_span<std::int32_t>(ifrom, "ifrom"),
                                        as_span<std::int32_t>(ito, "ito"),
                                        as_span<double>(weight, "weight"));
          }, py::arg("play_suscept"), py::arg("ifrom"), py::arg("ito"), py::arg("weight"))
      .def_property_readonly("nodes", py::overload_cast<>(&Network::nodes), py::return_value_policy::reference_internal)
      .def_property_readonly("links", py::overload_cast<>(&Network::links), py::return_value_policy::reference_internal)
      .def_property_readonly("num_nodes", &Network::num_nodes)
      .def_property_readonly("num_links", &Network::num_links)
      .def("assert_sane", &Network::assert_sane)
      .def("reset", &Network::reset);

  py::class_<RandomGenerator>(m, "RandomGenerator")
      .def(py::init<std::uint64_t, std::uint64_t>(), py::arg("seed"),
           py::arg("stream") = RandomGenerator::kDefaultStream)
      .def_static("from_state", [](py::array state) {
            auto s = as_span<std::uint64_t>(state, "state");
            if (s.size() != 2) throw py::value_error("state must hold exactly 2 uint64 values");
            return RandomGenerator::from_state({s[0], s[1]});
          }, py::arg("state"))
      .def("state", [](const RandomGenerator& g) {
            auto s = g.state();
            py::array_t<std::uint64_t> arr(s.size());
            std::memcpy(arr.mutable_data(), s.data(), s.size() * sizeof(std::uint64_t));
            return arr;
          })
      .def("uniform_int", &RandomGenerator::uniform_int, py::arg("n"));

  m.def("make_thread_generators", &make_thread_generators, py::arg("rng"), py::arg("nthreads"));

  py::class_<DistributeOptions>(m, "DistributeOptions")
      .def(py::init([](int num_threads, std::int32_t parallel_threshold) {
            DistributeOptions o; o.num_threads = num_threads; o.parallel_threshold = parallel_threshold; return o;
          }),
          py::kw_only(), py::arg("num_threads") = 0, py::arg("parallel_threshold") = 1024)
      .def_readwrite("num_threads", &DistributeOptions::num_threads)
      .def_readwrite("parallel_threshold", &DistributeOptions::parallel_threshold);

  py::class_<RemainderSummary>(m, "RemainderSummary")
      .def_readonly("node_correction", &RemainderSummary::node_correction)
      .def_readonly("link_correction", &RemainderSummary::link_correction)
      .def_readonly("nodes_repaired", &RemainderSummary::nodes_repaired)
      .def_readonly("links_repaired", &RemainderSummary::links_repaired)
      .def_property_readonly("total_correction", &RemainderSummary::total_correction);

  py::class_<Profiler>(m, "Profiler");
  py::class_<TimingProfiler, Profiler>(m, "TimingProfiler")
      .def(py::init<>())
      .def("total_ms", [](const TimingProfiler& p, const std::string& name) { return p.total_ms(name); }, py::arg("name"))
      .def("clear", &TimingProfiler::clear)
      .def("__str__", &TimingProfiler::to_string);

  m.def("scale_and_round", &scale_and_round, py::arg("value"), py::arg("scale"));

  m.def("scale_node_susceptibles",
        [](Nodes& nodes, py::object ratio, py::object work_ratio, py::object play_ratio) {
          scale_node_susceptibles(nodes, to_ratio(ratio, "ratio"),
                                  to_ratio(work_ratio, "work_ratio"),
                                  to_ratio(play_ratio, "play_ratio"));
        }, py::arg("nodes"), py::arg("ratio") = py::none(), py::kw_only(),
        py::arg("work_ratio") = py::none(), py::arg("play_ratio") = py::none());

  m.def("scale_link_susceptibles",
        [](Links& links, py::object ratio) {
          scale_link_susceptibles(links, to_ratio(ratio, "ratio"));
        }, py::arg("links"), py::arg("ratio") = py::none());

  m.def("redistribute",
        [](double target, std::vector<double> values, RandomGenerator& rng) {
          redistribute(target, values, rng);
          return values;
        }, py::arg("target"), py::arg("values"), py::arg("rng"));

  m.def("distribute_remainders",
        [](const Network& parent, std::vector<Network*> partitions, const py::list& rngs,
           py::object opts_obj, py::object profiler_obj) {
          return with_generators(rngs, opts_obj, profiler_obj,
              [&](std::span<RandomGenerator> g, const DistributeOptions& opts, Profiler& profiler) {
                return distribute_remainders(parent, std::span<Network* const>(partitions), g,
                                             opts, profiler);
              });
        }, py::arg("parent"), py::arg("partitions"), py::arg("rngs"), py::kw_only(),
        py::arg("options") = py::none(), py::arg("profiler") = py::none());

  py::class_<Networks>(m, "Networks")
      .def_static("build", &Networks::build, py::arg("overall"), py::arg("subnets"))
      .def_property_readonly("overall", &Networks::overall, py::return_value_policy::reference_internal)
      .def("__len__", &Networks::size)
      .def("subnet", [](Networks& n, std::size_t j) -> Network& {
            if (j >= n.size()) throw py::index_error("subnet index out of range");
            return n.subnets()[j];
          }, py::arg("index"), py::return_value_policy::reference_internal)
      .def("scale_susceptibles", [](Networks& n, const py::list& ratios) {
            std::vector<std::optional<ScaleRatio>> converted;
            converted.reserve(ratios.size());
            for (auto r : ratios) {
              converted.push_back(to_ratio(py::reinterpret_borrow<py::object>(r), "ratios"));
            }
            n.scale_susceptibles(converted);
          }, py::arg("ratios"))
      .def("distribute_remainders",
          [](Networks& n, const py::list& rngs, py::object opts_obj, py::object profiler_obj) {
            return with_generators(rngs, opts_obj, profiler_obj,
                [&](std::span<RandomGenerator> g, const DistributeOptions& opts, Profiler& profiler) {
                  return n.distribute_remainders(g, opts, profiler);
                });
          }, py::arg("rngs"), py::kw_only(),
          py::arg("options") = py::none(), py::arg("profiler") = py::none())
      .def("is_conserved", &Networks::is_conserved)
      .def("assert_conserved", &Networks::assert_conserved)
      .def("assert_sane", &Networks::assert_sane);
}
