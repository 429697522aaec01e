#include <mcmclab/core/engine.hpp>
#include <mcmclab/core/ensemble.hpp>
#include <mcmclab/kernel/kernel.hpp>
#include <mcmclab/log/logger.hpp>
#include <mcmclab/math/rng.hpp>
#include <mcmclab/sample/density.hpp>
#include <mcmclab/sample/grid.hpp>

#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace mcmclab::core;
using namespace mcmclab::kernel;
using namespace mcmclab::log;
using namespace mcmclab::math;
using namespace mcmclab::sample;

PYBIND11_MODULE(mcmclab, m) {
  m.doc() = "Python bindings for the mcmclab 2D sampling engine";

  // Rng bindings
  py::class_<Rng>(m, "Rng")
      .def(py::init<uint64_t>(), py::arg("seed") = std::random_device{}(),
           "Initialize the RNG with an optional seed")
      .def("uniform", py::overload_cast<>(&Rng::uniform),
           "Generate a uniform random number in [0, 1)")
      .def("normal", &Rng::normal, py::arg("mean"), py::arg("stddev"),
           "Generate a normally distributed random number with given mean and "
           "stddev");

  // Math
  py::class_<Vec2>(m, "Vec2")
      .def(py::init<>())
      .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
      .def_readwrite("x", &Vec2::x)
      .def_readwrite("y", &Vec2::y)
      .def("__repr__", [](const Vec2 &v)
           { return "Vec2(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")"; });

  py::class_<Matrix>(m, "Matrix", py::buffer_protocol())
      .def_readonly("rows", &Matrix::rows)
      .def_readonly("cols", &Matrix::cols)
      .def("get_numpy", [](const Matrix &mat)
           { return py::array_t<double>(
                 {mat.rows, mat.cols},
                 {sizeof(double) * mat.cols, sizeof(double)},
                 mat.data.data()); }, "Get the grid as a NumPy array (rows along y)")
      .def_buffer([](Matrix &mat) -> py::buffer_info
                  { return py::buffer_info(
                        mat.data.data(),
                        sizeof(double),
                        py::format_descriptor<double>::format(),
                        2,
                        {mat.rows, mat.cols},
                        {sizeof(double) * mat.cols, sizeof(double)}); });

  // Targets
  py::class_<TargetDensity, std::shared_ptr<TargetDensity>>(m, "TargetDensity")
      .def("log_density", &TargetDensity::log_density, py::arg("p"))
      .def("has_gradient", &TargetDensity::has_gradient)
      .def("gradient", &TargetDensity::gradient, py::arg("p"))
      .def("name", &TargetDensity::name);

  py::class_<FunctionDensity, TargetDensity, std::shared_ptr<FunctionDensity>>(m, "FunctionDensity")
      .def(py::init<std::string, LogDensityFunction, GradientFunction>(),
           py::arg("name"), py::arg("log_density"), py::arg("gradient") = py::none(),
           "Target built from Python callables; gradient may be None");

  m.def(
      "make_density",
      [](const std::string &name) { return std::shared_ptr<TargetDensity>(make_density(name)); },
      py::arg("name"), "Build a catalog target: gaussian, bimodal, donut or banana");
  m.def("target_names", &target_names);
  m.def("kernel_names", &kernel_names);

  py::class_<GridSpec>(m, "GridSpec")
      .def(py::init<>())
      .def_readwrite("nx", &GridSpec::nx)
      .def_readwrite("ny", &GridSpec::ny)
      .def_readwrite("x_min", &GridSpec::x_min)
      .def_readwrite("x_max", &GridSpec::x_max)
      .def_readwrite("y_min", &GridSpec::y_min)
      .def_readwrite("y_max", &GridSpec::y_max)
      .def_readwrite("oversample", &GridSpec::oversample);

  m.def("density_grid", &density_grid, py::arg("target"), py::arg("spec"),
        "Normalized density of the target on a regular grid");
  m.def("sample_histogram", &sample_histogram, py::arg("samples"), py::arg("spec"),
        "Normalized histogram of samples on a regular grid");

  // Engine
  py::class_<Sample>(m, "Sample")
      .def_readonly("x", &Sample::x)
      .def_readonly("y", &Sample::y)
      .def_readonly("accepted", &Sample::accepted)
      .def("__repr__", [](const Sample &s)
           { return "Sample(" + std::to_string(s.x) + ", " + std::to_string(s.y) + (s.accepted ? ", accepted)" : ", rejected)"); });

  py::class_<KernelParams>(m, "KernelParams")
      .def(py::init<>())
      .def_readwrite("step_size", &KernelParams::step_size)
      .def_readwrite("leapfrog_steps", &KernelParams::leapfrog_steps)
      .def_readwrite("leapfrog_epsilon", &KernelParams::leapfrog_epsilon);

  py::class_<ParamsUpdate>(m, "ParamsUpdate")
      .def(py::init<>())
      .def(py::init([](std::optional<double> step_size, std::optional<int> leapfrog_steps,
                       std::optional<double> leapfrog_epsilon)
                    { return ParamsUpdate{step_size, leapfrog_steps, leapfrog_epsilon}; }),
           py::arg("step_size") = py::none(), py::arg("leapfrog_steps") = py::none(),
           py::arg("leapfrog_epsilon") = py::none())
      .def_readwrite("step_size", &ParamsUpdate::step_size)
      .def_readwrite("leapfrog_steps", &ParamsUpdate::leapfrog_steps)
      .def_readwrite("leapfrog_epsilon", &ParamsUpdate::leapfrog_epsilon);

  py::class_<ParamLimits>(m, "ParamLimits")
      .def(py::init<>())
      .def_readwrite("step_size_min", &ParamLimits::step_size_min)
      .def_readwrite("step_size_max", &ParamLimits::step_size_max)
      .def_readwrite("leapfrog_steps_min", &ParamLimits::leapfrog_steps_min)
      .def_readwrite("leapfrog_steps_max", &ParamLimits::leapfrog_steps_max)
      .def_readwrite("leapfrog_epsilon_min", &ParamLimits::leapfrog_epsilon_min)
      .def_readwrite("leapfrog_epsilon_max", &ParamLimits::leapfrog_epsilon_max);

  py::class_<EngineConfig>(m, "EngineConfig")
      .def(py::init<>())
      .def_readwrite("seed", &EngineConfig::seed)
      .def_readwrite("target", &EngineConfig::target)
      .def_readwrite("kernel", &EngineConfig::kernel)
      .def_readwrite("params", &EngineConfig::params)
      .def_readwrite("limits", &EngineConfig::limits)
      .def_readwrite("history_capacity", &EngineConfig::history_capacity)
      .def_readwrite("origin", &EngineConfig::origin);

  py::class_<BatchResult>(m, "BatchResult")
      .def_readonly("accepted_count", &BatchResult::accepted_count)
      .def_readonly("samples", &BatchResult::samples)
      .def("acceptance_rate", &BatchResult::acceptance_rate);

  py::class_<SamplerEngine>(m, "SamplerEngine")
      .def(py::init<const EngineConfig &>(), py::arg("config") = EngineConfig{})
      .def("select_target", py::overload_cast<std::string_view>(&SamplerEngine::select_target),
           py::arg("name"), "Switch to a catalog target and reset the chain")
      .def(
          "set_target",
          [](SamplerEngine &engine, std::shared_ptr<TargetDensity> target)
          { engine.set_target(std::move(target)); },
          py::arg("target"), "Switch to a custom target and reset the chain")
      .def("select_kernel", py::overload_cast<std::string_view>(&SamplerEngine::select_kernel),
           py::arg("name"), "Switch kernel and reset the chain")
      .def("set_params", &SamplerEngine::set_params, py::arg("update"))
      .def("reset", &SamplerEngine::reset)
      .def("advance", &SamplerEngine::advance, py::arg("steps"),
           "Run the active kernel for the given number of steps")
      .def_property_readonly("position", &SamplerEngine::position)
      .def_property_readonly("history", [](const SamplerEngine &engine)
                             { return std::vector<Sample>(engine.history().begin(), engine.history().end()); })
      .def_property_readonly("last_trajectory", &SamplerEngine::last_trajectory)
      .def_property_readonly("params", &SamplerEngine::params)
      .def_property_readonly("kernel", [](const SamplerEngine &engine)
                             { return std::string(to_string(engine.kernel())); })
      .def_property_readonly("target", [](const SamplerEngine &engine)
                             { return engine.target().name(); })
      .def_property_readonly("total_steps", &SamplerEngine::total_steps)
      .def("acceptance_rate", &SamplerEngine::acceptance_rate);

  m.def("run_frames", &run_frames, py::arg("engine"), py::arg("steps"), py::arg("steps_per_frame"),
        "Advance the engine in frame-sized batches and return the accepted count");

  // Multi-chain runner
  py::class_<EnsembleConfig>(m, "EnsembleConfig")
      .def(py::init<>())
      .def_readwrite("engine", &EnsembleConfig::engine)
      .def_readwrite("n_chains", &EnsembleConfig::n_chains)
      .def_readwrite("n_threads", &EnsembleConfig::n_threads)
      .def_readwrite("steps_per_chain", &EnsembleConfig::steps_per_chain);

  py::class_<ChainRun>(m, "ChainRun")
      .def_readonly("seed", &ChainRun::seed)
      .def_readonly("samples", &ChainRun::samples)
      .def_readonly("accepted", &ChainRun::accepted);

  m.def(
      "run_chains_parallel",
      [](const EnsembleConfig &config) {
        py::gil_scoped_release release;
        return run_chains_parallel(config);
      },
      py::arg("config"), "Run independent chains on worker threads");

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); },
      py::arg("level"), "Set the logging level for the mcmclab module");
}
