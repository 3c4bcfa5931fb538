#include <metrochain/core/acceptance.hpp>
#include <metrochain/core/errors.hpp>
#include <metrochain/core/output.hpp>
#include <metrochain/core/sampler.hpp>
#include <metrochain/core/state.hpp>
#include <metrochain/log/logger.hpp>
#include <metrochain/math/rng.hpp>

#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace metrochain::core;
using namespace metrochain::log;

namespace {

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

// bool, signed, unsigned, floating
bool is_real_kind(char kind) {
  return kind == 'b' || kind == 'i' || kind == 'u' || kind == 'f';
}

// int / float / real numpy scalar -> scalar state, list / tuple / ndarray of
// reals -> vector state. Everything else is InvalidArgument.
State to_state(py::handle obj) {
  if (py::isinstance<py::int_>(obj) || py::isinstance<py::float_>(obj)) {
    try {
      return State(obj.cast<double>());
    } catch (const py::cast_error &) {
      throw InvalidArgument("x_init is not representable as a double");
    }
  }

  if (py::isinstance<py::str>(obj) || py::isinstance<py::bytes>(obj))
    throw InvalidArgument("x_init must be an int, float, list or numpy.ndarray");

  py::array arr = py::array::ensure(obj);
  if (!arr || !is_real_kind(arr.dtype().kind()))
    throw InvalidArgument("x_init must be an int, float, list or numpy.ndarray of real numbers");

  DoubleArray values = DoubleArray::ensure(arr);
  if (!values)
    throw InvalidArgument("x_init could not be converted to float64");

  std::vector<std::size_t> extents(values.shape(), values.shape() + values.ndim());
  return State::from_array(extents, std::vector<double>(values.data(), values.data() + values.size()));
}

py::object from_state(const State &s) {
  if (s.is_scalar())
    return py::float_(s.scalar());
  return DoubleArray(static_cast<py::ssize_t>(s.size()), s.values().data());
}

// 1-D for scalar states, (n, k) for vector states
DoubleArray to_numpy(const std::vector<State> &states, const StateShape &shape) {
  const std::vector<double> flat = flatten(states);
  const auto n = static_cast<py::ssize_t>(states.size());

  if (flat.size() != states.size() * shape.size())
    throw InvalidArgument("sampled states do not all have dimension " + std::to_string(shape.dimension));

  DoubleArray out = shape.is_scalar()
                        ? DoubleArray(std::vector<py::ssize_t>{n})
                        : DoubleArray(std::vector<py::ssize_t>{n, static_cast<py::ssize_t>(shape.dimension)});
  std::copy(flat.begin(), flat.end(), out.mutable_data());
  return out;
}

// With pass_rng the proposal is called as proposal(x, rng, **kwargs) and
// draws from the engine's stream.
ProposalFn wrap_proposal(py::object proposal, py::object proposal_kwargs, bool pass_rng) {
  py::dict kwargs = proposal_kwargs.is_none() ? py::dict() : py::dict(proposal_kwargs);
  return [proposal, kwargs, pass_rng](const State &current, RandomSource &rng) {
    py::object result = pass_rng
                            ? proposal(from_state(current), py::cast(&rng, py::return_value_policy::reference), **kwargs)
                            : proposal(from_state(current), **kwargs);
    State candidate = to_state(result);
    require_shape(current.shape(), candidate);
    return candidate;
  };
}

LogLikelihoodFn wrap_likelihood(py::object log_likelihood, py::object data) {
  return bind_data([log_likelihood](const State &s, const py::object &d) {
    return log_likelihood(from_state(s), d).cast<double>();
  }, data);
}

std::function<double(const State &)> wrap_unary(py::object fn) {
  return [fn](const State &s) { return fn(from_state(s)).cast<double>(); };
}

SamplerConfig make_config(std::int64_t samples, double burn_in) {
  SamplerConfig config;
  config.samples = samples;
  config.burn_in = burn_in;
  return config;
}

py::tuple run_partition(py::object x_init, const ProposalFn &proposal, AcceptanceRule &rule,
                        std::int64_t samples, double burn_in, Rng *rng) {
  const State initial = to_state(x_init);
  const SamplerConfig config = make_config(samples, burn_in);

  Rng local = make_rng(config);
  Partition result = sample_partition(initial, config, proposal, rule, rng ? *rng : local);
  return py::make_tuple(to_numpy(result.accepted, result.shape), to_numpy(result.rejected, result.shape));
}

} // namespace

PYBIND11_MODULE(_core, m)
{
  m.doc() = "Python bindings for the metrochain Metropolis-Hastings sampler";

  py::register_exception<InvalidArgument>(m, "InvalidArgument", PyExc_ValueError);
  py::register_exception<ScoringError>(m, "ScoringError", PyExc_ArithmeticError);

  // Rng bindings
  py::class_<RandomSource>(m, "RandomSource")
      .def("uniform", &RandomSource::uniform,
           "Generate a uniform random number in [0, 1)")
      .def("normal", &RandomSource::normal, py::arg("mean"), py::arg("stddev"),
           "Generate a normally distributed random number with given mean and "
           "stddev");

  py::class_<Rng, RandomSource>(m, "Rng")
      .def(py::init([]() { return Rng(std::random_device{}()); }),
           "Initialize the RNG from a fresh random_device seed")
      .def(py::init<std::uint64_t>(), py::arg("seed"),
           "Initialize the RNG with the given seed");

  m.def(
      "metropolis_hastings",
      [](py::object x_init, py::object proposal, py::object log_prior, py::object log_likelihood,
         py::object data, py::object proposal_kwargs, std::int64_t samples, double burn_in, Rng *rng,
         bool proposal_rng) {
        LogPosteriorRatio rule(wrap_likelihood(log_likelihood, data), wrap_unary(log_prior));
        return run_partition(x_init, wrap_proposal(proposal, proposal_kwargs, proposal_rng), rule, samples,
                             burn_in, rng);
      },
      py::arg("x_init"), py::arg("proposal"), py::arg("log_prior"), py::arg("log_likelihood"),
      py::arg("data"), py::arg("proposal_kwargs") = py::none(), py::arg("samples") = 10000,
      py::arg("burn_in") = 0.0, py::arg("rng") = py::none(), py::arg("proposal_rng") = false,
      "Sample with a log prior and log likelihood. Returns (accepted, rejected) candidates past burn-in");

  m.def(
      "metropolis_hastings_prior",
      [](py::object x_init, py::object proposal, py::object prior, py::object log_likelihood,
         py::object data, py::object proposal_kwargs, std::int64_t samples, double burn_in, Rng *rng,
         bool proposal_rng) {
        RawPriorRatio rule(wrap_likelihood(log_likelihood, data), wrap_unary(prior));
        return run_partition(x_init, wrap_proposal(proposal, proposal_kwargs, proposal_rng), rule, samples,
                             burn_in, rng);
      },
      py::arg("x_init"), py::arg("proposal"), py::arg("prior"), py::arg("log_likelihood"),
      py::arg("data"), py::arg("proposal_kwargs") = py::none(), py::arg("samples") = 10000,
      py::arg("burn_in") = 0.0, py::arg("rng") = py::none(), py::arg("proposal_rng") = false,
      "Sample with a linear-space prior and log likelihood. The prior must stay strictly positive");

  m.def(
      "metropolis_hastings_acceptance",
      [](py::object x_init, py::object proposal, py::object acceptance, py::object proposal_kwargs,
         std::int64_t samples, double burn_in, Rng *rng, bool proposal_rng) {
        ExternalAcceptance rule([acceptance](const State &current, const State &candidate) {
          return acceptance(from_state(current), from_state(candidate)).cast<double>();
        });
        return run_partition(x_init, wrap_proposal(proposal, proposal_kwargs, proposal_rng), rule, samples,
                             burn_in, rng);
      },
      py::arg("x_init"), py::arg("proposal"), py::arg("acceptance"),
      py::arg("proposal_kwargs") = py::none(), py::arg("samples") = 10000, py::arg("burn_in") = 0.0,
      py::arg("rng") = py::none(), py::arg("proposal_rng") = false,
      "Sample with a caller supplied acceptance ratio acceptance(x, x_candidate)");

  m.def(
      "metropolis_hastings_chain",
      [](py::object x_init, py::object proposal, py::object log_prior, py::object log_likelihood,
         py::object data, py::object proposal_kwargs, std::int64_t samples, Rng *rng, bool proposal_rng) {
        LogPosteriorRatio rule(wrap_likelihood(log_likelihood, data), wrap_unary(log_prior));
        const State initial = to_state(x_init);
        const SamplerConfig config = make_config(samples, 0.0);

        Rng local = make_rng(config);
        Chain chain = sample_chain(initial, config, wrap_proposal(proposal, proposal_kwargs, proposal_rng), rule,
                                   rng ? *rng : local);
        return to_numpy(chain.states, chain.shape);
      },
      py::arg("x_init"), py::arg("proposal"), py::arg("log_prior"), py::arg("log_likelihood"),
      py::arg("data"), py::arg("proposal_kwargs") = py::none(), py::arg("samples") = 10000,
      py::arg("rng") = py::none(), py::arg("proposal_rng") = false,
      "Sample the full chain of `samples` states; rejected steps repeat the previous state");

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
      py::arg("level"), "Set the logging level for the metrochain module");
}
