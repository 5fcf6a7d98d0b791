// =============================================================================
// stochsim v1 - Python Bindings
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>

#include "stochsim/v1/integrator.hpp"
#include "stochsim/v1/problems.hpp"
#include "stochsim/v1/step_logger.hpp"
#include "stochsim/v1/tableau.hpp"
#include "stochsim/v1/validation.hpp"

#include <stdexcept>
#include <string>

namespace py = pybind11;
using namespace stochsim::v1;

namespace {

// =============================================================================
// Helper: Convert std::expected to Python (raise exception on error)
// =============================================================================

template<typename T>
T unwrap_expected(const std::expected<T, std::string>& result, const char* context) {
    if (!result) {
        throw std::runtime_error(std::string(context) + ": " + result.error());
    }
    return *result;
}

NoiseKind parse_noise_kind(const std::string& noise) {
    if (noise == "diagonal") return NoiseKind::Diagonal;
    if (noise == "scalar") return NoiseKind::Scalar;
    throw std::invalid_argument("noise must be 'diagonal' or 'scalar', got '" + noise + "'");
}

/// Python callables return arrays; the core works with in-place callables
SDEProblem problem_from_python(py::function drift,
                               py::function diffusion,
                               const Vector& u0,
                               const std::string& noise,
                               py::object analytic) {
    SDEProblem problem = SDEProblem::from_functions(
        [drift](Real t, const Vector& u) { return drift(u, t).cast<Vector>(); },
        [diffusion](Real t, const Vector& u) { return diffusion(u, t).cast<Vector>(); },
        u0,
        NoiseDescriptor{parse_noise_kind(noise)});
    problem.name = "python";
    if (!analytic.is_none()) {
        py::function fn = analytic.cast<py::function>();
        problem.analytic = [fn](Real t, const Vector& u0_, const Vector& W) {
            return fn(u0_, t, W).cast<Vector>();
        };
    }
    return problem;
}

}  // namespace

PYBIND11_MODULE(_stochsim, m) {
    m.doc() = R"pbdoc(
        stochsim - adaptive stochastic differential equation integrator

        Example:
            import numpy as np
            import _stochsim as ss

            opts = ss.SolveOptions()
            opts.adaptive = True
            sol = ss.solve(lambda u, t: 1.01 * u, lambda u, t: 0.87 * u,
                           np.array([0.5]), [0.0, 1.0], opts)
            print(sol.status, sol.u, sol.accepted_steps)
    )pbdoc";

    // =========================================================================
    // Enums
    // =========================================================================

    py::enum_<Algorithm>(m, "Algorithm", "Integration scheme")
        .value("EM", Algorithm::EM)
        .value("RKMil", Algorithm::RKMil)
        .value("SRA", Algorithm::SRA)
        .value("SRI", Algorithm::SRI)
        .value("SRIW1Optimized", Algorithm::SRIW1Optimized)
        .value("SRA1Optimized", Algorithm::SRA1Optimized)
        .value("SRAVectorized", Algorithm::SRAVectorized)
        .value("SRIVectorized", Algorithm::SRIVectorized)
        .value("TauLeaping", Algorithm::TauLeaping);

    py::enum_<AdaptiveController>(m, "AdaptiveController", "Step-size control policy")
        .value("RSwM3", AdaptiveController::RSwM3)
        .value("PI", AdaptiveController::PI);

    py::enum_<SolveStatus>(m, "SolveStatus", "Run outcome")
        .value("Success", SolveStatus::Success)
        .value("InputError", SolveStatus::InputError)
        .value("StepSizeCollapse", SolveStatus::StepSizeCollapse)
        .value("IterationBudgetExceeded", SolveStatus::IterationBudgetExceeded)
        .value("UnimplementedScheme", SolveStatus::UnimplementedScheme)
        .value("InvalidTableau", SolveStatus::InvalidTableau);

    py::enum_<StepEvent>(m, "StepEvent")
        .value("Accepted", StepEvent::Accepted)
        .value("RejectedError", StepEvent::RejectedError)
        .value("RejectedNonFinite", StepEvent::RejectedNonFinite)
        .value("FinalStep", StepEvent::FinalStep);

    // =========================================================================
    // Tableaus
    // =========================================================================

    py::class_<SRITableau>(m, "SRITableau", "Stochastic Runge-Kutta tableau for diagonal noise")
        .def(py::init<>())
        .def_readwrite("name", &SRITableau::name)
        .def_readwrite("c0", &SRITableau::c0)
        .def_readwrite("c1", &SRITableau::c1)
        .def_readwrite("A0", &SRITableau::A0)
        .def_readwrite("A1", &SRITableau::A1)
        .def_readwrite("B0", &SRITableau::B0)
        .def_readwrite("B1", &SRITableau::B1)
        .def_readwrite("alpha", &SRITableau::alpha)
        .def_readwrite("beta1", &SRITableau::beta1)
        .def_readwrite("beta2", &SRITableau::beta2)
        .def_readwrite("beta3", &SRITableau::beta3)
        .def_readwrite("beta4", &SRITableau::beta4)
        .def_readwrite("order", &SRITableau::order)
        .def("stages", &SRITableau::stages);

    py::class_<SRATableau>(m, "SRATableau", "Stochastic Runge-Kutta tableau for additive noise")
        .def(py::init<>())
        .def_readwrite("name", &SRATableau::name)
        .def_readwrite("c0", &SRATableau::c0)
        .def_readwrite("c1", &SRATableau::c1)
        .def_readwrite("A0", &SRATableau::A0)
        .def_readwrite("B0", &SRATableau::B0)
        .def_readwrite("alpha", &SRATableau::alpha)
        .def_readwrite("beta1", &SRATableau::beta1)
        .def_readwrite("beta2", &SRATableau::beta2)
        .def_readwrite("order", &SRATableau::order);

    m.def("construct_sriw1", &construct_sriw1, "Rossler SRIW1 tableau (order 1.5)");
    m.def("construct_sra1", &construct_sra1, "Rossler SRA1 tableau (order 2.0)");
    m.def("check_order_conditions",
          [](const SRITableau& t, Real tol) { return check_order_conditions(t, tol); },
          py::arg("tableau"), py::arg("tol") = 1e-12);
    m.def("check_order_conditions",
          [](const SRATableau& t, Real tol) { return check_order_conditions(t, tol); },
          py::arg("tableau"), py::arg("tol") = 1e-12);

    // =========================================================================
    // Options and Results
    // =========================================================================

    py::class_<StepLogEntry>(m, "StepLogEntry")
        .def_readonly("time", &StepLogEntry::time)
        .def_readonly("dt", &StepLogEntry::dt)
        .def_readonly("error_norm", &StepLogEntry::error_norm)
        .def_readonly("dt_next", &StepLogEntry::dt_next)
        .def_readonly("event", &StepLogEntry::event)
        .def("accepted", &StepLogEntry::accepted);

    py::class_<StepLogger>(m, "StepLogger", "Opt-in record of every attempted step")
        .def(py::init<>())
        .def("set_enabled", &StepLogger::set_enabled)
        .def("is_enabled", &StepLogger::is_enabled)
        .def("buffer", &StepLogger::buffer, py::return_value_policy::reference_internal)
        .def("to_csv", &StepLogger::to_csv)
        .def("reset", &StepLogger::reset)
        .def_property_readonly("total_entries", &StepLogger::total_entries)
        .def_property_readonly("rejected_steps", &StepLogger::rejected_steps)
        .def_property_readonly("rejection_rate", &StepLogger::rejection_rate)
        .def_property_readonly("max_error", &StepLogger::max_error);

    py::class_<ProgressInfo>(m, "ProgressInfo")
        .def_readonly("t", &ProgressInfo::t)
        .def_readonly("dt", &ProgressInfo::dt)
        .def_readonly("fraction", &ProgressInfo::fraction)
        .def_readonly("accepted_steps", &ProgressInfo::accepted_steps)
        .def_readonly("rejected_steps", &ProgressInfo::rejected_steps);

    py::class_<SolveOptions>(m, "SolveOptions", "Integrator options")
        .def(py::init<>())
        .def_readwrite("dt", &SolveOptions::dt, "Step size; 0 selects it automatically")
        .def_readwrite("save_timeseries", &SolveOptions::save_timeseries)
        .def_readwrite("timeseries_steps", &SolveOptions::timeseries_steps)
        .def_readwrite("adaptive", &SolveOptions::adaptive)
        .def_readwrite("algorithm", &SolveOptions::algorithm)
        .def_readwrite("abstol", &SolveOptions::abstol)
        .def_readwrite("reltol", &SolveOptions::reltol)
        .def_readwrite("delta", &SolveOptions::delta)
        .def_readwrite("internalnorm", &SolveOptions::internalnorm)
        .def_readwrite("adaptive_controller", &SolveOptions::adaptive_controller)
        .def_readwrite("gamma", &SolveOptions::gamma)
        .def_readwrite("qmin", &SolveOptions::qmin)
        .def_readwrite("qmax", &SolveOptions::qmax)
        .def_readwrite("beta_p", &SolveOptions::beta_p)
        .def_readwrite("discard_length", &SolveOptions::discard_length)
        .def_readwrite("dtmax", &SolveOptions::dtmax)
        .def_readwrite("dtmin", &SolveOptions::dtmin)
        .def_readwrite("maxiters", &SolveOptions::maxiters)
        .def_readwrite("seed", &SolveOptions::seed)
        .def_readwrite("progress_steps", &SolveOptions::progress_steps)
        .def_readwrite("progress", &SolveOptions::progress)
        .def("set_tableau", [](SolveOptions& o, const SRITableau& t) { o.tableau = Tableau{t}; })
        .def("set_tableau", [](SolveOptions& o, const SRATableau& t) { o.tableau = Tableau{t}; })
        .def("clear_tableau", [](SolveOptions& o) { o.tableau.reset(); })
        .def("set_step_logger", [](SolveOptions& o, StepLogger* logger) { o.step_logger = logger; },
             py::keep_alive<1, 2>());

    py::class_<Solution>(m, "Solution", "Integration result with telemetry")
        .def_readonly("u", &Solution::u)
        .def_readonly("t", &Solution::t)
        .def_readonly("W", &Solution::W)
        .def_readonly("time", &Solution::time)
        .def_readonly("states", &Solution::states)
        .def_readonly("wiener", &Solution::wiener)
        .def_readonly("u_analytic", &Solution::u_analytic)
        .def_readonly("states_analytic", &Solution::states_analytic)
        .def_readonly("status", &Solution::status)
        .def_readonly("message", &Solution::message)
        .def_readonly("algorithm", &Solution::algorithm)
        .def_readonly("accepted_steps", &Solution::accepted_steps)
        .def_readonly("rejected_steps", &Solution::rejected_steps)
        .def_readonly("nonfinite_rejections", &Solution::nonfinite_rejections)
        .def_readonly("max_stack_size", &Solution::max_stack_size)
        .def_readonly("initial_dt", &Solution::initial_dt)
        .def_readonly("last_dt", &Solution::last_dt)
        .def_readonly("wall_time_seconds", &Solution::wall_time_seconds)
        .def("success", &Solution::success)
        .def("__repr__", [](const Solution& s) {
            return "<Solution status=" + std::string(to_string(s.status)) +
                   " t=" + std::to_string(s.t) +
                   " accepted=" + std::to_string(s.accepted_steps) +
                   " rejected=" + std::to_string(s.rejected_steps) + ">";
        });

    py::class_<AnalyticComparison>(m, "AnalyticComparison")
        .def_readonly("test_name", &AnalyticComparison::test_name)
        .def_readonly("passed", &AnalyticComparison::passed)
        .def_readonly("max_error", &AnalyticComparison::max_error)
        .def_readonly("rms_error", &AnalyticComparison::rms_error)
        .def_readonly("final_error", &AnalyticComparison::final_error)
        .def("__repr__", &AnalyticComparison::to_string);

    // =========================================================================
    // Entry Points
    // =========================================================================

    m.def("solve",
          [](py::function drift, py::function diffusion, const Vector& u0,
             const std::vector<Real>& tspan, const SolveOptions& options,
             const std::string& noise, py::object analytic) {
              const SDEProblem problem = problem_from_python(
                  std::move(drift), std::move(diffusion), u0, noise, std::move(analytic));
              return solve(problem, tspan, options);
          },
          py::arg("drift"), py::arg("diffusion"), py::arg("u0"),
          py::arg("tspan") = std::vector<Real>{0.0, 1.0},
          py::arg("options") = SolveOptions{},
          py::arg("noise") = "diagonal",
          py::arg("analytic") = py::none(),
          "Integrate du = f(u,t) dt + g(u,t) dW; drift and diffusion return arrays");

    m.def("solve_problem",
          [](const std::string& name, const ProblemParameters& parameters,
             const std::optional<Vector>& u0, const std::vector<Real>& tspan,
             const SolveOptions& options) {
              const SDEProblem problem = unwrap_expected(make_problem(name, parameters, u0), "solve_problem");
              return solve(problem, tspan, options);
          },
          py::arg("name"), py::arg("parameters") = ProblemParameters{},
          py::arg("u0") = std::nullopt,
          py::arg("tspan") = std::vector<Real>{0.0, 1.0},
          py::arg("options") = SolveOptions{},
          "Integrate a built-in catalogue problem");

    m.def("problem_names", [] {
        std::vector<std::string> names;
        for (const auto& info : problem_catalogue()) names.push_back(info.name);
        return names;
    });

    m.def("compare_with_analytic", &compare_with_analytic,
          py::arg("solution"), py::arg("name") = "", py::arg("threshold") = 1e-2);
}
