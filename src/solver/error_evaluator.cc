/**
 * @file   error_evaluator.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  self-consistency and analytical error measures of computed displacements
 *
 * Copyright © 2026 µElastic developers
 *
 * µElastic is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, either version 3, or (at
 * your option) any later version.
 *
 * µElastic is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with µElastic; see the file COPYING. If not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 *
 */

#include "solver/error_evaluator.hh"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace muElastic {

  using muGalerkin::dx;
  using muGalerkin::operator+;

  /* ---------------------------------------------------------------------- */
  ConvergenceLog::ConvergenceLog(std::ostream * time_sink,
                                 std::ostream * residual_sink,
                                 std::ostream * analytical_sink)
      : time_sink{time_sink}, residual_sink{residual_sink},
        analytical_sink{analytical_sink} {}

  /* ---------------------------------------------------------------------- */
  ConvergenceLog
  ConvergenceLog::append_to_files(const std::string & directory,
                                  const ElasticityModel & model) {
    auto open{[&directory](const std::string & name) {
      const std::string path{directory.empty() ? name
                                               : directory + "/" + name};
      auto file{std::make_unique<std::ofstream>(path, std::ios::app)};
      if (not file->is_open()) {
        std::stringstream err{};
        err << "could not open the log file '" << path << "' for appending";
        throw muGalerkin::RuntimeError(err.str());
      }
      return file;
    }};
    std::string residual_name{};
    switch (model) {
    case ElasticityModel::Cauchy: {
      residual_name = "N_errorLameNavier.dat";
      break;
    }
    case ElasticityModel::Gradient: {
      residual_name = "N_errorBalanceLinMom.dat";
      break;
    }
    default:
      throw muGalerkin::RuntimeError("unknown elasticity model");
      break;
    }

    ConvergenceLog ret_val{};
    ret_val.owned_files.push_back(open("N_time.dat"));
    ret_val.time_sink = ret_val.owned_files.back().get();
    ret_val.owned_files.push_back(open(residual_name));
    ret_val.residual_sink = ret_val.owned_files.back().get();
    ret_val.owned_files.push_back(open("N_error_u_ana.dat"));
    ret_val.analytical_sink = ret_val.owned_files.back().get();
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  void ConvergenceLog::write(std::ostream * sink, const Index_t & nb_modes,
                             const Real & value) {
    if (sink == nullptr) {
      return;
    }
    *sink << nb_modes << " "
          << std::setprecision(std::numeric_limits<Real>::max_digits10)
          << value << std::endl;
  }

  /* ---------------------------------------------------------------------- */
  void ConvergenceLog::log_time(const Index_t & nb_modes,
                                const Real & seconds) {
    write(this->time_sink, nb_modes, seconds);
  }

  /* ---------------------------------------------------------------------- */
  void ConvergenceLog::log_residual_error(const Index_t & nb_modes,
                                          const Real & error) {
    write(this->residual_sink, nb_modes, error);
  }

  /* ---------------------------------------------------------------------- */
  void ConvergenceLog::log_analytical_error(const Index_t & nb_modes,
                                            const Real & error) {
    write(this->analytical_sink, nb_modes, error);
  }

  /* ---------------------------------------------------------------------- */
  Real residual_error(const muGalerkin::VectorFunction & u,
                      const GradientParameters & parameters,
                      const BodyForces_t & body_forces) {
    const Real lambda{parameters.lambda}, mu{parameters.mu};
    const Real c_laplace{parameters.get_c(1) + parameters.get_c(4)};
    const Real c_grad_div{parameters.get_c(2) + parameters.get_c(3) +
                          parameters.get_c(5)};

    auto && space{u.get_space().get_space(0)};
    const DynMatrix_t zero{
        DynMatrix_t::Zero(space.get_mesh(0).size(), space.get_mesh(1).size())};

    // grad(div u), grad(lapl(div u))
    std::array<DynMatrix_t, twoD> grad_div{zero, zero};
    std::array<DynMatrix_t, twoD> grad_lapl_div{zero, zero};
    for (Dim_t i{0}; i < twoD; ++i) {
      for (Dim_t j{0}; j < twoD; ++j) {
        auto && u_j{u[j]};
        grad_div[i] += u_j.backward(dx(i) + dx(j));
        if (c_grad_div != 0.) {
          for (Dim_t k{0}; k < twoD; ++k) {
            grad_lapl_div[i] +=
                u_j.backward(dx(i) + dx(j) + dx(k, secondOrder));
          }
        }
      }
    }

    Real error{0.};
    for (Dim_t i{0}; i < twoD; ++i) {
      auto && u_i{u[i]};
      auto && component_space{u.get_space().get_space(i)};
      DynMatrix_t laplace{zero}, bilaplace{zero};
      for (Dim_t j{0}; j < twoD; ++j) {
        laplace += u_i.backward(dx(j, secondOrder));
        if (c_laplace != 0.) {
          for (Dim_t k{0}; k < twoD; ++k) {
            bilaplace += u_i.backward(dx(j, secondOrder) + dx(k, secondOrder));
          }
        }
      }
      const DynMatrix_t residual{
          -mu * laplace - (lambda + mu) * grad_div[i] +
          c_laplace * bilaplace + c_grad_div * grad_lapl_div[i] -
          component_space.sample(body_forces[i])};
      error += component_space.integrate(residual.cwiseAbs2());
    }
    return std::sqrt(error);
  }

  /* ---------------------------------------------------------------------- */
  Real residual_error(const muGalerkin::VectorFunction & u,
                      const CauchyParameters & parameters,
                      const BodyForces_t & body_forces) {
    return residual_error(
        u, GradientParameters{parameters.lambda, parameters.mu, {}},
        body_forces);
  }

  /* ---------------------------------------------------------------------- */
  Real analytical_error(const muGalerkin::VectorFunction & u,
                        const DisplacementField_t & analytical_solution) {
    Real error{0.};
    for (Dim_t i{0}; i < u.get_nb_components(); ++i) {
      auto && space{u.get_space().get_space(i)};
      const DynMatrix_t difference{space.sample(analytical_solution[i]) -
                                   u[i].backward()};
      error += space.integrate(difference.cwiseAbs2());
    }
    return std::sqrt(error);
  }

}  // namespace muElastic
