/**
 * @file   elastic_parameters.cc
 *
 * @date   19 Oct 2026
 *
 * @brief  material constants of Cauchy and strain-gradient elasticity
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

#include "materials/elastic_parameters.hh"
#include "materials/materials_toolbox.hh"

#include <sstream>

namespace muElastic {

  /* ---------------------------------------------------------------------- */
  CauchyParameters
  CauchyParameters::from_values(const std::vector<Real> & values) {
    if (static_cast<Index_t>(values.size()) != NbParameters) {
      std::stringstream err{};
      err << "Cauchy elasticity takes " << NbParameters
          << " material parameters (lambda, mu), but " << values.size()
          << " were given";
      throw InputError(err.str());
    }
    return CauchyParameters{values[0], values[1]};
  }

  /* ---------------------------------------------------------------------- */
  CauchyParameters CauchyParameters::from_young_poisson(const Real & young,
                                                        const Real & poisson) {
    return CauchyParameters{MatTB::compute_lambda(young, poisson),
                            MatTB::compute_mu(young, poisson)};
  }

  /* ---------------------------------------------------------------------- */
  std::vector<Real> CauchyParameters::get_values() const {
    return {this->lambda, this->mu};
  }

  /* ---------------------------------------------------------------------- */
  GradientParameters
  GradientParameters::from_values(const std::vector<Real> & values) {
    if (static_cast<Index_t>(values.size()) != NbParameters) {
      std::stringstream err{};
      err << "gradient elasticity takes " << NbParameters
          << " material parameters (lambda, mu, c1, c2, c3, c4, c5), but "
          << values.size() << " were given";
      throw InputError(err.str());
    }
    return GradientParameters{
        values[0],
        values[1],
        {values[2], values[3], values[4], values[5], values[6]}};
  }

  /* ---------------------------------------------------------------------- */
  CauchyParameters GradientParameters::get_cauchy() const {
    return CauchyParameters{this->lambda, this->mu};
  }

  /* ---------------------------------------------------------------------- */
  const Real & GradientParameters::get_c(const Index_t & index) const {
    if (index < 1 or index > NbGradientConstants) {
      std::stringstream err{};
      err << "there is no gradient constant c" << index;
      throw InputError(err.str());
    }
    return this->c[index - 1];
  }

  /* ---------------------------------------------------------------------- */
  std::vector<Real> GradientParameters::get_values() const {
    std::vector<Real> ret_val{this->lambda, this->mu};
    ret_val.insert(ret_val.end(), this->c.begin(), this->c.end());
    return ret_val;
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os,
                            const CauchyParameters & parameters) {
    os << "λ = " << parameters.lambda << ", µ = " << parameters.mu
       << " (E = " << MatTB::compute_young(parameters.lambda, parameters.mu)
       << ", ν = " << MatTB::compute_poisson(parameters.lambda, parameters.mu)
       << ")";
    return os;
  }

  /* ---------------------------------------------------------------------- */
  std::ostream & operator<<(std::ostream & os,
                            const GradientParameters & parameters) {
    os << parameters.get_cauchy();
    for (Index_t i{1}; i <= GradientParameters::NbGradientConstants; ++i) {
      os << ", c" << i << " = " << parameters.get_c(i);
    }
    return os;
  }

}  // namespace muElastic
