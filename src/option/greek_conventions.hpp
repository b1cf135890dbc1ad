// SPDX-License-Identifier: MIT
/**
 * @file greek_conventions.hpp
 * @brief Scaling conventions for quoted Greeks
 */

#pragma once

namespace papaya {

/**
 * @brief Conventions used to quote Greeks in market units
 *
 * Raw Greeks are per unit of the underlying parameter (theta per year,
 * rho per 1.0 change in rate). Desks quote theta per calendar day and
 * rho per one percentage point.
 */
struct GreekConventions {
    double days_per_year = 365.0;  ///< Calendar days used for theta per day
    double rate_bump = 0.01;       ///< Rate move used for scaled rho (1%)
};

}  // namespace papaya
