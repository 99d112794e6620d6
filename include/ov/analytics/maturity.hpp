#pragma once
/**
 * @file maturity.hpp
 * @brief Horizon (années entières) utilisé par le pricer.
 *
 * A = jours(expiration - valorisation) / 365
 * B = jours(fin de vesting - valorisation) / 365
 * YTM = arrondi((A + B) / 2), demi vers le haut : floor(x + 0.5).
 *
 * Exemple : 2020-01-01 / 2025-01-01 / 2023-01-01 -> (5.0055 + 3.0027) / 2 = 4.004 -> 4.
 */

#include <ov/core/date.hpp>

namespace ov {
namespace analytics {

/// Moyenne fractionnaire (A + B) / 2 avant arrondi.
/// @throws ov::DomainError si expiration ou fin de vesting précède la date de valorisation.
double fractional_maturity(const core::Date& valuation,
                           const core::Date& expiration,
                           const core::Date& vesting_end);

/// @throws ov::DomainError (voir fractional_maturity).
int compute_maturity(const core::Date& valuation,
                     const core::Date& expiration,
                     const core::Date& vesting_end);

/// Début de la fenêtre d’historique : valorisation - YTM années (29/02 -> 28/02).
core::Date history_start(const core::Date& valuation, int years_to_maturity);

} // namespace analytics
} // namespace ov
