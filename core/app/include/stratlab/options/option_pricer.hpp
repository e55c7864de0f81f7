#pragma once

#include "stratlab/domain/option_types.hpp"

#include <string>
#include <vector>

namespace stratlab {

// -----------------------------------------------------------------------------
// Option pricing
// -----------------------------------------------------------------------------
//
// @brief  Stateless Black-Scholes and Cox-Ross-Rubinstein pricing of single
//         equity options, plus payoff helpers.
//
// @details
// No dividends. Inputs with T <= 0, sigma <= 0, S <= 0 or K <= 0 (or any
// non-finite input) are degenerate: every numeric output is NaN. Nothing
// here throws on numeric input.
//
// The models are illustrative; they are not calibrated for production
// pricing.
//
// Thread-safety: Pure functions.
// -----------------------------------------------------------------------------

// Case-insensitive "call" / "put". Throws std::invalid_argument otherwise.
domain::OptionType parseOptionType(const std::string& text);

std::string optionTypeKey(domain::OptionType type);

// Standard normal CDF and PDF.
double normalCdf(double x);
double normalPdf(double x);

// -------------------------------------------------------------------------
// blackScholesGreeks(quote)
// -------------------------------------------------------------------------
// @brief  Closed-form price and Greeks.
//
// @return price, delta, gamma, theta (per calendar day), vega (per 1 vol
//         point) and rho (per 1 rate point). All NaN for degenerate input.
// -------------------------------------------------------------------------
domain::OptionGreeks blackScholesGreeks(const domain::OptionQuote& quote);

// -------------------------------------------------------------------------
// binomialOptionPrice(quote, steps, american)
// -------------------------------------------------------------------------
// @brief  Recombining-tree price with optional early exercise.
//
// @details
//   dt = T / steps, u = exp(sigma * sqrt(dt)), d = 1 / u,
//   p  = (exp(r * dt) - d) / (u - d).
// Terminal payoffs are discounted back one level at a time. When
// `american` is true each interior node takes max(continuation, intrinsic).
// O(steps^2) time, O(steps) memory.
//
// @return Root value, or NaN for degenerate input or steps < 1.
// -------------------------------------------------------------------------
double binomialOptionPrice(const domain::OptionQuote& quote, int steps,
                           bool american);

// -------------------------------------------------------------------------
// optionProfitLoss
// -------------------------------------------------------------------------
// @brief  Expiry P/L of one long contract across underlying prices
//         evenly spaced over [0.7 * spot, 1.3 * spot].
//
// @param  premium        Price paid per share.
// @param  contract_size  Shares per contract.
// @param  points         Number of price samples (>= 2).
//
// @throws std::invalid_argument if points < 2.
// -------------------------------------------------------------------------
std::vector<domain::PayoffPoint> optionProfitLoss(
    double spot, double strike, double premium, domain::OptionType type,
    double contract_size = 100.0, int points = 100);

// Underlying price at expiry where a long position breaks even.
double optionBreakeven(double strike, double premium, domain::OptionType type);

// -------------------------------------------------------------------------
// priceOptionChain
// -------------------------------------------------------------------------
// @brief  Black-Scholes Greeks for every row of a chain, using each row's
//         implied volatility. Rows without a usable volatility get NaN
//         Greeks rather than being dropped.
// -------------------------------------------------------------------------
std::vector<domain::OptionChainGreeks> priceOptionChain(
    double spot, double time_to_expiry, double risk_free_rate,
    domain::OptionType type, const std::vector<domain::OptionChainRow>& rows);

}  // namespace stratlab
