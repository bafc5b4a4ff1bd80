/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <microlend/chain/risk.hpp>
#include <microlend/chain/access_control.hpp>
#include <microlend/chain/collateral_asset_object.hpp>
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>
#include <microlend/chain/loan_object.hpp>

#include <fc/uint128.hpp>

#include <limits>

namespace microlend { namespace chain {

namespace detail {

   const collateral_asset_object& get_priced_asset( const database& d, const asset_symbol_type& symbol )
   {
      const auto* asset = d.find_collateral_asset( symbol );
      MICROLEND_ASSERT( asset != nullptr && asset->listed, invalid_collateral_asset,
                        "Asset ${s} is not listed as collateral", ("s",symbol) );
      MICROLEND_ASSERT( asset->is_priced(), invalid_collateral_asset,
                        "Asset ${s} has no price", ("s",symbol) );
      return *asset;
   }

} // detail

void validate_loan_request( const database& d, const loan_create_operation& op )
{
   const ledger_parameters& params = d.get_ledger_parameters();

   verify_not_emergency_stopped( d );

   const auto& collateral = detail::get_priced_asset( d, op.collateral_asset );

   // Without a distinct debt asset both sides are denominated in the collateral, the prices cancel out
   share_type collateral_price = 1;
   share_type debt_price = 1;
   if( op.debt_asset.valid() && *op.debt_asset != op.collateral_asset )
   {
      const auto& debt = detail::get_priced_asset( d, *op.debt_asset );
      collateral_price = collateral.price;
      debt_price = debt.price;
   }

   MICROLEND_ASSERT( meets_collateral_ratio( op.collateral_amount, collateral_price,
                                             op.amount, debt_price, params.min_collateral_ratio_bps ),
                     insufficient_collateral,
                     "Collateral ${c} does not cover ${r} basis points of the loan amount ${a}",
                     ("c",op.collateral_amount)("a",op.amount)("r",params.min_collateral_ratio_bps) );

   MICROLEND_ASSERT( op.duration_blocks >= params.min_duration_blocks
                     && op.duration_blocks <= params.max_duration_blocks,
                     invalid_duration,
                     "Duration ${d} is outside of [${min}, ${max}]",
                     ("d",op.duration_blocks)("min",params.min_duration_blocks)("max",params.max_duration_blocks) );

   MICROLEND_ASSERT( op.interest_rate_bps <= params.max_interest_rate_bps, invalid_interest_rate,
                     "Interest rate ${r} exceeds the maximum of ${max}",
                     ("r",op.interest_rate_bps)("max",params.max_interest_rate_bps) );
}

bool meets_collateral_ratio( share_type collateral_amount, share_type collateral_price,
                             share_type debt_amount, share_type debt_price, uint32_t ratio_bps )
{
   fc::uint128_t collateral_value = fc::uint128_t( collateral_amount ) * collateral_price;
   fc::uint128_t debt_value = fc::uint128_t( debt_amount ) * debt_price;
   return collateral_value * MICROLEND_100_PERCENT >= debt_value * ratio_bps;
}

share_type calculate_total_due( share_type amount, uint32_t interest_rate_bps )
{
   fc::uint128_t interest = fc::uint128_t( amount ) * interest_rate_bps / MICROLEND_100_PERCENT;
   FC_ASSERT( interest <= std::numeric_limits<share_type>::max() - amount, "Total due overflow" );
   return amount + static_cast<share_type>( interest );
}

share_type calculate_total_due( const loan_object& loan )
{
   return calculate_total_due( loan.amount, loan.interest_rate_bps );
}

} } // microlend::chain
