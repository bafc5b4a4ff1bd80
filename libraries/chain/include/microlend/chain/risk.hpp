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
#pragma once
#include <microlend/chain/types.hpp>
#include <microlend/protocol/loan.hpp>

namespace microlend { namespace chain {

   class database;
   class loan_object;

   /**
    * Checks a loan request against the current ledger state, in this order:
    *
    * 1. emergency_stop_active if the ledger is stopped
    * 2. invalid_collateral_asset if the collateral (or the debt asset, if any) is not listed or has no price
    * 3. insufficient_collateral if the collateral value is below the minimum collateral ratio of the debt value
    * 4. invalid_duration if the duration is outside of the configured bounds
    * 5. invalid_interest_rate if the interest rate is above the configured maximum
    */
   void validate_loan_request( const database& d, const loan_create_operation& op );

   /**
    * @return true if collateral_value / debt_value >= ratio_bps / MICROLEND_100_PERCENT,
    * computed exactly in 128 bits. Values are amounts multiplied by their prices.
    */
   bool meets_collateral_ratio( share_type collateral_amount, share_type collateral_price,
                                share_type debt_amount, share_type debt_price, uint32_t ratio_bps );

   /**
    * Principal plus flat interest, truncated toward zero. The elapsed time is irrelevant.
    */
   share_type calculate_total_due( share_type amount, uint32_t interest_rate_bps );
   share_type calculate_total_due( const loan_object& loan );

} } // microlend::chain
