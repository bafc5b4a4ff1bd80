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
#include <microlend/protocol/ledger_parameters.hpp>
#include <microlend/protocol/exceptions.hpp>

#include <fc/io/raw.hpp>

namespace microlend { namespace protocol {

   void ledger_parameters::validate()const
   {
      MICROLEND_ASSERT( min_collateral_ratio_bps >= MICROLEND_100_PERCENT, invalid_parameters,
                        "Minimum collateral ratio should be at least 100%" );
      MICROLEND_ASSERT( min_collateral_ratio_bps <= MICROLEND_MAX_COLLATERAL_RATIO_BPS, invalid_parameters,
                        "Minimum collateral ratio should not exceed ${max}",
                        ("max",MICROLEND_MAX_COLLATERAL_RATIO_BPS) );
      MICROLEND_ASSERT( min_duration_blocks > 0, invalid_parameters,
                        "Minimum duration should be positive" );
      MICROLEND_ASSERT( min_duration_blocks <= max_duration_blocks, invalid_parameters,
                        "Minimum duration ${min} should not exceed maximum duration ${max}",
                        ("min",min_duration_blocks)("max",max_duration_blocks) );
      MICROLEND_ASSERT( max_interest_rate_bps <= MICROLEND_MAX_INTEREST_RATE_BPS_LIMIT, invalid_parameters,
                        "Maximum interest rate should not exceed ${max}",
                        ("max",MICROLEND_MAX_INTEREST_RATE_BPS_LIMIT) );
      MICROLEND_ASSERT( default_penalty <= MICROLEND_MAX_REPUTATION_SCORE, invalid_parameters,
                        "Default penalty should not exceed ${max}", ("max",MICROLEND_MAX_REPUTATION_SCORE) );
      MICROLEND_ASSERT( repayment_bonus <= MICROLEND_MAX_REPUTATION_SCORE, invalid_parameters,
                        "Repayment bonus should not exceed ${max}", ("max",MICROLEND_MAX_REPUTATION_SCORE) );
   }

} } // microlend::protocol

MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::ledger_parameters )
