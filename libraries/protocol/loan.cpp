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
#include <microlend/protocol/loan.hpp>

#include <fc/io/raw.hpp>

namespace microlend { namespace protocol {

// Duration and interest bounds are configurable, they are checked by the risk engine.
void loan_create_operation::validate()const
{
   MICROLEND_ASSERT( amount > 0, invalid_amount, "Loan amount should be positive" );
   MICROLEND_ASSERT( amount <= MICROLEND_MAX_SHARE_SUPPLY, invalid_amount,
                     "Loan amount should not exceed ${max}", ("max",MICROLEND_MAX_SHARE_SUPPLY) );
   MICROLEND_ASSERT( collateral_amount <= MICROLEND_MAX_SHARE_SUPPLY, invalid_amount,
                     "Collateral amount should not exceed ${max}", ("max",MICROLEND_MAX_SHARE_SUPPLY) );
   MICROLEND_ASSERT( is_valid_symbol( collateral_asset ), invalid_collateral_asset,
                     "Invalid collateral asset symbol ${s}", ("s",collateral_asset) );
   if( debt_asset.valid() )
      MICROLEND_ASSERT( is_valid_symbol( *debt_asset ), invalid_collateral_asset,
                        "Invalid debt asset symbol ${s}", ("s",*debt_asset) );
}

} } // microlend::protocol

MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::loan_create_operation )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::loan_activate_operation )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::loan_repay_operation )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::loan_liquidate_operation )
