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
#include <microlend/protocol/collateral_asset.hpp>

#include <fc/io/raw.hpp>

namespace microlend { namespace protocol {

void collateral_asset_add_operation::validate()const
{
   MICROLEND_ASSERT( is_valid_symbol( symbol ), invalid_collateral_asset,
                     "Invalid collateral asset symbol ${s}", ("s",symbol) );
}

void collateral_asset_update_price_operation::validate()const
{
   MICROLEND_ASSERT( is_valid_symbol( symbol ), invalid_collateral_asset,
                     "Invalid collateral asset symbol ${s}", ("s",symbol) );
   MICROLEND_ASSERT( price > 0, invalid_amount, "Price should be positive" );
   MICROLEND_ASSERT( price <= MICROLEND_MAX_ASSET_PRICE, invalid_amount,
                     "Price should not exceed ${max}", ("max",MICROLEND_MAX_ASSET_PRICE) );
}

} } // microlend::protocol

MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::collateral_asset_add_operation )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::protocol::collateral_asset_update_price_operation )
