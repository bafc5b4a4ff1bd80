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
#include <microlend/protocol/base.hpp>

namespace microlend { namespace protocol {

   /**
    * @brief List an asset as acceptable collateral
    * @ingroup operations
    *
    * Only the ledger owner may list assets. Listing a symbol that is already known keeps its price.
    */
   struct collateral_asset_add_operation : public base_operation
   {
      asset_symbol_type symbol;   ///< Symbol of the asset, e.g. "STX"

      void            validate()const override;
   };

   /**
    * @brief Publish a new price for a listed collateral asset
    * @ingroup operations
    */
   struct collateral_asset_update_price_operation : public base_operation
   {
      asset_symbol_type symbol;
      share_type        price = 0;   ///< Price in micro-units

      void            validate()const override;
   };

} } // microlend::protocol

FC_REFLECT( microlend::protocol::collateral_asset_add_operation, (symbol) )
FC_REFLECT( microlend::protocol::collateral_asset_update_price_operation, (symbol)(price) )

MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::collateral_asset_add_operation )
MICROLEND_DECLARE_EXTERNAL_SERIALIZATION( microlend::protocol::collateral_asset_update_price_operation )
