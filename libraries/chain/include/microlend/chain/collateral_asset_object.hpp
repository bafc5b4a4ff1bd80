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
#include <microlend/db/generic_index.hpp>

namespace microlend { namespace chain {

/**
 *  @brief An asset accepted as loan collateral, together with its latest published price
 *  @ingroup object
 *  @ingroup protocol
 */
class collateral_asset_object : public abstract_object<collateral_asset_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = collateral_asset_object_type;

      asset_symbol_type symbol;                  ///< Ticker symbol
      share_type        price = 0;               ///< Price in micro-units, 0 if never published
      bool              listed = false;          ///< Whether the asset is accepted as collateral
      uint32_t          price_update_block = 0;  ///< Block of the latest price publication

      bool is_priced()const { return price > 0; }
};

struct by_symbol;

/**
* @ingroup object_index
*/
using collateral_asset_multi_index_type = multi_index_container<
   collateral_asset_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_symbol>,
         member< collateral_asset_object, asset_symbol_type, &collateral_asset_object::symbol >
      >
   >
>;

/**
* @ingroup object_index
*/
using collateral_asset_index = generic_index<collateral_asset_object, collateral_asset_multi_index_type>;

} } // microlend::chain

FC_REFLECT_DERIVED( microlend::chain::collateral_asset_object, (microlend::db::object),
                    (symbol)(price)(listed)(price_update_block) )
