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
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>

#include <microlend/chain/collateral_asset_object.hpp>
#include <microlend/chain/ledger_property_object.hpp>

namespace microlend { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   MICROLEND_ASSERT( get_index_type<ledger_property_index>().size() == 0, genesis_already_applied,
                     "The genesis state has already been applied" );
   genesis_state.validate();

   FC_ASSERT( _undo_db.active_sessions() == 0, "Cannot apply the genesis state inside an undo session" );

   create<ledger_property_object>( [&genesis_state]( ledger_property_object& p ){
      p.owner = genesis_state.initial_owner;
      p.emergency_stopped = false;
      p.next_loan_id = MICROLEND_FIRST_LOAN_ID;
      p.parameters = genesis_state.initial_parameters;
   });

   for( const auto& asset : genesis_state.initial_collateral_assets )
   {
      create<collateral_asset_object>( [&asset]( collateral_asset_object& a ){
         a.symbol = asset.symbol;
         a.price = asset.price;
         a.listed = true;
      });
   }

   ilog( "Ledger initialized, owner ${o}, ${n} collateral assets",
         ("o",genesis_state.initial_owner)("n",genesis_state.initial_collateral_assets.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }
