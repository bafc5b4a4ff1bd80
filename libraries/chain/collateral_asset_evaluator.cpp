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
#include <microlend/chain/collateral_asset_evaluator.hpp>
#include <microlend/chain/collateral_asset_object.hpp>

#include <microlend/chain/access_control.hpp>
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>

namespace microlend { namespace chain {

void collateral_asset_add_evaluator::do_authorize( const collateral_asset_add_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result collateral_asset_add_evaluator::do_evaluate( const collateral_asset_add_operation& op )
{ try {
   _asset = db().find_collateral_asset( op.symbol );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

bool collateral_asset_add_evaluator::do_apply( const collateral_asset_add_operation& op ) const
{ try {
   database& d = db();

   if( _asset != nullptr )
   {
      // Listing a known asset again keeps its price
      d.modify( *_asset, []( collateral_asset_object& a ){
         a.listed = true;
      });
   }
   else
   {
      d.create<collateral_asset_object>( [&op]( collateral_asset_object& a ){
         a.symbol = op.symbol;
         a.listed = true;
      });
   }
   dlog( "Collateral asset ${s} listed", ("s",op.symbol) );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void collateral_asset_update_price_evaluator::do_authorize( const collateral_asset_update_price_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result collateral_asset_update_price_evaluator::do_evaluate( const collateral_asset_update_price_operation& op )
{ try {
   _asset = db().find_collateral_asset( op.symbol );
   MICROLEND_ASSERT( _asset != nullptr && _asset->listed, invalid_collateral_asset,
                     "Asset ${s} is not listed as collateral", ("s",op.symbol) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

bool collateral_asset_update_price_evaluator::do_apply( const collateral_asset_update_price_operation& op ) const
{ try {
   const uint32_t current_block = block_num();
   db().modify( *_asset, [&op,current_block]( collateral_asset_object& a ){
      a.price = op.price;
      a.price_update_block = current_block;
   });
   dlog( "Price of ${s} set to ${p} at block ${b}", ("s",op.symbol)("p",op.price)("b",current_block) );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // microlend::chain
