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
#include <microlend/chain/genesis_state.hpp>
#include <microlend/chain/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>
#include <fc/log/logger.hpp>

#include <set>

namespace microlend { namespace chain {

void genesis_state_type::validate()const
{ try {
   MICROLEND_ASSERT( is_valid_account_name( initial_owner ), invalid_genesis_state,
                     "Invalid initial owner ${o}", ("o",initial_owner) );

   try {
      initial_parameters.validate();
   } catch( const invalid_parameters& e ) {
      FC_THROW_EXCEPTION( invalid_genesis_state, "Invalid initial parameters: ${e}", ("e",e.to_string()) );
   }

   std::set<asset_symbol_type> symbols;
   for( const auto& asset : initial_collateral_assets )
   {
      MICROLEND_ASSERT( is_valid_symbol( asset.symbol ), invalid_genesis_state,
                        "Invalid collateral asset symbol ${s}", ("s",asset.symbol) );
      MICROLEND_ASSERT( asset.price <= MICROLEND_MAX_ASSET_PRICE, invalid_genesis_state,
                        "Price of ${s} exceeds ${max}", ("s",asset.symbol)("max",MICROLEND_MAX_ASSET_PRICE) );
      MICROLEND_ASSERT( symbols.insert( asset.symbol ).second, invalid_genesis_state,
                        "Collateral asset ${s} is listed twice", ("s",asset.symbol) );
   }
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type genesis_state_type::from_json( const string& json )
{ try {
   return fc::json::from_string( json ).as<genesis_state_type>( MICROLEND_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type genesis_state_type::from_file( const fc::path& path )
{ try {
   FC_ASSERT( fc::exists( path ), "Genesis file ${p} does not exist", ("p",path) );
   ilog( "Loading genesis state from ${p}", ("p",path) );
   return fc::json::from_file( path ).as<genesis_state_type>( MICROLEND_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW( (path) ) }

} } // microlend::chain

FC_REFLECT_DERIVED_NO_TYPENAME(microlend::chain::genesis_state_type::initial_collateral_asset_type, BOOST_PP_SEQ_NIL,
           (symbol)(price))

FC_REFLECT_DERIVED_NO_TYPENAME(microlend::chain::genesis_state_type, BOOST_PP_SEQ_NIL,
           (initial_owner)(initial_parameters)(initial_collateral_assets))

MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::chain::genesis_state_type::initial_collateral_asset_type )
MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION( microlend::chain::genesis_state_type )
