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
#include <microlend/chain/risk.hpp>

#include <microlend/chain/collateral_asset_object.hpp>
#include <microlend/chain/ledger_property_object.hpp>
#include <microlend/chain/loan_object.hpp>

namespace microlend { namespace chain {

const ledger_property_object& database::get_ledger_properties()const
{
   const auto& idx = get_index_type<ledger_property_index>().indices();
   FC_ASSERT( !idx.empty(), "The genesis state has not been applied" );
   return *idx.begin();
}

const ledger_parameters& database::get_ledger_parameters()const
{
   return get_ledger_properties().parameters;
}

const account_name_type& database::get_ledger_owner()const
{
   return get_ledger_properties().owner;
}

bool database::get_contract_status()const
{
   return get_ledger_properties().emergency_stopped;
}

const collateral_asset_object* database::find_collateral_asset( const asset_symbol_type& symbol )const
{
   const auto& idx = get_index_type<collateral_asset_index>().indices().get<by_symbol>();
   auto itr = idx.find( symbol );
   if( itr == idx.end() )
      return nullptr;
   return &(*itr);
}

const collateral_asset_object& database::get_collateral_asset( const asset_symbol_type& symbol )const
{
   const auto* asset = find_collateral_asset( symbol );
   MICROLEND_ASSERT( asset != nullptr, invalid_collateral_asset, "Unknown collateral asset ${s}", ("s",symbol) );
   return *asset;
}

const loan_object* database::find_loan( loan_id_type loan_id )const
{
   const auto& idx = get_index_type<loan_index>().indices().get<by_loan_id>();
   auto itr = idx.find( loan_id );
   if( itr == idx.end() )
      return nullptr;
   return &(*itr);
}

const loan_object& database::get_loan( loan_id_type loan_id )const
{
   const auto* loan = find_loan( loan_id );
   MICROLEND_ASSERT( loan != nullptr, loan_not_found, "Loan ${id} not found", ("id",loan_id) );
   return *loan;
}

vector<loan_object> database::get_loans_by_borrower( const account_name_type& borrower )const
{
   vector<loan_object> result;
   const auto& idx = get_index_type<loan_index>().indices().get<by_borrower>();
   auto range = idx.equal_range( boost::make_tuple( borrower ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

share_type database::calculate_total_due( loan_id_type loan_id )const
{
   return chain::calculate_total_due( get_loan( loan_id ) );
}

} }
