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
#include "database_fixture.hpp"

#include <fc/log/logger.hpp>

namespace microlend { namespace chain { namespace test {

database_fixture::database_fixture()
   : genesis_state( make_genesis( "admin" ) )
{ try {
   db.init_genesis( genesis_state );
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   // Every operation must have closed its undo session
   BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 0u );
}

genesis_state_type database_fixture::make_genesis( const account_name_type& initial_owner )
{
   genesis_state_type genesis;
   genesis.initial_owner = initial_owner;
   return genesis;
}

void database_fixture::generate_block()
{
   ++head_block_num;
}

void database_fixture::generate_blocks( uint32_t count )
{
   head_block_num += count;
}

operation_result database_fixture::push( const operation& op, const account_name_type& caller )
{
   return db.push_operation( op, caller, head_block_num );
}

std::string database_fixture::ledger_snapshot()const
{
   fc::variants result;
   auto collect = [&result]( const microlend::db::index& idx ){
      result.push_back( fc::variant( idx.next_instance() ) );
      idx.inspect_all_objects( [&result]( const object& o ){ result.push_back( o.to_variant() ); } );
   };
   collect( db.get_index_type<ledger_property_index>() );
   collect( db.get_index_type<collateral_asset_index>() );
   collect( db.get_index_type<loan_index>() );
   collect( db.get_index_type<reputation_index>() );
   return fc::json::to_string( fc::variant( result ) );
}

bool database_fixture::add_collateral_asset( const account_name_type& caller, const string& symbol )
{
   collateral_asset_add_operation op;
   op.symbol = symbol;
   return push( op, caller ).get<bool>();
}

bool database_fixture::update_asset_price( const account_name_type& caller, const string& symbol, share_type price )
{
   collateral_asset_update_price_operation op;
   op.symbol = symbol;
   op.price = price;
   return push( op, caller ).get<bool>();
}

loan_create_operation database_fixture::make_loan_create_op( share_type amount, share_type collateral_amount,
                                                             const string& collateral_asset,
                                                             uint32_t duration_blocks, uint32_t interest_rate_bps,
                                                             const optional<string>& debt_asset )
{
   loan_create_operation op;
   op.amount = amount;
   op.collateral_amount = collateral_amount;
   op.collateral_asset = collateral_asset;
   op.debt_asset = debt_asset;
   op.duration_blocks = duration_blocks;
   op.interest_rate_bps = interest_rate_bps;
   return op;
}

loan_id_type database_fixture::create_loan( const account_name_type& borrower, share_type amount,
                                            share_type collateral_amount, const string& collateral_asset,
                                            uint32_t duration_blocks, uint32_t interest_rate_bps,
                                            const optional<string>& debt_asset )
{
   auto op = make_loan_create_op( amount, collateral_amount, collateral_asset, duration_blocks,
                                  interest_rate_bps, debt_asset );
   return push( op, borrower ).get<uint64_t>();
}

bool database_fixture::activate_loan( const account_name_type& caller, loan_id_type loan_id )
{
   loan_activate_operation op;
   op.loan_id = loan_id;
   return push( op, caller ).get<bool>();
}

bool database_fixture::liquidate_loan( const account_name_type& caller, loan_id_type loan_id )
{
   loan_liquidate_operation op;
   op.loan_id = loan_id;
   return push( op, caller ).get<bool>();
}

bool database_fixture::repay_loan( const account_name_type& caller, loan_id_type loan_id )
{
   loan_repay_operation op;
   op.loan_id = loan_id;
   return push( op, caller ).get<bool>();
}

bool database_fixture::toggle_emergency_stop( const account_name_type& caller )
{
   return push( emergency_stop_toggle_operation(), caller ).get<bool>();
}

bool database_fixture::set_ledger_owner( const account_name_type& caller, const account_name_type& new_owner )
{
   ledger_owner_update_operation op;
   op.new_owner = new_owner;
   return push( op, caller ).get<bool>();
}

bool database_fixture::update_ledger_parameters( const account_name_type& caller,
                                                 const ledger_parameters& new_parameters )
{
   ledger_parameters_update_operation op;
   op.new_parameters = new_parameters;
   return push( op, caller ).get<bool>();
}

void database_fixture::list_stx()
{
   BOOST_REQUIRE( add_collateral_asset( owner, "STX" ) );
   BOOST_REQUIRE( update_asset_price( owner, "STX", stx_price ) );
}

} } } // microlend::chain::test
