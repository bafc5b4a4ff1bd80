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
#include "../common/database_fixture.hpp"

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>

#include <boost/test/unit_test.hpp>

#include <fstream>

using namespace microlend::chain;
using namespace microlend::chain::test;

namespace {

const char* test_genesis_json = R"({
   "initial_owner": "treasury",
   "initial_parameters": {
      "min_collateral_ratio_bps": 15000,
      "min_duration_blocks": 100,
      "max_duration_blocks": 1000,
      "max_interest_rate_bps": 2500,
      "default_penalty": 10,
      "repayment_bonus": 2
   },
   "initial_collateral_assets": [
      { "symbol": "STX", "price": 100000000 },
      { "symbol": "BTC", "price": 0 }
   ]
})";

}

BOOST_FIXTURE_TEST_SUITE( genesis_tests, database_fixture )

BOOST_AUTO_TEST_CASE( genesis_from_json )
{ try {
   genesis_state_type genesis = genesis_state_type::from_json( test_genesis_json );
   BOOST_CHECK_EQUAL( genesis.initial_owner, "treasury" );
   BOOST_CHECK_EQUAL( genesis.initial_parameters.min_collateral_ratio_bps, 15000u );
   BOOST_CHECK_EQUAL( genesis.initial_parameters.max_duration_blocks, 1000u );
   BOOST_REQUIRE_EQUAL( genesis.initial_collateral_assets.size(), 2u );
   BOOST_CHECK_EQUAL( genesis.initial_collateral_assets[0].symbol, "STX" );
   BOOST_CHECK_EQUAL( genesis.initial_collateral_assets[0].price, 100000000u );

   database ledger;
   ledger.init_genesis( genesis );

   BOOST_CHECK_EQUAL( ledger.get_ledger_owner(), "treasury" );
   BOOST_CHECK_EQUAL( ledger.get_ledger_parameters().default_penalty, 10 );
   BOOST_CHECK( !ledger.get_contract_status() );
   BOOST_CHECK_EQUAL( ledger.get_ledger_properties().next_loan_id, 1u );
   BOOST_CHECK_EQUAL( ledger.get_collateral_asset( "STX" ).price, 100000000u );
   BOOST_CHECK( ledger.get_collateral_asset( "BTC" ).listed );
   BOOST_CHECK( !ledger.get_collateral_asset( "BTC" ).is_priced() );

   // The genesis parameters apply: 150% is enough, 100 blocks is long enough
   loan_create_operation op = make_loan_create_op( 1000, 1500, "STX", 100, 2500 );
   BOOST_CHECK_EQUAL( ledger.push_operation( op, alice, 1 ).get<uint64_t>(), 1u );
   op.duration_blocks = 1001;
   MICROLEND_CHECK_THROW_CODE( ledger.push_operation( op, alice, 1 ), invalid_duration );

   // An asset listed without a price cannot be used yet
   op = make_loan_create_op( 1000, 1500, "BTC", 100, 2500 );
   MICROLEND_CHECK_THROW_CODE( ledger.push_operation( op, alice, 1 ), invalid_collateral_asset );

   emergency_stop_toggle_operation stop;
   MICROLEND_CHECK_THROW_CODE( ledger.push_operation( stop, owner, 1 ), not_authorized );
   BOOST_CHECK( ledger.push_operation( stop, "treasury", 1 ).get<bool>() );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( genesis_from_file )
{ try {
   fc::temp_directory dir( fc::temp_directory_path() );
   const fc::path genesis_file = dir.path() / "genesis.json";
   {
      std::ofstream out( genesis_file.string() );
      out << test_genesis_json;
   }

   genesis_state_type genesis = genesis_state_type::from_file( genesis_file );
   BOOST_CHECK_EQUAL( genesis.initial_owner, "treasury" );
   BOOST_CHECK_EQUAL( genesis.initial_collateral_assets.size(), 2u );

   BOOST_CHECK_THROW( genesis_state_type::from_file( dir.path() / "missing.json" ), fc::exception );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( genesis_defaults )
{ try {
   genesis_state_type genesis = genesis_state_type::from_json( "{}" );
   BOOST_CHECK_EQUAL( genesis.initial_owner, MICROLEND_DEFAULT_LEDGER_OWNER );
   BOOST_CHECK_EQUAL( genesis.initial_parameters.min_collateral_ratio_bps, 20000u );
   BOOST_CHECK( genesis.initial_collateral_assets.empty() );
   genesis.validate();
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( genesis_applies_once )
{ try {
   MICROLEND_CHECK_THROW_CODE( db.init_genesis( genesis_state ), genesis_already_applied );
   BOOST_CHECK_EQUAL( db.get_ledger_owner(), owner );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( invalid_genesis )
{ try {
   genesis_state_type genesis;

   genesis.initial_owner = "";
   MICROLEND_CHECK_THROW_CODE( genesis.validate(), invalid_genesis_state );

   genesis = genesis_state_type();
   genesis.initial_parameters.min_duration_blocks = 0;
   MICROLEND_CHECK_THROW_CODE( genesis.validate(), invalid_genesis_state );

   genesis = genesis_state_type();
   genesis.initial_collateral_assets.push_back( { "STX", 1 } );
   genesis.initial_collateral_assets.push_back( { "STX", 2 } );
   MICROLEND_CHECK_THROW_CODE( genesis.validate(), invalid_genesis_state );

   genesis = genesis_state_type();
   genesis.initial_collateral_assets.push_back( { "stx", 1 } );
   MICROLEND_CHECK_THROW_CODE( genesis.validate(), invalid_genesis_state );

   // Nothing is created from an invalid genesis state
   database ledger;
   MICROLEND_CHECK_THROW_CODE( ledger.init_genesis( genesis ), invalid_genesis_state );
   BOOST_CHECK_EQUAL( ledger.get_index_type<collateral_asset_index>().size(), 0u );
   BOOST_CHECK_THROW( ledger.get_ledger_properties(), fc::exception );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( operation_serialization )
{ try {
   operation op = make_loan_create_op( 1000000000, 3000000000ull, "STX", 144000, 1000, string( "USD" ) );

   fc::variant v( op, MICROLEND_MAX_NESTED_OBJECTS );
   operation from_json;
   fc::from_variant( v, from_json, MICROLEND_MAX_NESTED_OBJECTS );
   BOOST_REQUIRE( from_json.is_type<loan_create_operation>() );
   const auto& create = from_json.get<loan_create_operation>();
   BOOST_CHECK_EQUAL( create.amount, 1000000000u );
   BOOST_CHECK_EQUAL( create.collateral_amount, 3000000000u );
   BOOST_CHECK_EQUAL( create.collateral_asset, "STX" );
   BOOST_REQUIRE( create.debt_asset.valid() );
   BOOST_CHECK_EQUAL( *create.debt_asset, "USD" );
   BOOST_CHECK_EQUAL( create.duration_blocks, 144000u );
   BOOST_CHECK_EQUAL( create.interest_rate_bps, 1000u );

   auto packed = fc::raw::pack( op );
   operation unpacked = fc::raw::unpack<operation>( packed );
   BOOST_CHECK_EQUAL( unpacked.which(), operation::tag<loan_create_operation>::value );
   BOOST_CHECK( fc::raw::pack( unpacked ) == packed );

   // Pushing the decoded operation behaves like the original
   list_stx();
   BOOST_CHECK( add_collateral_asset( owner, "USD" ) );
   BOOST_CHECK( update_asset_price( owner, "USD", 1000000 ) );
   BOOST_CHECK_EQUAL( push( unpacked, alice ).get<uint64_t>(), 1u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
