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

#include <boost/test/unit_test.hpp>

using namespace microlend::chain;
using namespace microlend::chain::test;

BOOST_FIXTURE_TEST_SUITE( access_control_tests, database_fixture )

BOOST_AUTO_TEST_CASE( genesis_owner )
{
   BOOST_CHECK_EQUAL( db.get_ledger_owner(), owner );
   BOOST_CHECK( !db.get_contract_status() );
}

BOOST_AUTO_TEST_CASE( toggle_emergency_stop_test )
{ try {
   BOOST_CHECK( !db.get_contract_status() );

   BOOST_CHECK_EQUAL( toggle_emergency_stop( owner ), true );
   BOOST_CHECK( db.get_contract_status() );

   BOOST_CHECK_EQUAL( toggle_emergency_stop( owner ), false );
   BOOST_CHECK( !db.get_contract_status() );

   MICROLEND_CHECK_THROW_CODE( toggle_emergency_stop( alice ), not_authorized );
   BOOST_CHECK( !db.get_contract_status() );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( emergency_stop_blocks_loan_requests )
{ try {
   list_stx();
   BOOST_CHECK( toggle_emergency_stop( owner ) );

   // Rejected whatever the parameters
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000000000, 3000000000ull, "STX", 144000, 1000 ),
                               emergency_stop_active );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000000000, 1, "STX", 1, 9999 ), emergency_stop_active );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 0, 0, "nope", 0, 0 ), emergency_stop_active );
   MICROLEND_CHECK_THROW_CODE( create_loan( owner, 1000, 3000, "STX", 1440, 0 ), emergency_stop_active );
   BOOST_CHECK( db.find_loan( 1 ) == nullptr );

   // The stop can be released, the first loan still gets id 1
   BOOST_CHECK( !toggle_emergency_stop( owner ) );
   BOOST_CHECK_EQUAL( create_loan( alice, 1000000000, 3000000000ull, "STX", 144000, 1000 ), 1u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( emergency_stop_keeps_existing_loans_manageable )
{ try {
   list_stx();
   auto loan_id = create_loan( alice, 1000, 3000, "STX", 1440, 100 );
   BOOST_CHECK( toggle_emergency_stop( owner ) );

   BOOST_CHECK( activate_loan( owner, loan_id ) );
   generate_blocks( 1441 );
   BOOST_CHECK( liquidate_loan( owner, loan_id ) );
   BOOST_CHECK( db.get_loan( loan_id ).status == loan_status::liquidated );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( ownership_transfer_is_immediate )
{ try {
   BOOST_CHECK( set_ledger_owner( owner, bob ) );
   BOOST_CHECK_EQUAL( db.get_ledger_owner(), bob );

   // The previous owner lost every administrator right
   MICROLEND_CHECK_THROW_CODE( add_collateral_asset( owner, "STX" ), not_authorized );
   MICROLEND_CHECK_THROW_CODE( toggle_emergency_stop( owner ), not_authorized );
   MICROLEND_CHECK_THROW_CODE( set_ledger_owner( owner, owner ), not_authorized );

   BOOST_CHECK( add_collateral_asset( bob, "STX" ) );
   BOOST_CHECK( update_asset_price( bob, "STX", stx_price ) );
   auto loan_id = create_loan( alice, 1000, 3000, "STX", 1440, 100 );
   MICROLEND_CHECK_THROW_CODE( activate_loan( owner, loan_id ), not_authorized );
   BOOST_CHECK( activate_loan( bob, loan_id ) );

   BOOST_CHECK( set_ledger_owner( bob, owner ) );
   MICROLEND_CHECK_THROW_CODE( toggle_emergency_stop( bob ), not_authorized );
   BOOST_CHECK( toggle_emergency_stop( owner ) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( set_ledger_owner_failures )
{ try {
   MICROLEND_CHECK_THROW_CODE( set_ledger_owner( alice, alice ), not_authorized );
   MICROLEND_CHECK_THROW_CODE( set_ledger_owner( owner, "" ), invalid_parameters );
   MICROLEND_CHECK_THROW_CODE( set_ledger_owner( owner, std::string( MICROLEND_MAX_ACCOUNT_NAME_LENGTH + 1, 'a' ) ),
                               invalid_parameters );
   // Authorization is checked before the new owner
   MICROLEND_CHECK_THROW_CODE( set_ledger_owner( alice, "" ), not_authorized );

   BOOST_CHECK_EQUAL( db.get_ledger_owner(), owner );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( update_ledger_parameters_test )
{ try {
   list_stx();

   ledger_parameters params = db.get_ledger_parameters();
   BOOST_CHECK_EQUAL( params.min_collateral_ratio_bps, 20000u );
   BOOST_CHECK_EQUAL( params.min_duration_blocks, 1440u );
   BOOST_CHECK_EQUAL( params.max_duration_blocks, 525600u );
   BOOST_CHECK_EQUAL( params.max_interest_rate_bps, 5000u );
   BOOST_CHECK_EQUAL( params.default_penalty, 20 );
   BOOST_CHECK_EQUAL( params.repayment_bonus, 5 );

   // 250% is enough with the default parameters
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 2500, "STX", 1440, 100 ), 1u );

   params.min_collateral_ratio_bps = 30000;
   params.min_duration_blocks = 100;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( alice, params ), not_authorized );
   BOOST_CHECK( update_ledger_parameters( owner, params ) );
   BOOST_CHECK_EQUAL( db.get_ledger_parameters().min_collateral_ratio_bps, 30000u );

   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 2500, "STX", 1440, 100 ), insufficient_collateral );
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 3000, "STX", 100, 100 ), 2u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( update_ledger_parameters_validation )
{ try {
   const ledger_parameters defaults = db.get_ledger_parameters();

   ledger_parameters params = defaults;
   params.min_duration_blocks = params.max_duration_blocks + 1;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   params = defaults;
   params.min_collateral_ratio_bps = MICROLEND_100_PERCENT - 1;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   params = defaults;
   params.min_collateral_ratio_bps = MICROLEND_MAX_COLLATERAL_RATIO_BPS + 1;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   params = defaults;
   params.min_duration_blocks = 0;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   params = defaults;
   params.max_interest_rate_bps = MICROLEND_MAX_INTEREST_RATE_BPS_LIMIT + 1;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   params = defaults;
   params.default_penalty = 101;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   params = defaults;
   params.repayment_bonus = 101;
   MICROLEND_CHECK_THROW_CODE( update_ledger_parameters( owner, params ), invalid_parameters );

   BOOST_CHECK_EQUAL( fc::json::to_string( fc::variant( db.get_ledger_parameters(), 2 ) ),
                      fc::json::to_string( fc::variant( defaults, 2 ) ) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
