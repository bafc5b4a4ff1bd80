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

BOOST_FIXTURE_TEST_SUITE( loan_tests, database_fixture )

/// List STX at $100, borrow against it, activate, let it expire and liquidate it
BOOST_AUTO_TEST_CASE( stx_loan_lifecycle )
{ try {
   BOOST_CHECK( add_collateral_asset( owner, "STX" ) );
   BOOST_CHECK( update_asset_price( owner, "STX", 100000000 ) );

   const uint32_t created_at = head_block_num;
   loan_id_type loan_id = create_loan( alice, 1000000000, 3000000000ull, "STX", 144000, 1000 );
   BOOST_CHECK_EQUAL( loan_id, 1u );

   {
      const loan_object& loan = db.get_loan( loan_id );
      BOOST_CHECK( loan.status == loan_status::pending );
      BOOST_CHECK_EQUAL( loan.borrower, alice );
      BOOST_CHECK_EQUAL( loan.amount, 1000000000u );
      BOOST_CHECK_EQUAL( loan.collateral_amount, 3000000000u );
      BOOST_CHECK_EQUAL( loan.collateral_asset, "STX" );
      BOOST_CHECK( !loan.debt_asset.valid() );
      BOOST_CHECK_EQUAL( loan.duration_blocks, 144000u );
      BOOST_CHECK_EQUAL( loan.interest_rate_bps, 1000u );
      BOOST_CHECK_EQUAL( loan.created_at_block, created_at );
      BOOST_CHECK( !loan.activated_at_block.valid() );
      BOOST_CHECK( !loan.closed_at_block.valid() );
   }

   generate_block();
   const uint32_t activated_at = head_block_num;
   BOOST_CHECK( activate_loan( owner, loan_id ) );
   {
      const loan_object& loan = db.get_loan( loan_id );
      BOOST_CHECK( loan.status == loan_status::active );
      BOOST_REQUIRE( loan.activated_at_block.valid() );
      BOOST_CHECK_EQUAL( *loan.activated_at_block, activated_at );
      BOOST_CHECK_EQUAL( loan.expiration_block, uint64_t( activated_at ) + 144000 );
   }

   generate_blocks( 144001 );
   BOOST_CHECK( liquidate_loan( owner, loan_id ) );
   {
      const loan_object& loan = db.get_loan( loan_id );
      BOOST_CHECK( loan.status == loan_status::liquidated );
      BOOST_REQUIRE( loan.closed_at_block.valid() );
      BOOST_CHECK_EQUAL( *loan.closed_at_block, head_block_num );
   }

   const reputation_object* rep = db.find_reputation( alice );
   BOOST_REQUIRE( rep != nullptr );
   BOOST_CHECK_EQUAL( rep->defaults, 1u );
   BOOST_CHECK_EQUAL( rep->reputation_score, 80 );
   BOOST_CHECK_EQUAL( rep->completed_loans, 0u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( loan_ids_are_dense )
{ try {
   list_stx();

   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 3000, "STX", 1440, 100 ), 1u );

   // Failed requests do not consume ids
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 1000, "STX", 1440, 100 ), insufficient_collateral );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 10, 100 ), invalid_duration );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "BTC", 1440, 100 ), invalid_collateral_asset );
   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_loan_id, 2u );

   BOOST_CHECK_EQUAL( create_loan( bob, 1000, 3000, "STX", 1440, 100 ), 2u );
   BOOST_CHECK_EQUAL( create_loan( alice, 5000, 10000, "STX", 1440, 100 ), 3u );

   BOOST_CHECK( db.find_loan( 0 ) == nullptr );
   BOOST_CHECK( db.find_loan( 4 ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_loan( 2 ).borrower, bob );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( collateral_ratio_boundary )
{ try {
   list_stx();

   // Exactly 200% is accepted
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 2000, "STX", 1440, 0 ), 1u );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 1999, "STX", 1440, 0 ), insufficient_collateral );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 0, "STX", 1440, 0 ), insufficient_collateral );

   BOOST_CHECK_EQUAL( create_loan( alice, 1, 2, "STX", 1440, 0 ), 2u );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000000000, 1999999999, "STX", 1440, 0 ),
                               insufficient_collateral );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( duration_and_interest_bounds )
{ try {
   list_stx();

   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1439, 100 ), invalid_duration );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 525601, 100 ), invalid_duration );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 0, 100 ), invalid_duration );
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 3000, "STX", 1440, 100 ), 1u );
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 3000, "STX", 525600, 100 ), 2u );

   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1440, 5001 ), invalid_interest_rate );
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 3000, "STX", 1440, 5000 ), 3u );
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 3000, "STX", 1440, 0 ), 4u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( loan_request_check_order )
{ try {
   BOOST_CHECK( add_collateral_asset( owner, "STX" ) );

   // Listed without a price
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1440, 100 ), invalid_collateral_asset );

   BOOST_CHECK( update_asset_price( owner, "STX", stx_price ) );

   // The asset is checked before the collateral, the collateral before the duration and the duration
   // before the interest rate
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 1, "BTC", 1, 9999 ), invalid_collateral_asset );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 1, "STX", 1, 9999 ), insufficient_collateral );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1, 9999 ), invalid_duration );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1440, 9999 ), invalid_interest_rate );

   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 0, 3000, "STX", 1440, 100 ), invalid_amount );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, MICROLEND_MAX_SHARE_SUPPLY + 1, 3000, "STX", 1440, 100 ),
                               invalid_amount );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "stx", 1440, 100 ), invalid_collateral_asset );

   BOOST_CHECK( db.find_loan( 1 ) == nullptr );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( cross_asset_collateral )
{ try {
   list_stx();
   BOOST_CHECK( add_collateral_asset( owner, "USD" ) );

   // The debt asset must be listed and priced
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1440, 100, string( "EUR" ) ),
                               invalid_collateral_asset );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 3000, "STX", 1440, 100, string( "USD" ) ),
                               invalid_collateral_asset );

   // One STX is worth 100 USD
   BOOST_CHECK( update_asset_price( owner, "USD", 1000000 ) );

   // 20 STX cover 1000 USD at 200%
   auto loan_id = create_loan( alice, 1000, 20, "STX", 1440, 100, string( "USD" ) );
   BOOST_CHECK_EQUAL( loan_id, 1u );
   BOOST_REQUIRE( db.get_loan( loan_id ).debt_asset.valid() );
   BOOST_CHECK_EQUAL( *db.get_loan( loan_id ).debt_asset, "USD" );

   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1001, 20, "STX", 1440, 100, string( "USD" ) ),
                               insufficient_collateral );

   // A debt asset equal to the collateral asset is a plain loan
   BOOST_CHECK_EQUAL( create_loan( alice, 1000, 2000, "STX", 1440, 100, string( "STX" ) ), 2u );

   // Price moves change the eligibility of new requests only
   BOOST_CHECK( update_asset_price( owner, "STX", stx_price / 2 ) );
   MICROLEND_CHECK_THROW_CODE( create_loan( alice, 1000, 20, "STX", 1440, 100, string( "USD" ) ),
                               insufficient_collateral );
   BOOST_CHECK( db.get_loan( loan_id ).status == loan_status::pending );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( activate_loan_test )
{ try {
   list_stx();
   auto loan_id = create_loan( alice, 1000, 3000, "STX", 1440, 100 );

   MICROLEND_CHECK_THROW_CODE( activate_loan( alice, loan_id ), not_authorized );
   // Authorization is checked before the loan
   MICROLEND_CHECK_THROW_CODE( activate_loan( alice, 42 ), not_authorized );
   MICROLEND_CHECK_THROW_CODE( activate_loan( owner, 42 ), loan_not_found );
   BOOST_CHECK( db.get_loan( loan_id ).status == loan_status::pending );

   BOOST_CHECK( activate_loan( owner, loan_id ) );
   BOOST_CHECK( db.get_loan( loan_id ).status == loan_status::active );

   // Only once
   generate_block();
   MICROLEND_CHECK_THROW_CODE( activate_loan( owner, loan_id ), loan_already_active );
   BOOST_CHECK_EQUAL( *db.get_loan( loan_id ).activated_at_block, head_block_num - 1 );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( terminal_loans_cannot_be_activated )
{ try {
   list_stx();
   auto repaid_id = create_loan( alice, 1000, 3000, "STX", 1440, 100 );
   auto liquidated_id = create_loan( alice, 1000, 3000, "STX", 1440, 100 );
   BOOST_CHECK( activate_loan( owner, repaid_id ) );
   BOOST_CHECK( activate_loan( owner, liquidated_id ) );
   BOOST_CHECK( repay_loan( alice, repaid_id ) );
   generate_blocks( 1441 );
   BOOST_CHECK( liquidate_loan( owner, liquidated_id ) );

   MICROLEND_CHECK_THROW_CODE( activate_loan( owner, repaid_id ), loan_already_active );
   MICROLEND_CHECK_THROW_CODE( activate_loan( owner, liquidated_id ), loan_already_active );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( get_loans_by_borrower_test )
{ try {
   list_stx();
   create_loan( alice, 1000, 3000, "STX", 1440, 100 );
   create_loan( bob, 1000, 3000, "STX", 1440, 100 );
   create_loan( alice, 2000, 6000, "STX", 1440, 100 );

   auto alice_loans = db.get_loans_by_borrower( alice );
   BOOST_REQUIRE_EQUAL( alice_loans.size(), 2u );
   BOOST_CHECK_EQUAL( alice_loans[0].loan_id, 1u );
   BOOST_CHECK_EQUAL( alice_loans[1].loan_id, 3u );

   auto bob_loans = db.get_loans_by_borrower( bob );
   BOOST_REQUIRE_EQUAL( bob_loans.size(), 1u );
   BOOST_CHECK_EQUAL( bob_loans[0].loan_id, 2u );

   BOOST_CHECK( db.get_loans_by_borrower( owner ).empty() );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_SUITE_END()
