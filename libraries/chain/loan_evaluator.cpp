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
#include <microlend/chain/loan_evaluator.hpp>
#include <microlend/chain/loan_object.hpp>
#include <microlend/chain/ledger_property_object.hpp>

#include <microlend/chain/access_control.hpp>
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>
#include <microlend/chain/risk.hpp>

namespace microlend { namespace chain {

void loan_create_evaluator::do_authorize( const loan_create_operation& )const
{
   verify_not_emergency_stopped( db() );
}

void_result loan_create_evaluator::do_evaluate( const loan_create_operation& op ) const
{ try {
   validate_loan_request( db(), op );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

loan_id_type loan_create_evaluator::do_apply( const loan_create_operation& op ) const
{ try {
   database& d = db();
   const auto& props = d.get_ledger_properties();
   const loan_id_type new_loan_id = props.next_loan_id;

   d.modify( props, []( ledger_property_object& p ){
      ++p.next_loan_id;
   });

   const account_name_type& borrower = caller();
   const uint32_t current_block = block_num();
   d.create<loan_object>( [&op,&borrower,new_loan_id,current_block]( loan_object& loan ){
      loan.loan_id = new_loan_id;
      loan.borrower = borrower;
      loan.amount = op.amount;
      loan.collateral_amount = op.collateral_amount;
      loan.collateral_asset = op.collateral_asset;
      loan.debt_asset = op.debt_asset;
      loan.duration_blocks = op.duration_blocks;
      loan.interest_rate_bps = op.interest_rate_bps;
      loan.status = loan_status::pending;
      loan.created_at_block = current_block;
   });

   dlog( "Loan ${id} requested by ${b}", ("id",new_loan_id)("b",borrower) );
   return new_loan_id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void loan_activate_evaluator::do_authorize( const loan_activate_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result loan_activate_evaluator::do_evaluate( const loan_activate_operation& op )
{ try {
   _loan = &db().get_loan( op.loan_id );
   MICROLEND_ASSERT( _loan->status == loan_status::pending, loan_already_active,
                     "Loan ${id} is not pending", ("id",op.loan_id) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

bool loan_activate_evaluator::do_apply( const loan_activate_operation& op ) const
{ try {
   const uint32_t current_block = block_num();
   db().modify( *_loan, [current_block]( loan_object& loan ){
      loan.status = loan_status::active;
      loan.activated_at_block = current_block;
      loan.expiration_block = uint64_t( current_block ) + loan.duration_blocks;
   });
   ilog( "Loan ${id} activated at block ${b}, expires after block ${e}",
         ("id",op.loan_id)("b",current_block)("e",_loan->expiration_block) );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result loan_repay_evaluator::do_evaluate( const loan_repay_operation& op )
{ try {
   _loan = &db().get_loan( op.loan_id );
   MICROLEND_ASSERT( _loan->borrower == caller(), not_authorized,
                     "Only the borrower may repay loan ${id}", ("id",op.loan_id) );
   MICROLEND_ASSERT( _loan->is_active(), loan_not_active,
                     "Loan ${id} is not active", ("id",op.loan_id) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

bool loan_repay_evaluator::do_apply( const loan_repay_operation& op ) const
{ try {
   database& d = db();
   const uint32_t current_block = block_num();
   d.modify( *_loan, [current_block]( loan_object& loan ){
      loan.status = loan_status::repaid;
      loan.closed_at_block = current_block;
   });
   d.record_completion( _loan->borrower );
   ilog( "Loan ${id} repaid by ${b}", ("id",op.loan_id)("b",_loan->borrower) );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // microlend::chain
