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
#include <microlend/chain/liquidation_evaluator.hpp>
#include <microlend/chain/loan_object.hpp>

#include <microlend/chain/access_control.hpp>
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>

namespace microlend { namespace chain {

void loan_liquidate_evaluator::do_authorize( const loan_liquidate_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result loan_liquidate_evaluator::do_evaluate( const loan_liquidate_operation& op )
{ try {
   _loan = &db().get_loan( op.loan_id );
   MICROLEND_ASSERT( _loan->is_defaulted_at( block_num() ), loan_not_defaulted,
                     "Loan ${id} is not defaulted at block ${b}",
                     ("id",op.loan_id)("b",block_num())("status",_loan->status)
                     ("expiration",_loan->expiration_block) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

bool loan_liquidate_evaluator::do_apply( const loan_liquidate_operation& op ) const
{ try {
   db().liquidate_loan( *_loan, block_num() );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // microlend::chain
