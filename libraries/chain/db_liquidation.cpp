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

#include <microlend/chain/loan_object.hpp>

namespace microlend { namespace chain {

vector<loan_object> database::get_defaulted_loans( uint32_t block_num, uint32_t limit )const
{
   MICROLEND_ASSERT( limit <= MICROLEND_MAX_QUERY_LIMIT, query_limit_exceeded,
                     "Limit ${l} exceeds ${max}", ("l",limit)("max",MICROLEND_MAX_QUERY_LIMIT) );

   vector<loan_object> result;

   // Active loans ordered by expiration, a loan is defaulted once block_num is past its expiration block
   const auto& idx = get_index_type<loan_index>().indices().get<by_expiration>();
   auto itr = idx.lower_bound( boost::make_tuple( loan_status::active ) );
   auto end = idx.lower_bound( boost::make_tuple( loan_status::active, uint64_t( block_num ) ) );
   for( ; itr != end && result.size() < limit; ++itr )
      result.push_back( *itr );
   return result;
}

void database::liquidate_loan( const loan_object& loan, uint32_t block_num )
{ try {
   FC_ASSERT( loan.is_defaulted_at( block_num ), "Loan ${id} is not defaulted", ("id",loan.loan_id) );

   modify( loan, [block_num]( loan_object& l ){
      l.status = loan_status::liquidated;
      l.closed_at_block = block_num;
   });
   record_default( loan.borrower );

   ilog( "Loan ${id} of ${b} liquidated at block ${n}", ("id",loan.loan_id)("b",loan.borrower)("n",block_num) );
} FC_CAPTURE_AND_RETHROW( (block_num) ) }

} }
