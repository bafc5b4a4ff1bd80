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

#include <microlend/chain/ledger_property_object.hpp>
#include <microlend/chain/reputation_object.hpp>

#include <algorithm>

namespace microlend { namespace chain {

const reputation_object* database::find_reputation( const account_name_type& account )const
{
   const auto& idx = get_index_type<reputation_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   if( itr == idx.end() )
      return nullptr;
   return &(*itr);
}

const reputation_object& database::get_or_create_reputation( const account_name_type& account )
{
   const auto* rep = find_reputation( account );
   if( rep != nullptr )
      return *rep;
   return create<reputation_object>( [&account]( reputation_object& r ){
      r.account = account;
      r.reputation_score = MICROLEND_REPUTATION_BASELINE;
   });
}

void database::record_default( const account_name_type& account )
{
   const uint8_t penalty = get_ledger_parameters().default_penalty;
   modify( get_or_create_reputation( account ), [penalty]( reputation_object& r ){
      ++r.defaults;
      r.reputation_score = r.reputation_score > penalty ? static_cast<uint8_t>( r.reputation_score - penalty ) : 0;
   });
}

void database::record_completion( const account_name_type& account )
{
   const uint8_t bonus = get_ledger_parameters().repayment_bonus;
   modify( get_or_create_reputation( account ), [bonus]( reputation_object& r ){
      ++r.completed_loans;
      r.reputation_score = static_cast<uint8_t>( std::min<uint32_t>( MICROLEND_MAX_REPUTATION_SCORE,
                                                                      uint32_t( r.reputation_score ) + bonus ) );
   });
}

} }
