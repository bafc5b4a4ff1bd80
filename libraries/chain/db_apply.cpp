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
#include <microlend/chain/evaluator.hpp>
#include <microlend/chain/exceptions.hpp>
#include <microlend/chain/transaction_evaluation_state.hpp>

namespace microlend { namespace chain {

operation_result database::push_operation( const operation& op, const account_name_type& caller,
                                           uint32_t block_num )
{
   dlog( "Applying operation ${op} from ${c} at block ${b}", ("op",op)("c",caller)("b",block_num) );
   try {
      auto session = _undo_db.start_undo_session();
      transaction_evaluation_state eval_state( this, caller, block_num );
      auto result = apply_operation( eval_state, op );
      session.commit();
      return result;
   }
   catch( const fc::exception& e )
   {
      wlog( "Rejected operation ${op} from ${c} at block ${b}: ${e}",
            ("op",op)("c",caller)("b",block_num)("e",e.to_string()) );
      throw;
   }
}

operation_result database::validate_operation( const operation& op, const account_name_type& caller,
                                               uint32_t block_num )
{ try {
   auto session = _undo_db.start_undo_session();
   transaction_evaluation_state eval_state( this, caller, block_num );
   auto result = apply_operation( eval_state, op );
   session.undo();
   return result;
} FC_CAPTURE_AND_RETHROW( (op)(caller)(block_num) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   auto result = eval->evaluate( eval_state, op, true );
   eval_state.operation_results.push_back( result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
