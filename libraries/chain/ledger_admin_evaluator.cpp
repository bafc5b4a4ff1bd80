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
#include <microlend/chain/ledger_admin_evaluator.hpp>
#include <microlend/chain/ledger_property_object.hpp>

#include <microlend/chain/access_control.hpp>
#include <microlend/chain/database.hpp>
#include <microlend/chain/exceptions.hpp>

namespace microlend { namespace chain {

void ledger_owner_update_evaluator::do_authorize( const ledger_owner_update_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result ledger_owner_update_evaluator::do_evaluate( const ledger_owner_update_operation& op ) const
{
   return void_result();
}

bool ledger_owner_update_evaluator::do_apply( const ledger_owner_update_operation& op ) const
{ try {
   database& d = db();
   d.modify( d.get_ledger_properties(), [&op]( ledger_property_object& p ){
      p.owner = op.new_owner;
   });
   ilog( "Ledger owner changed from ${old} to ${new}", ("old",caller())("new",op.new_owner) );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void emergency_stop_toggle_evaluator::do_authorize( const emergency_stop_toggle_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result emergency_stop_toggle_evaluator::do_evaluate( const emergency_stop_toggle_operation& op ) const
{
   return void_result();
}

bool emergency_stop_toggle_evaluator::do_apply( const emergency_stop_toggle_operation& op ) const
{ try {
   database& d = db();
   const auto& props = d.get_ledger_properties();
   d.modify( props, []( ledger_property_object& p ){
      p.emergency_stopped = !p.emergency_stopped;
   });
   ilog( "Emergency stop ${state} at block ${b}",
         ("state",props.emergency_stopped ? "activated" : "released")("b",block_num()) );
   return props.emergency_stopped;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void ledger_parameters_update_evaluator::do_authorize( const ledger_parameters_update_operation& )const
{
   verify_ledger_owner( db(), caller() );
}

void_result ledger_parameters_update_evaluator::do_evaluate( const ledger_parameters_update_operation& op ) const
{
   return void_result();
}

bool ledger_parameters_update_evaluator::do_apply( const ledger_parameters_update_operation& op ) const
{ try {
   database& d = db();
   d.modify( d.get_ledger_properties(), [&op]( ledger_property_object& p ){
      p.parameters = op.new_parameters;
   });
   ilog( "Ledger parameters updated: ${p}", ("p",op.new_parameters) );
   return true;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // microlend::chain
