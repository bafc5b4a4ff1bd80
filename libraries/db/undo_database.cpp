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
#include <microlend/db/object_database.hpp>
#include <microlend/db/undo_database.hpp>

namespace microlend { namespace db {

undo_database::session undo_database::start_undo_session()
{
   _sessions.emplace_back();
   return session( *this );
}

void undo_database::on_create( const object& obj )
{
   if( _rolling_back || _sessions.empty() )
      return;

   auto& state = _sessions.back();
   // the first object a session creates in an index carries the instance to rewind to
   state.old_next_instances.emplace( undo_state::index_key( obj.id.space(), obj.id.type() ), obj.id.instance() );
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _rolling_back || _sessions.empty() )
      return;

   auto& state = _sessions.back();
   if( state.new_ids.count( obj.id ) || state.old_values.count( obj.id ) )
      return;
   state.old_values.emplace( obj.id, obj.clone() );
}

void undo_database::rollback()
{ try {
   FC_ASSERT( !_sessions.empty(), "No undo session to roll back" );
   _rolling_back = true;

   auto& state = _sessions.back();
   for( const auto& item : state.old_values )
      _db.get_mutable_index( item.first.space(), item.first.type() ).restore( *item.second );
   for( const auto& id : state.new_ids )
      _db.get_mutable_index( id.space(), id.type() ).discard( id );
   for( const auto& item : state.old_next_instances )
      _db.get_mutable_index( item.first.first, item.first.second ).rewind_next_instance( item.second );

   _sessions.pop_back();
   _rolling_back = false;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( !_sessions.empty(), "No undo session to commit" );
   if( _sessions.size() == 1 )
   {
      _sessions.pop_back();
      return;
   }

   // the enclosing session takes over the records it does not have yet
   auto& state = _sessions.back();
   auto& parent = _sessions[_sessions.size() - 2];
   for( auto& item : state.old_values )
   {
      if( !parent.new_ids.count( item.first ) )
         parent.old_values.emplace( item.first, std::move(item.second) );
   }
   parent.new_ids.insert( state.new_ids.begin(), state.new_ids.end() );
   parent.old_next_instances.insert( state.old_next_instances.begin(), state.old_next_instances.end() );

   _sessions.pop_back();
}

} } // microlend::db
