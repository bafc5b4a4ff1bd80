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

namespace microlend { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   reset_indexes();
}

void object_database::reset_indexes()
{
   FC_ASSERT( _undo_db.active_sessions() == 0, "Cannot reset the indexes inside an undo session" );
   _indexes.clear();
}

std::unique_ptr<index>& object_database::index_slot( uint8_t space_id, uint8_t type_id )
{
   if( _indexes.size() <= space_id )
      _indexes.resize( size_t(space_id) + 1 );
   auto& space = _indexes[space_id];
   if( space.size() <= type_id )
      space.resize( size_t(type_id) + 1 );
   return space[type_id];
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   FC_ASSERT( space_id < _indexes.size() && type_id < _indexes[space_id].size()
              && _indexes[space_id][type_id] != nullptr,
              "No index registered for ${s}.${t}", ("s",space_id)("t",type_id) );
   return *_indexes[space_id][type_id];
}

index& object_database::get_mutable_index( uint8_t space_id, uint8_t type_id )
{
   return const_cast<index&>( static_cast<const object_database&>(*this).get_index( space_id, type_id ) );
}

} } // namespace microlend::db
