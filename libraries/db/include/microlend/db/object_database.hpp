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
#pragma once
#include <microlend/db/index.hpp>
#include <microlend/db/undo_database.hpp>

#include <fc/exception/exception.hpp>

#include <memory>
#include <type_traits>
#include <vector>

namespace microlend { namespace db {

   /**
    *   @class object_database
    *   @brief in-memory object store whose changes can be rolled back
    *
    *   Objects are created and modified only through create() and modify(), which report every change to the
    *   undo database. Reads go through the typed indexes returned by get_index_type().
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         /// Drops every index, add_index() has to be called again for each type
         void reset_indexes();

         template<typename IndexType>
         IndexType& add_index()
         {
            const uint8_t space_id = IndexType::object_type::space_id;
            const uint8_t type_id = IndexType::object_type::type_id;
            auto& slot = index_slot( space_id, type_id );
            FC_ASSERT( !slot, "Index ${s}.${t} already exists", ("s",space_id)("t",type_id) );
            slot = std::make_unique<IndexType>();
            return static_cast<IndexType&>( *slot );
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            typedef typename IndexType::object_type object_type;
            return static_cast<const IndexType&>( get_index( object_type::space_id, object_type::type_id ) );
         }

         const index& get_index( uint8_t space_id, uint8_t type_id )const;

         template<typename T, typename Constructor>
         const T& create( Constructor&& constructor )
         {
            const object& created = get_mutable_index( T::space_id, T::type_id ).create( [&constructor]( object& o ){
               constructor( static_cast<T&>(o) );
            });
            _undo_db.on_create( created );
            return static_cast<const T&>( created );
         }

         /// Saves the undo record of obj, then applies m to it
         template<typename T, typename Modifier>
         void modify( const T& obj, const Modifier& m )
         {
            _undo_db.on_modify( obj );
            get_mutable_index( T::space_id, T::type_id ).modify( obj, [&m]( object& o ){
               m( static_cast<T&>(o) );
            });
         }

         /** public for testing purposes only... should be private in practice. */
         undo_database _undo_db;

      private:
         friend class undo_database;

         index& get_mutable_index( uint8_t space_id, uint8_t type_id );
         std::unique_ptr<index>& index_slot( uint8_t space_id, uint8_t type_id );

         /// Indexes by space, then by type
         std::vector< std::vector< std::unique_ptr<index> > > _indexes;
   };

} } // microlend::db
