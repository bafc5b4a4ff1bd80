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

#include <fc/exception/exception.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace microlend { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id{};

   /**
    *  Stores the objects of one type in a boost::multi_index_container. The container must have an
    *  ordered_unique index on object::id tagged by_id as its first index, further indexes serve the queries
    *  of the chain.
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType     object_type;

         uint8_t  object_space_id()const override { return object_type::space_id; }
         uint8_t  object_type_id()const override  { return object_type::type_id; }
         uint64_t next_instance()const override   { return _next_instance; }

         const object* find( const object_id_type& id )const override
         {
            const auto& by_ids = _indices.template get<by_id>();
            auto itr = by_ids.find( id );
            return itr == by_ids.end() ? nullptr : &*itr;
         }

         size_t size()const override { return _indices.size(); }

         void inspect_all_objects( const std::function<void(const object&)>& inspector )const override
         {
            for( const auto& o : _indices.template get<by_id>() )
               inspector( o );
         }

         const index_type& indices()const { return _indices; }

      protected:
         const object& create( const std::function<void(object&)>& constructor ) override
         {
            ObjectType item;
            item.id = object_id_type( object_type::space_id, object_type::type_id, _next_instance );
            constructor( item );
            const object_id_type new_id = item.id;
            auto result = _indices.insert( std::move(item) );
            FC_ASSERT( result.second, "Object ${id} violates a uniqueness constraint of its index",
                       ("id",new_id.to_string()) );
            ++_next_instance;
            return *result.first;
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            const auto& stored = static_cast<const ObjectType&>( obj );
            bool ok = _indices.modify( _indices.iterator_to( stored ), [&m]( ObjectType& o ){ m( o ); } );
            FC_ASSERT( ok, "Modification of ${id} violates a uniqueness constraint of its index",
                       ("id",obj.id.to_string()) );
         }

         void restore( const object& saved ) override
         {
            auto& by_ids = _indices.template get<by_id>();
            auto itr = by_ids.find( saved.id );
            FC_ASSERT( itr != by_ids.end(), "Cannot restore ${id}, it is not stored", ("id",saved.id.to_string()) );
            bool ok = by_ids.modify( itr, [&saved]( ObjectType& o ){ o.restore_from( saved ); } );
            FC_ASSERT( ok, "Cannot restore ${id}, it conflicts with another object", ("id",saved.id.to_string()) );
         }

         void discard( const object_id_type& id ) override
         {
            _indices.template get<by_id>().erase( id );
         }

         void rewind_next_instance( uint64_t instance ) override { _next_instance = instance; }

      private:
         uint64_t   _next_instance = 0;
         index_type _indices;
   };

} } // microlend::db
