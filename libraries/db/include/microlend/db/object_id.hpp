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
#include <fc/exception/exception.hpp>
#include <fc/string.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <string>

namespace microlend { namespace db {

   /**
    *  Identifies an object in the object_database.
    *
    *  The id space and the object type select the index that stores the object, the instance numbers the
    *  objects of that index in creation order. All three parts are packed into one 64 bit key: space in the
    *  top byte, type in the next byte, instance in the low 48 bits.
    */
   class object_id_type
   {
      public:
         static constexpr unsigned instance_width = 48;
         static constexpr uint64_t instance_limit = ( uint64_t(1) << instance_width ) - 1;

         object_id_type() = default;
         object_id_type( uint8_t space_id, uint8_t type_id, uint64_t instance_num )
         {
            FC_ASSERT( instance_num <= instance_limit, "Object instance ${i} does not fit into an id",
                       ("i",instance_num) );
            _key = ( uint64_t(space_id) << 56 ) | ( uint64_t(type_id) << instance_width ) | instance_num;
         }

         uint8_t  space()const    { return uint8_t( _key >> 56 ); }
         uint8_t  type()const     { return uint8_t( _key >> instance_width ); }
         uint64_t instance()const { return _key & instance_limit; }
         uint64_t key()const      { return _key; }

         bool operator == ( const object_id_type& other )const { return _key == other._key; }
         bool operator != ( const object_id_type& other )const { return _key != other._key; }
         bool operator <  ( const object_id_type& other )const { return _key < other._key; }

         /// Formats the id as space.type.instance
         std::string to_string()const
         {
            return fc::to_string( space() ) + "." + fc::to_string( type() ) + "." + fc::to_string( instance() );
         }

      private:
         uint64_t _key = 0;
   };

   class object;
   class object_database;

} } // microlend::db

namespace fc {

   /// Ids are written as space.type.instance, the ledger never reads them back from a variant
   inline void to_variant( const microlend::db::object_id_type& id, fc::variant& v, uint32_t max_depth = 1 )
   {
      v = id.to_string();
   }

} // namespace fc
