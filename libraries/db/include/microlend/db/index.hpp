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
#include <microlend/db/object.hpp>

#include <functional>

namespace microlend { namespace db {

   /**
    *  @class index
    *  @brief type-erased storage of all objects of one space and type
    *
    *  Instances are handed out in increasing order and never reused. Ledger objects are never deleted, the
    *  only way an object leaves an index is the rollback of the undo session that created it.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t  object_space_id()const = 0;
         virtual uint8_t  object_type_id()const = 0;

         /// The instance number the next created object receives
         virtual uint64_t next_instance()const = 0;

         virtual const object* find( const object_id_type& id )const = 0;
         virtual size_t        size()const = 0;
         virtual void          inspect_all_objects( const std::function<void(const object&)>& inspector )const = 0;

      protected:
         friend class object_database;
         friend class undo_database;

         /// Allocates the next id and lets constructor fill in the remaining fields
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;
         /// Applies m to the stored object, the caller has saved its undo record already
         virtual void          modify( const object& obj, const std::function<void(object&)>& m ) = 0;

         /// Rollback support, bypassing undo tracking
         /// @{
         virtual void          restore( const object& saved ) = 0;
         virtual void          discard( const object_id_type& id ) = 0;
         virtual void          rewind_next_instance( uint64_t instance ) = 0;
         /// @}
   };

} } // microlend::db
