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
#include <microlend/db/object_id.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>

#define MICROLEND_DB_MAX_NESTED_OBJECTS 200

namespace microlend { namespace db {

   using std::unique_ptr;
   using fc::variant;

   /**
    *  @brief base of every record kept in the object_database
    *
    *  Concrete objects declare the index they live in through the static space_id and type_id members and are
    *  reflected with FC_REFLECT_DERIVED. The database copies an object before its first modification inside an
    *  undo session, objects therefore refer to each other by key and stay cheap to copy.
    *
    *  @note derived classes must not use multiple inheritance, the indexes static_cast between object and the
    *  concrete type.
    */
   class object
   {
      public:
         virtual ~object() = default;

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         object_id_type id;

         /// Copy used as the undo record of this object
         virtual unique_ptr<object> clone()const = 0;
         /// Overwrites this object with an undo record of the same type
         virtual void               restore_from( const object& saved ) = 0;
         virtual variant            to_variant()const = 0;
   };

   /// Implements the polymorphic copy operations of object for DerivedClass
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( static_cast<const DerivedClass&>(*this) );
         }

         void restore_from( const object& saved ) override
         {
            static_cast<DerivedClass&>(*this) = static_cast<const DerivedClass&>(saved);
         }

         variant to_variant()const override
         {
            return variant( static_cast<const DerivedClass&>(*this), MICROLEND_DB_MAX_NESTED_OBJECTS );
         }
   };

} } // microlend::db

FC_REFLECT( microlend::db::object, (id) )
