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

#include <fc/log/logger.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <utility>
#include <deque>

namespace microlend { namespace db {

   class object_database;

   /**
    * The changes recorded while one undo session was open: the state of every object before its first
    * modification, the objects created, and the next instance of every index that created an object.
    */
   struct undo_state
   {
      typedef std::pair<uint8_t,uint8_t> index_key;

      std::map<object_id_type, unique_ptr<object>> old_values;
      std::set<object_id_type>                     new_ids;
      std::map<index_key, uint64_t>                old_next_instances;
   };

   /**
    * @class undo_database
    * @brief stack of undo sessions over an object_database
    *
    * Changes are recorded only while at least one session is open. A session that goes out of scope without
    * commit() rolls back everything changed since it was started. Committing a nested session hands its
    * records to the enclosing session, committing the outermost session discards them.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& other ):_undo_db(other._undo_db),_open(other._open)
               {
                  other._open = false;
               }
               session& operator = ( session&& ) = delete;

               ~session()
               {
                  if( !_open )
                     return;
                  try {
                     _undo_db.rollback();
                  } catch( const fc::exception& e ) {
                     elog( "Rollback of an undo session failed: ${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }

               /// Keeps the changes of this session
               void commit()
               {
                  if( _open ) _undo_db.commit();
                  _open = false;
               }

               /// Reverts the changes of this session now
               void undo()
               {
                  if( _open ) _undo_db.rollback();
                  _open = false;
               }

            private:
               friend class undo_database;
               explicit session( undo_database& undo_db ):_undo_db(undo_db){}

               undo_database& _undo_db;
               bool           _open = true;
         };

         session start_undo_session();

         /// Records that obj was just created
         void on_create( const object& obj );
         /// Records the state of obj before it changes, once per session
         void on_modify( const object& obj );

         size_t active_sessions()const { return _sessions.size(); }

      private:
         void rollback();
         void commit();

         object_database&        _db;
         std::deque<undo_state>  _sessions;
         bool                    _rolling_back = false;
   };

} } // microlend::db
