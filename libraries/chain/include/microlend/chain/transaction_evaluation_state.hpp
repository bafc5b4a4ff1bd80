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
#include <microlend/protocol/operations.hpp>

namespace microlend { namespace chain {
   class database;

   /**
    *  Holds the inputs supplied by the host for one call: the authenticated caller and the
    *  current block height. Both are trusted and constant while the operation is evaluated.
    */
   class transaction_evaluation_state
   {
      public:
         transaction_evaluation_state( database* db, const account_name_type& caller, uint32_t block_num )
         :_db(db),_caller(caller),_block_num(block_num){}

         database& db()const { FC_ASSERT( _db != nullptr ); return *_db; }
         const account_name_type& caller()const { return _caller; }
         uint32_t block_num()const { return _block_num; }

         vector<operation_result> operation_results;

      private:
         database*                        _db = nullptr;
         account_name_type                _caller;
         uint32_t                         _block_num = 0;
   };
} } // namespace microlend::chain
