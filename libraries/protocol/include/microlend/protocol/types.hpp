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

#include <memory>
#include <vector>
#include <deque>
#include <cstdint>
#include <string>

#include <fc/container/flat_fwd.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/container/flat.hpp>
#include <fc/string.hpp>

#include <fc/io/datastream.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/static_variant.hpp>

#include <microlend/protocol/config.hpp>

#define MICROLEND_EXTERNAL_SERIALIZATION(ext, type) \
namespace fc { \
   ext template void from_variant( const variant& v, type& vo, uint32_t max_depth ); \
   ext template void to_variant( const type& v, variant& vo, uint32_t max_depth ); \
namespace raw { \
   ext template void pack< datastream<size_t>, type >( datastream<size_t>& s, const type& tx, uint32_t _max_depth ); \
   ext template void pack< sha256::encoder, type >( sha256::encoder& s, const type& tx, uint32_t _max_depth ); \
   ext template void pack< datastream<char*>, type >( datastream<char*>& s, const type& tx, uint32_t _max_depth ); \
   ext template void unpack< datastream<const char*>, type >( datastream<const char*>& s, type& tx, uint32_t _max_depth ); \
} } // fc::raw
#define MICROLEND_DECLARE_EXTERNAL_SERIALIZATION(type) MICROLEND_EXTERNAL_SERIALIZATION(extern, type)
#define MICROLEND_IMPLEMENT_EXTERNAL_SERIALIZATION(type) MICROLEND_EXTERNAL_SERIALIZATION(/*not extern*/, type)

namespace microlend { namespace protocol {
   using std::string;
   using std::vector;
   using std::unique_ptr;
   using fc::optional;
   using fc::flat_set;
   using fc::flat_map;
   using fc::static_variant;
   using fc::variant;

   /// Identities are opaque names supplied and authenticated by the host
   typedef string   account_name_type;
   typedef string   asset_symbol_type;
   typedef uint64_t loan_id_type;
   typedef uint64_t share_type;
   typedef uint32_t block_num_type;

   enum reserved_spaces {
      relative_protocol_ids = 0,
      protocol_ids          = 1,
      implementation_ids    = 2
   };

   bool is_valid_symbol( const string& symbol );
   bool is_valid_account_name( const string& name );

} }  // microlend::protocol
