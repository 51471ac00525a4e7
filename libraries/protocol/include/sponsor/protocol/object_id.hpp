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
#include <fc/reflect/reflect.hpp>
#include <fc/string.hpp>

namespace sponsor { namespace db {

   /**
    *  Identifies an object stored in the object database.  The top byte holds the type of the
    *  object, the remaining bits its sequential instance number within that type.
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 56;
      static constexpr uint64_t max_instance  = 0x00ffffffffffffff;

      object_id_type() = default;
      object_id_type( uint8_t t, uint64_t i ){ reset( t, i ); }

      void reset( uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> instance_bits == 0, "instance overflow", ("instance",i) );
         number = ( uint64_t(t) << instance_bits ) | i;
      }

      uint8_t  type()const     { return number >> instance_bits; }
      uint64_t instance()const { return number & max_instance; }
      bool     is_null()const  { return 0 == number; }
      explicit operator uint64_t()const { return number; }

      friend bool  operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool  operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool  operator < ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool  operator > ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      object_id_type& operator++() { reset( type(), instance() + 1 ); return *this; }

      explicit operator std::string() const
      {
         return fc::to_string(uint64_t(type())) + "." + fc::to_string(instance());
      }

      uint64_t number = 0;
   };

} } // sponsor::db

namespace fc
{
   class variant;
   void to_variant( const sponsor::db::object_id_type& var,  fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var,  sponsor::db::object_id_type& vo, uint32_t max_depth = 1 );
}

FC_REFLECT( sponsor::db::object_id_type, (number) )
