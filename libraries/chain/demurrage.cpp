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
#include <sponsor/chain/demurrage.hpp>

namespace sponsor { namespace chain {

demurrage_calculator::demurrage_calculator()
{
   _table.reserve( SPONSOR_DEMURRAGE_TABLE_DAYS );
   _table.push_back( one() );
   const factor_type gamma( SPONSOR_DEMURRAGE_GAMMA_64X64 );
   for( uint64_t day = 1; day < SPONSOR_DEMURRAGE_TABLE_DAYS; ++day )
      _table.push_back( multiply( _table.back(), gamma ) );
}

const demurrage_calculator::factor_type& demurrage_calculator::one()
{
   static const factor_type value = factor_type(1) << 64;
   return value;
}

demurrage_calculator::factor_type demurrage_calculator::multiply( const factor_type& a, const factor_type& b )
{
   return ( a * b ) >> 64;
}

demurrage_calculator::factor_type demurrage_calculator::factor( uint64_t days )const
{
   if( days < _table.size() )
      return _table[days];

   factor_type result = one();
   factor_type base( SPONSOR_DEMURRAGE_GAMMA_64X64 );
   while( days > 0 )
   {
      if( days & 1 )
         result = multiply( result, base );
      base = multiply( base, base );
      days >>= 1;
      // every further factor would round to zero
      if( result == 0 )
         break;
   }
   return result;
}

amount_type demurrage_calculator::project( const amount_type& initial, uint64_t days )const
{
   if( days == 0 || initial == 0 )
      return initial;
   const factor_type scaled = ( factor_type( initial ) * factor( days ) ) >> 64;
   return amount_type( scaled );
}

} } // sponsor::chain
