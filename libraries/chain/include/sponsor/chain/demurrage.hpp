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

#include <sponsor/chain/types.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace sponsor { namespace chain {

   using sponsor::protocol::amount_type;

   /**
    *  Maps a balance and the number of whole days it has been held to its current value.
    *  Implementations must be deterministic, must not increase with the number of days and must
    *  return the initial value unchanged for zero days.
    */
   class decay_function
   {
      public:
         virtual ~decay_function(){}
         virtual amount_type project( const amount_type& initial, uint64_t days )const = 0;
   };

   /**
    *  Daily demurrage with factor SPONSOR_DEMURRAGE_GAMMA_64X64.  Factors are 64.64 fixed point
    *  numbers, products round down.
    */
   class demurrage_calculator : public decay_function
   {
      public:
         typedef boost::multiprecision::uint256_t factor_type;

         demurrage_calculator();

         virtual amount_type project( const amount_type& initial, uint64_t days )const override;

         /** gamma^days in 64.64 fixed point */
         factor_type factor( uint64_t days )const;

         static const factor_type& one();

      private:
         static factor_type multiply( const factor_type& a, const factor_type& b );

         vector<factor_type> _table;
   };

} } // sponsor::chain
