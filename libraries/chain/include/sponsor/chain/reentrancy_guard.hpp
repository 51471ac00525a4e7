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

#include <sponsor/chain/exceptions.hpp>

namespace sponsor { namespace chain {

   /**
    *  Rejects a call into the ledger while another call into the same ledger is still running.
    *  The flag is taken by a scope object and released when the scope ends, also on error.
    */
   class reentrancy_guard
   {
      public:
         class scope
         {
            public:
               explicit scope( reentrancy_guard& g ) : _guard(g)
               {
                  if( _guard._entered )
                     FC_THROW_EXCEPTION( reentrant_call, "The ledger is already processing an operation" );
                  _guard._entered = true;
               }
               ~scope() { _guard._entered = false; }

               scope( const scope& ) = delete;
               scope& operator=( const scope& ) = delete;

            private:
               reentrancy_guard& _guard;
         };

         bool entered()const { return _entered; }

      private:
         bool _entered = false;
   };

} } // sponsor::chain
