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
#include <sponsor/protocol/ledger_parameters.hpp>
#include <sponsor/protocol/exceptions.hpp>

namespace sponsor { namespace protocol {

   void ledger_parameters::validate()const
   {
      SPONSOR_ASSERT( !asset_hub.is_null() && !asset_hub.is_sentinel(), invalid_parameters_exception,
                      "An asset hub address is required", ("asset_hub",asset_hub) );
      SPONSOR_ASSERT( min_escrow_amount > 0, invalid_parameters_exception,
                      "Minimum escrow amount must be positive", ("min",min_escrow_amount) );
      SPONSOR_ASSERT( min_escrow_amount <= max_escrow_amount, invalid_parameters_exception,
                      "Minimum escrow amount ${min} exceeds maximum ${max}",
                      ("min",min_escrow_amount)("max",max_escrow_amount) );
   }

} } // sponsor::protocol
