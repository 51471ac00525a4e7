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

#include <sponsor/protocol/types.hpp>
#include <sponsor/protocol/address.hpp>

namespace sponsor { namespace protocol {

   /**
    *  Run-time configuration of an escrow ledger.  Defaults come from config.hpp; deployments may
    *  override them, e.g. from a JSON file.
    */
   struct ledger_parameters
   {
      /// the only component allowed to deliver escrow transfer notifications
      address     asset_hub;
      amount_type min_escrow_amount = amount_type( SPONSOR_MIN_ESCROW_UNITS ) * SPONSOR_ASSET_PRECISION;
      amount_type max_escrow_amount = amount_type( SPONSOR_MAX_ESCROW_UNITS ) * SPONSOR_ASSET_PRECISION;

      void validate()const;
   };

} } // sponsor::protocol

FC_REFLECT( sponsor::protocol::ledger_parameters, (asset_hub)(min_escrow_amount)(max_escrow_amount) )
