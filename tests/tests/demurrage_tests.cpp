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
#include <boost/test/unit_test.hpp>

#include <sponsor/chain/demurrage.hpp>

#include "../common/ledger_fixture.hpp"

using namespace sponsor::chain;
using namespace sponsor::chain::test;

BOOST_AUTO_TEST_SUITE( demurrage_tests )

BOOST_AUTO_TEST_CASE( zero_days_keeps_the_balance )
{ try {
   demurrage_calculator decay;
   BOOST_CHECK( decay.project( ledger_fixture::units( 100 ), 0 ) == ledger_fixture::units( 100 ) );
   BOOST_CHECK( decay.project( amount_type( 1 ), 0 ) == amount_type( 1 ) );
   BOOST_CHECK( decay.project( amount_type( 0 ), 365 ) == amount_type( 0 ) );
   BOOST_CHECK( decay.factor( 0 ) == demurrage_calculator::one() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( one_day_applies_gamma )
{ try {
   demurrage_calculator decay;
   BOOST_CHECK( decay.factor( 1 ) == demurrage_calculator::factor_type( SPONSOR_DEMURRAGE_GAMMA_64X64 ) );
   // 2^64 units project exactly onto the 64.64 factor
   const amount_type two_pow_64 = amount_type( 1 ) << 64;
   BOOST_CHECK( decay.project( two_pow_64, 1 ) == amount_type( SPONSOR_DEMURRAGE_GAMMA_64X64 ) );
   BOOST_CHECK_EQUAL( decay.project( ledger_fixture::units( 100 ), 1 ).str(), "99980133200859895744" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( known_projections )
{ try {
   demurrage_calculator decay;
   const amount_type hundred = ledger_fixture::units( 100 );
   BOOST_CHECK_EQUAL( decay.project( hundred, 2 ).str(),   "99960270348616872218" );
   BOOST_CHECK_EQUAL( decay.project( hundred, 7 ).str(),   "99861015263419143194" );
   BOOST_CHECK_EQUAL( decay.project( hundred, 14 ).str(),  "99722223694408310883" );
   // first days past the precomputed table
   BOOST_CHECK_EQUAL( decay.project( hundred, 15 ).str(),  "99702412080528897317" );
   BOOST_CHECK_EQUAL( decay.project( hundred, 16 ).str(),  "99682604402583019592" );
   BOOST_CHECK_EQUAL( decay.project( hundred, 30 ).str(),  "99405709746755946019" );
   // roughly seven percent per year
   BOOST_CHECK_EQUAL( decay.project( hundred, 365 ).str(), "93004619604419026427" );
   BOOST_CHECK_EQUAL( decay.project( hundred, 730 ).str(), "86498592677626839040" );
   BOOST_CHECK_EQUAL( decay.project( ledger_fixture::units( 96 ), 365 ).str(), "89284434820242265370" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( projection_never_increases )
{ try {
   demurrage_calculator decay;
   const amount_type initial = ledger_fixture::units( 100 );
   amount_type previous = initial;
   for( uint64_t days = 0; days <= 3000; ++days )
   {
      const amount_type current = decay.project( initial, days );
      BOOST_REQUIRE( current <= previous );
      previous = current;
   }
   BOOST_CHECK( previous < initial );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( projection_is_deterministic )
{ try {
   demurrage_calculator first;
   demurrage_calculator second;
   for( uint64_t days : { 0, 1, 14, 15, 100, 1000, 100000 } )
      BOOST_CHECK( first.project( ledger_fixture::units( 97 ), days )
                   == second.project( ledger_fixture::units( 97 ), days ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( very_long_periods_reach_zero )
{ try {
   demurrage_calculator decay;
   BOOST_CHECK( decay.project( ledger_fixture::units( 100 ), 1000000 ) == amount_type( 0 ) );
   BOOST_CHECK( decay.factor( uint64_t(1) << 40 ) == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
