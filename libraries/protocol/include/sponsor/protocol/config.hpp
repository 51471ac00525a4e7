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

#define SPONSOR_SYMBOL "CRC"
#define SPONSOR_ADDRESS_PREFIX "0x"
#define SPONSOR_ADDRESS_SIZE 20

#define SPONSOR_ASSET_PRECISION        uint64_t( 1000000000000000000ull )
#define SPONSOR_ASSET_PRECISION_DIGITS 18

/**
 * Bounds of a single escrowed invitation, in whole units of the inviter's personal token.
 */
#define SPONSOR_MIN_ESCROW_UNITS       96
#define SPONSOR_MAX_ESCROW_UNITS       100

/** Amount the hub burns from an inviter when an invited avatar registers */
#define SPONSOR_INVITATION_COST_UNITS  96

#define SPONSOR_SECONDS_PER_DAY        (60*60*24)

/**
 * Daily demurrage factor gamma = 0.99980133200859895743..., stored as an unsigned
 * 64.64 fixed point number.  One year of 365 days keeps (1 - 0.07) of the balance.
 */
#define SPONSOR_DEMURRAGE_GAMMA_64X64  uint64_t( 18443079296116538654ull )
/** Number of daily factors the demurrage calculator precomputes */
#define SPONSOR_DEMURRAGE_TABLE_DAYS   15

/** Encoded counterpart payload: a 20 byte address left padded with zeros to one 32 byte word */
#define SPONSOR_COUNTERPART_PAYLOAD_SIZE 32

#define SPONSOR_MAX_NESTED_OBJECTS (200)
