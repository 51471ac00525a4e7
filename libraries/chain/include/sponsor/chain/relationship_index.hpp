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
#include <sponsor/db/object.hpp>
#include <sponsor/db/generic_index.hpp>

namespace sponsor { namespace chain {
   using namespace sponsor::db;

   /**
    *  One link of a relationship list.  Each owner has its own singly linked list of counterparts,
    *  most recently inserted first.  The head of the list is the link stored under the sentinel
    *  value, its next field names the first counterpart; the last counterpart points back to the
    *  sentinel.
    */
   class relationship_link_object : public abstract_object<relationship_link_object, relationship_link_object_type>
   {
      public:
         /// which relationship_index this link belongs to
         uint8_t  list = 0;
         address  owner;
         address  value;
         address  next;
   };

   struct by_link;
   typedef multi_index_container<
      relationship_link_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_link>,
            composite_key< relationship_link_object,
               member< relationship_link_object, uint8_t, &relationship_link_object::list >,
               member< relationship_link_object, address, &relationship_link_object::owner >,
               member< relationship_link_object, address, &relationship_link_object::value >
            >
         >
      >
   > relationship_link_multi_index_type;

   typedef generic_index<relationship_link_object, relationship_link_multi_index_type> relationship_link_index;

   enum relationship_kind
   {
      invitees_of_inviter = 1,
      inviters_of_invitee = 2
   };

   /**
    *  @brief per owner ordered sets of counterparts stored in the object database
    *
    *  All changes go through the object database so that they are undone together with the
    *  operation that made them.
    */
   class relationship_index
   {
      public:
         relationship_index( object_database& db, relationship_kind kind ):_db(db),_kind(kind){}

         /** Links @p value as the newest counterpart of @p owner, it must not be linked already */
         void insert( const address& owner, const address& value );

         /** Unlinks @p value from @p owner, does nothing if it is not linked */
         void remove( const address& owner, const address& value );

         /** Counterparts of @p owner, most recently inserted first */
         vector<address> enumerate( const address& owner )const;

         bool   contains( const address& owner, const address& value )const;
         size_t size( const address& owner )const;

      private:
         const relationship_link_object* find_link( const address& owner, const address& value )const;

         object_database&  _db;
         relationship_kind _kind;
   };

} } // sponsor::chain

FC_REFLECT_DERIVED( sponsor::chain::relationship_link_object, (sponsor::db::object), (list)(owner)(value)(next) )
FC_REFLECT_ENUM( sponsor::chain::relationship_kind, (invitees_of_inviter)(inviters_of_invitee) )
