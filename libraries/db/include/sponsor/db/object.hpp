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
#include <sponsor/protocol/object_id.hpp>

#define SPONSOR_DB_MAX_NESTED_OBJECTS (200)

#include <fc/reflect/variant.hpp>
#include <fc/variant.hpp>

#include <memory>

namespace sponsor { namespace db {

   using std::unique_ptr;

   /**
    *  @brief base for all ledger objects
    *
    *  Objects are assigned a unique and sequential object ID by the database within the type
    *  defined in the object.
    *
    *  All objects must be reflected via FC_REFLECT() and must be copy-constructable and assignable.
    *  Objects should only refer to other objects by ID or by address.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         static const uint8_t type_id = 0;

         object_id_type id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual fc::variant        to_variant()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Use the Curiously Recurring Template Pattern to automatically add the ability to
    *  clone and move objects polymorphically.
    */
   template<typename DerivedClass, uint8_t TypeID>
   class abstract_object : public object
   {
      public:
         static const uint8_t type_id = TypeID;

         virtual unique_ptr<object> clone()const
         {
            return unique_ptr<object>(new DerivedClass( *static_cast<const DerivedClass*>(this) ));
         }

         virtual void move_from( object& obj )
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         virtual fc::variant to_variant()const
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), SPONSOR_DB_MAX_NESTED_OBJECTS );
         }
   };

   template<typename DerivedClass, uint8_t TypeID>
   const uint8_t abstract_object<DerivedClass,TypeID>::type_id;

} } // sponsor::db

FC_REFLECT( sponsor::db::object, (id) )
