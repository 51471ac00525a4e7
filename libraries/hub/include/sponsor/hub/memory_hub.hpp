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

#include <sponsor/hub/transfer_receiver.hpp>
#include <sponsor/chain/collaborators.hpp>
#include <sponsor/chain/demurrage.hpp>

#include <fc/time.hpp>

#include <map>

namespace sponsor { namespace chain { class database; } }

namespace sponsor { namespace hub {

   using chain::decay_function;

   enum avatar_kind
   {
      human_avatar       = 1,
      organization_avatar = 2
   };

   class memory_hub;

   /**
    *  Moves the personal tokens held by one account of a memory_hub, used as the ledger's vault.
    */
   class account_vault : public chain::value_mover
   {
      public:
         account_vault( memory_hub& hub, const address& account ):_hub(hub),_account(account){}

         virtual void        transfer_original( const address& to, const amount_type& amount ) override;
         virtual void        convert_and_transfer( const address& to, const amount_type& amount ) override;
         virtual amount_type held_balance( const address& token_owner )const override;

         const address& account()const { return _account; }

      private:
         memory_hub& _hub;
         address     _account;
   };

   /**
    *  @brief in memory asset hub
    *
    *  Keeps the registry of avatars, the trust graph, the demurraged balances of personal tokens and
    *  of their wrapped form, and a clock.  Every avatar issues its own personal token, identified by
    *  the avatar's address.
    */
   class memory_hub : public chain::identity_oracle, public chain::time_source
   {
      public:
         memory_hub( const decay_function& decay, fc::time_point_sec day_zero,
                     const address& self = address::from_seed( "asset-hub" ) );
         ~memory_hub();

         const address& hub_address()const { return _self; }

         /// @{ @group Avatars
         /**
          *  Registers @p avatar as a human.  With an inviter the registration consumes an invitation:
          *  @p inviter must be a human that trusts @p avatar and pays SPONSOR_INVITATION_COST_UNITS of
          *  its own token, which are burned.
          */
         void register_human( const address& avatar, const optional<address>& inviter = optional<address>() );
         void register_organization( const address& organization );

         optional<avatar_kind> find_avatar( const address& a )const;

         virtual bool is_eligible_principal( const address& a )const override;
         virtual bool is_onboarded( const address& a )const override;
         /// @}

         /// @{ @group Trust
         void trust( const address& truster, const address& trustee,
                     fc::time_point_sec expiry = fc::time_point_sec::maximum() );
         void untrust( const address& truster, const address& trustee );
         virtual bool trusts( const address& truster, const address& trustee )const override;
         /// @}

         /// @{ @group Balances
         /** mints @p amount of @p avatar's personal token to @p avatar */
         void        issue( const address& avatar, const amount_type& amount );
         amount_type balance_of( const address& holder, const address& token_id )const;
         amount_type wrapped_balance_of( const address& holder, const address& token_id )const;

         /**
          *  Moves @p amount of @p token_id from @p from to @p to, then notifies the receiver registered
          *  for @p to.  If the receiver throws, the balances are restored and the error propagates.
          */
         void safe_transfer_from( const address& operator_account, const address& from, const address& to,
                                  const address& token_id, const amount_type& amount,
                                  const vector<char>& payload = vector<char>() );
         /** converts @p amount of @p holder's @p token_id into the wrapped form */
         void wrap( const address& holder, const address& token_id, const amount_type& amount );
         void transfer_wrapped( const address& from, const address& to, const address& token_id,
                                const amount_type& amount );
         void burn( const address& holder, const address& token_id, const amount_type& amount );
         /// @}

         /// @{ @group Receivers
         void set_receiver( const address& account, transfer_receiver* receiver );
         /** routes transfers to @p account into @p db as escrow_invite_operation */
         void attach_ledger( const address& account, chain::database& db );
         /** the value_mover of @p account, owned by the hub */
         account_vault& vault( const address& account );
         /// @}

         /// @{ @group Clock
         fc::time_point_sec     now()const { return _now; }
         fc::time_point_sec     day_zero()const { return _day_zero; }
         void                   advance( uint32_t seconds );
         void                   advance_days( uint32_t days );
         virtual day_index_type today()const override;
         /// @}

      private:
         struct balance_entry
         {
            amount_type    amount;
            day_index_type anchor_day = 0;
         };
         typedef std::map< std::pair<address, address>, balance_entry > balance_map;

         amount_type current( const balance_map& balances, const address& holder, const address& token_id )const;
         void        set_current( balance_map& balances, const address& holder, const address& token_id,
                                  const amount_type& amount );
         void        debit( balance_map& balances, const address& holder, const address& token_id,
                            const amount_type& amount );
         void        credit( balance_map& balances, const address& holder, const address& token_id,
                             const amount_type& amount );

         const decay_function&                                      _decay;
         address                                                    _self;
         fc::time_point_sec                                         _day_zero;
         fc::time_point_sec                                         _now;

         std::map< address, avatar_kind >                           _avatars;
         std::map< std::pair<address, address>, fc::time_point_sec > _trust;
         balance_map                                                _balances;
         balance_map                                                _wrapped;

         std::map< address, transfer_receiver* >                    _receivers;
         std::map< address, std::unique_ptr<transfer_receiver> >    _owned_receivers;
         std::map< address, std::unique_ptr<account_vault> >        _vaults;
   };

} } // sponsor::hub

FC_REFLECT_ENUM( sponsor::hub::avatar_kind, (human_avatar)(organization_avatar) )
