/*
 * Copyright (c) 2023 Michel Santos and contributors.
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

#include <curio/app/plugin.hpp>
#include <curio/chain/database.hpp>

#include <curio/protocol/events.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

#include <memory>

namespace curio { namespace market_history {
using namespace chain;

/**
 * @brief One event emitted by a committed operation
 */
struct market_event_object
{
   /// Position of the event across the whole history, starting at 1
   uint64_t           sequence = 0;
   fc::time_point_sec timestamp;
   /// Sequence of the operation that emitted the event
   uint64_t           operation_sequence = 0;
   /// Item the event is about, null for events that are not about a single item
   nft_id_type        token;
   market_event       event;
};

struct by_sequence;
struct by_token_sequence;
typedef boost::multi_index_container<
   market_event_object,
   boost::multi_index::indexed_by<
      boost::multi_index::ordered_unique< boost::multi_index::tag<by_sequence>,
         boost::multi_index::member< market_event_object, uint64_t, &market_event_object::sequence > >,
      boost::multi_index::ordered_unique< boost::multi_index::tag<by_token_sequence>,
         boost::multi_index::composite_key< market_event_object,
            boost::multi_index::member< market_event_object, nft_id_type, &market_event_object::token >,
            boost::multi_index::member< market_event_object, uint64_t, &market_event_object::sequence >
         >
      >
   >
> market_event_multi_index_type;

namespace detail
{
    class market_history_impl;
}

class market_history : public curio::app::plugin
{
   public:
      explicit market_history(curio::app::ledger_api& app);
      ~market_history() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize(const boost::program_options::variables_map& options) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /**
       * @brief Get the events about an item
       * @param token Token ID
       * @param limit Maximum number of events to return
       * @return Events, newest first
       */
      vector<market_event_object> get_events_by_token(nft_id_type token, uint32_t limit = 100) const;

      /**
       * @brief Get the most recent events
       * @param limit Maximum number of events to return
       * @return Events, newest first
       */
      vector<market_event_object> get_recent_events(uint32_t limit = 100) const;

      /**
       * @brief Get every recorded sale of an item
       * @param token Token ID
       * @return Sales, oldest first
       */
      vector<nft_sold_event> get_sales_by_token(nft_id_type token) const;

      /// Number of events currently recorded
      uint64_t get_event_count() const;

   private:
      friend class detail::market_history_impl;
      std::unique_ptr<detail::market_history_impl> my;
};

} } // curio::market_history

FC_REFLECT( curio::market_history::market_event_object, (sequence)(timestamp)(operation_sequence)(token)(event) )
