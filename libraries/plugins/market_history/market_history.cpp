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
#include <curio/market_history/market_history.hpp>

#include <curio/app/ledger_api.hpp>

#include <fc/log/logger.hpp>

#include <iterator>

namespace curio {
   namespace market_history {

      namespace detail {

         class market_history_impl {
         public:
            explicit market_history_impl(market_history &_plugin);

            virtual ~market_history_impl();

            void on_applied_operation(const operation_history_object &o);

            curio::chain::database &database() const {
               return _self.database();
            }

            friend class curio::market_history::market_history;

         private:
            void prune(nft_id_type token);

            market_history &_self;

            market_event_multi_index_type _events;
            uint64_t _next_sequence = 1;

            /// Maximum number of events kept per item; 0 keeps everything
            uint32_t _max_events_per_token = 0;

            boost::signals2::scoped_connection _applied_connection;
         };

         struct event_describer {
            typedef std::string result_type;

            template<typename T>
            std::string operator()( const T& )const { return fc::get_typename<T>::name(); }
         };

         market_history_impl::market_history_impl(market_history &_plugin) :
            _self(_plugin) {
         }

         market_history_impl::~market_history_impl() {
         }

         void market_history_impl::on_applied_operation(const operation_history_object &o) {
            for (const market_event &e : o.events) {
               market_event_object obj;
               obj.sequence = _next_sequence++;
               obj.timestamp = o.timestamp;
               obj.operation_sequence = o.sequence;
               obj.token = event_token(e);
               obj.event = e;

               dlog("Recording ${type} for token ${token} from operation ${op}",
                    ("type", e.visit(event_describer()))("token", obj.token)("op", o.sequence));

               // Events without an item share the null token bucket and are capped alike
               const nft_id_type token = obj.token;
               _events.insert(std::move(obj));
               prune(token);
            }
         }

         void market_history_impl::prune(nft_id_type token) {
            if (_max_events_per_token == 0)
               return;

            auto &idx = _events.get<by_token_sequence>();
            auto lower = idx.lower_bound(boost::make_tuple(token));
            auto upper = idx.upper_bound(boost::make_tuple(token));
            uint64_t count = std::distance(lower, upper);

            // Oldest events for the token come first
            while (count > _max_events_per_token) {
               lower = idx.erase(lower);
               --count;
            }
         }

      } // detail

      market_history::market_history(curio::app::ledger_api &app) :
         plugin(app),
         my(new detail::market_history_impl(*this)) {
      }

      market_history::~market_history() {}

      std::string market_history::plugin_name() const {
         return "market_history";
      }

      std::string market_history::plugin_description() const {
         return "Records the events of committed marketplace and registry operations";
      }

      void market_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cfg.add_options()
               ("market-history-max-events-per-token", boost::program_options::value<uint32_t>()->default_value(0),
                "Maximum number of events kept per item, and for events not tied to an item, oldest pruned first (0 keeps everything)")
               ;
      }

      void market_history::plugin_initialize(const boost::program_options::variables_map &options) {
         if (options.count("market-history-max-events-per-token")) {
            my->_max_events_per_token = options["market-history-max-events-per-token"].as<uint32_t>();
         }

         my->_applied_connection = database().applied_operation.connect(
            [this](const operation_history_object &o) { my->on_applied_operation(o); });
      }

      void market_history::plugin_startup() {
         ilog("market_history: plugin_startup() begin");
      }

      void market_history::plugin_shutdown() {
         ilog("market_history: plugin_shutdown() begin");
         my->_applied_connection.disconnect();
      }

      vector<market_event_object> market_history::get_events_by_token(nft_id_type token, uint32_t limit) const {
         auto guard = app().lock();
         vector<market_event_object> result;

         const auto &idx = my->_events.get<by_token_sequence>();
         auto lower = idx.lower_bound(boost::make_tuple(token));
         auto itr = idx.upper_bound(boost::make_tuple(token));
         while (itr != lower && result.size() < limit) {
            --itr;
            result.push_back(*itr);
         }

         return result;
      }

      vector<market_event_object> market_history::get_recent_events(uint32_t limit) const {
         auto guard = app().lock();
         vector<market_event_object> result;

         const auto &idx = my->_events.get<by_sequence>();
         for (auto itr = idx.rbegin(); itr != idx.rend() && result.size() < limit; ++itr)
            result.push_back(*itr);

         return result;
      }

      vector<nft_sold_event> market_history::get_sales_by_token(nft_id_type token) const {
         auto guard = app().lock();
         vector<nft_sold_event> sales;

         const auto &idx = my->_events.get<by_token_sequence>();
         auto itr = idx.lower_bound(boost::make_tuple(token));
         auto end = idx.upper_bound(boost::make_tuple(token));
         for (; itr != end; ++itr) {
            if (itr->event.which() == market_event::tag<nft_sold_event>::value)
               sales.push_back(itr->event.get<nft_sold_event>());
         }

         return sales;
      }

      uint64_t market_history::get_event_count() const {
         auto guard = app().lock();
         return my->_events.size();
      }

   }
}
