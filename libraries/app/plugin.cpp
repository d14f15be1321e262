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
#include <curio/app/ledger_api.hpp>
#include <curio/app/plugin.hpp>

namespace curio {
   namespace app {

      plugin::plugin(ledger_api &a) : _app(a) {
      }

      std::string plugin::plugin_name() const {
         return "<unknown plugin>";
      }

      std::string plugin::plugin_description() const {
         return "<no description>";
      }

      void plugin::plugin_initialize(const boost::program_options::variables_map &options) {
         return;
      }

      void plugin::plugin_startup() {
         return;
      }

      void plugin::plugin_shutdown() {
         return;
      }

      void plugin::plugin_set_program_options(
         boost::program_options::options_description &command_line_options,
         boost::program_options::options_description &config_file_options
      ) {
         return;
      }

      chain::database &plugin::database() const {
         return *_app.chain_database();
      }
   }
} // curio::app
