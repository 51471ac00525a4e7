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
#include <sponsor/chain/database.hpp>
#include <sponsor/chain/demurrage.hpp>
#include <sponsor/hub/memory_hub.hpp>
#include <sponsor/hub/replay.hpp>
#include <sponsor/protocol/ledger_parameters.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/program_options.hpp>

#include <iostream>

using namespace sponsor::chain;
using namespace sponsor::hub;
using namespace std;
namespace bpo = boost::program_options;

fc::log_level string_to_level(string level)
{
   fc::log_level result;
   if(level == "info")
      result = fc::log_level::info;
   else if(level == "debug")
      result = fc::log_level::debug;
   else if(level == "warn")
      result = fc::log_level::warn;
   else if(level == "error")
      result = fc::log_level::error;
   else if(level == "all")
      result = fc::log_level::all;
   else
      FC_THROW("Log level not allowed. Allowed levels are info, debug, warn, error and all.");

   return result;
}

void setup_logging(string console_level)
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::debug,
         fc::console_appender::color::green));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::warn,
         fc::console_appender::color::brown));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::error,
         fc::console_appender::color::red));
   cfg.appenders.push_back(fc::appender_config( "default", "console", fc::variant(console_appender_config, 20)));
   cfg.loggers = { fc::logger_config("default") };
   cfg.loggers.front().level = string_to_level(console_level);
   cfg.loggers.front().appenders = {"default"};
   fc::configure_logging( cfg );
}

int main( int argc, char** argv )
{
   try {
      bpo::options_description opts;
      opts.add_options()
         ("help,h", "Print this help message and exit.")
         ("script,s", bpo::value<string>(), "JSON file with the steps to replay")
         ("config,c", bpo::value<string>(), "JSON file with ledger parameters")
         ("day-zero", bpo::value<string>()->default_value("2020-10-15T00:00:00"), "Time of day zero of the hub clock")
         ("ledger-account", bpo::value<string>()->default_value("invitation-escrow"), "Name or address of the ledger's account")
         ("log-level,l", bpo::value<string>()->default_value("info"), "Console log level: debug, info, warn, error or all")
         ("strict", "Exit with an error code if any step failed");

      bpo::variables_map options;
      bpo::store( bpo::parse_command_line(argc, argv, opts), options );
      bpo::notify( options );

      if( options.count("help") || !options.count("script") )
      {
         std::cout << opts << "\n";
         return options.count("help") ? 0 : 1;
      }

      setup_logging( options.at("log-level").as<string>() );

      demurrage_calculator decay;
      memory_hub hub( decay, fc::time_point_sec::from_iso_string( options.at("day-zero").as<string>() ) );
      const address ledger_account = to_address( options.at("ledger-account").as<string>() );

      ledger_parameters params;
      params.asset_hub = hub.hub_address();
      if( options.count("config") )
      {
         const fc::path config_file( options.at("config").as<string>() );
         ilog( "Loading ledger parameters from ${f}", ("f",config_file) );
         fc::from_variant( fc::json::from_file( config_file ), params, SPONSOR_MAX_NESTED_OBJECTS );
      }

      database db( hub, hub.vault( ledger_account ), hub, decay, params );
      hub.attach_ledger( ledger_account, db );
      db.applied_operation.connect( []( const operation& vop ) {
         std::cout << fc::json::to_string( fc::variant( vop, SPONSOR_MAX_NESTED_OBJECTS ) ) << "\n";
      });

      const auto steps = fc::json::from_file( fc::path( options.at("script").as<string>() ) )
                            .as< vector<replay_step> >( SPONSOR_MAX_NESTED_OBJECTS );

      const bool strict = options.count("strict") > 0;
      replay_session session( db, hub, ledger_account, std::cout );
      const uint32_t failed = session.run( steps );
      return ( strict && failed > 0 ) ? 1 : 0;
   } catch( const fc::exception& e ) {
      std::cerr << e.to_detail_string() << "\n";
   } catch( const std::exception& e ) {
      std::cerr << e.what() << "\n";
   }
   return 1;
}
