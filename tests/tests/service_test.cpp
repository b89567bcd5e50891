#include <boost/test/unit_test.hpp>

#include <whale/ledger/map/map_ledger.hpp>
#include <whale/log.hpp>
#include <whale/registry/exceptions.hpp>
#include <whale/registry/snapshot.hpp>
#include <whale/service/exceptions.hpp>
#include <whale/service/registry_service.hpp>
#include <whale/util/random.hpp>

#include <whale/tests/registry_fixture.hpp>

#include <fstream>

using namespace whale;
using namespace std::chrono_literals;
using whale::tests::make_address;

struct service_fixture
{
   service_fixture() :
      minter( make_address( "0x00000000000000000000000000000000000000aa" ) ),
      abcd( make_address( "0x000000000000000000000000000000000000abcd" ) ),
      ef01( make_address( "0x000000000000000000000000000000000000ef01" ) )
   {
      initialize_logging( "whale_test", {}, "info", {}, false, false );

      temp = std::filesystem::temp_directory_path() / util::random_alphanumeric( 8 );
      std::filesystem::create_directory( temp );

      options.state_directory = temp / "state";
      options.minter = minter;
   }

   ~service_fixture()
   {
      boost::log::core::get()->remove_all_sinks();
      std::filesystem::remove_all( temp );
   }

   registry::registry_state restore()
   {
      ledger::map::map_ledger l;
      registry::registry_state state;
      state.next_token_id = registry::read_snapshot( options.state_directory / service::registry_service::snapshot_file_name, l );
      state.tokens = l.tokens();
      return state;
   }

   address                  minter;
   address                  abcd;
   address                  ef01;
   std::filesystem::path    temp;
   service::service_options options;
};

BOOST_FIXTURE_TEST_SUITE( service_tests, service_fixture )

BOOST_AUTO_TEST_CASE( parse_arguments_test )
{ try {
   BOOST_TEST_MESSAGE( "Malformed arguments are rejected as invalid arguments" );

   BOOST_CHECK( service::parse_address( "mint", "0x000000000000000000000000000000000000ABCD" ) == abcd );
   BOOST_REQUIRE_THROW( service::parse_address( "mint", "0x1234" ), service::invalid_argument );

   BOOST_CHECK_EQUAL( service::parse_amount( "whale-threshold", "1000000" ), 1'000'000 );
   BOOST_REQUIRE_THROW( service::parse_amount( "whale-threshold", "lots" ), service::invalid_argument );

   try
   {
      service::parse_address( "token-contract", "nope" );
      BOOST_FAIL( "expected invalid_argument" );
   }
   catch ( const service::invalid_argument& e )
   {
      BOOST_CHECK( std::string( e.what() ).find( "invalid token-contract" ) == 0 );
   }
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( mint_requests_persist_test )
{ try {
   BOOST_TEST_MESSAGE( "Each successful mint is persisted as it happens" );

   options.mint_requests = { abcd, address::zero(), ef01 };
   service::registry_service first( options );

   auto results = first.process_mint_requests();
   BOOST_REQUIRE_EQUAL( results.size(), 3 );
   BOOST_REQUIRE( results[0].id );
   BOOST_CHECK_EQUAL( *results[0].id, 0 );
   BOOST_CHECK( !results[1].id );
   BOOST_CHECK( results[1].recipient.is_zero() );
   BOOST_REQUIRE( results[2].id );
   BOOST_CHECK_EQUAL( *results[2].id, 1 );

   auto state = restore();
   BOOST_CHECK_EQUAL( state.next_token_id, 2 );
   BOOST_REQUIRE_EQUAL( state.tokens.size(), 2 );
   BOOST_CHECK( state.tokens[0].owner == abcd );
   BOOST_CHECK( state.tokens[1].owner == ef01 );

   BOOST_TEST_MESSAGE( "A run that never finishes cleanly still leaves its identifiers consumed" );

   options.mint_requests = { make_address( "0x0000000000000000000000000000000000001234" ) };
   service::registry_service second( options );
   BOOST_CHECK_EQUAL( second.get_registry().next_token_id(), 2 );

   results = second.process_mint_requests();
   BOOST_REQUIRE( results[0].id );
   BOOST_CHECK_EQUAL( *results[0].id, 2 );
   BOOST_CHECK( second.get_registry().owner_of( 0 ) == abcd );
   BOOST_CHECK_EQUAL( restore().next_token_id, 3 );
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( reset_test )
{ try {
   options.mint_requests = { abcd };
   {
      service::registry_service svc( options );
      svc.process_mint_requests();
   }

   BOOST_TEST_MESSAGE( "Resetting discards the snapshot" );
   options.reset = true;
   options.mint_requests.clear();
   service::registry_service svc( options );

   BOOST_CHECK_EQUAL( svc.get_registry().next_token_id(), 0 );
   BOOST_CHECK( !std::filesystem::exists( svc.snapshot_file() ) );
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( authorized_minters_test )
{ try {
   BOOST_TEST_MESSAGE( "A minter outside the authorized list cannot mint" );

   options.authorized_minters = { make_address( "0x00000000000000000000000000000000000000bb" ) };
   options.mint_requests = { abcd };
   service::registry_service svc( options );

   BOOST_REQUIRE_THROW( svc.process_mint_requests(), registry::unauthorized_minter );
   BOOST_CHECK_EQUAL( svc.get_registry().next_token_id(), 0 );
   BOOST_CHECK( !std::filesystem::exists( svc.snapshot_file() ) );

   BOOST_TEST_MESSAGE( "Open minting lets the minter through" );
   options.open_mint = true;
   service::registry_service open_service( options );
   BOOST_CHECK_EQUAL( *open_service.process_mint_requests()[0].id, 0 );
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( watch_test )
{ try {
   service::registry_service idle( options );
   BOOST_REQUIRE_THROW( idle.watch(), service::invalid_argument );

   BOOST_TEST_MESSAGE( "Whales found by the watcher are persisted" );

   auto feed = temp / "transfers.jsonl";
   {
      std::ofstream ofs( feed );
      ofs << R"({"from":"0x000000000000000000000000000000000000abcd","to":"0x000000000000000000000000000000000000ef01","value":"2000000"})" << "\n";
      ofs << R"({"from":"0x000000000000000000000000000000000000ef01","to":"0x000000000000000000000000000000000000abcd","value":"10"})" << "\n";
   }

   options.transfer_feed       = feed;
   options.feed_from_start     = true;
   options.watch.poll_limit    = 2;
   options.watch.poll_interval = 1ms;

   service::registry_service svc( options );
   auto logs = svc.watch();

   BOOST_REQUIRE_EQUAL( logs.size(), 1 );
   BOOST_CHECK_EQUAL( logs[0], "0x000...bcd -> 0x000...f01, value: 2000000" );

   auto state = restore();
   BOOST_CHECK_EQUAL( state.next_token_id, 1 );
   BOOST_REQUIRE_EQUAL( state.tokens.size(), 1 );
   BOOST_CHECK( state.tokens[0].owner == abcd );
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
