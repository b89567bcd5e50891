#include <boost/test/unit_test.hpp>

#include <whale/common/address.hpp>
#include <whale/exception.hpp>

struct mint_context
{
   uint64_t id = 0;
   std::string owner;
};

void to_json( nlohmann::json& j, const mint_context& c )
{
   j = nlohmann::json{ { "id", c.id }, { "owner", c.owner } };
}

WHALE_DECLARE_EXCEPTION( test_exception );
WHALE_DECLARE_DERIVED_EXCEPTION( test_derived_exception, test_exception );

struct exception_fixture {};

BOOST_FIXTURE_TEST_SUITE( exception_tests, exception_fixture )

BOOST_AUTO_TEST_CASE( substitution_test )
{ try {
   BOOST_TEST_MESSAGE( "Values captured at the throw are substituted into the message" );
   try
   {
      WHALE_THROW( test_exception, "token ${id} already owned by ${owner}", ("id", std::size_t( 4 ))("owner", "0xabcd") );
   }
   catch ( const whale::exception& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "token 4 already owned by 0xabcd" );
      BOOST_CHECK_EQUAL( e.what(), e.get_message() );
      BOOST_CHECK_EQUAL( e.get_json()["id"], 4 );
      BOOST_CHECK_EQUAL( e.get_json()["owner"], "0xabcd" );
   }

   BOOST_TEST_MESSAGE( "Types with a to_json overload are captured as json" );
   try
   {
      auto a = whale::address::from_hex( "0x000000000000000000000000000000000000abcd" );
      WHALE_THROW( test_exception, "cannot mint to ${to}: ${ctx}", ("to", a)("ctx", mint_context{ 7, "0x01" }) );
   }
   catch ( const whale::exception& e )
   {
      BOOST_CHECK_EQUAL(
         e.get_message(),
         "cannot mint to 0x000000000000000000000000000000000000abcd: {\"id\":7,\"owner\":\"0x01\"}"
      );
      BOOST_CHECK_EQUAL( e.get_json()["ctx"]["id"], 7 );
   }
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( capture_and_rethrow_test )
{ try {
   BOOST_TEST_MESSAGE( "Values added while unwinding fill the remaining keys" );
   try
   {
      try
      {
         WHALE_THROW( test_exception, "snapshot ${file} in ${dir} is invalid", ("file", "registry.snapshot") );
      }
      WHALE_CAPTURE_CATCH_AND_RETHROW( ("dir", "/var/whale")("attempt", 2) )
   }
   catch ( const whale::exception& e )
   {
      nlohmann::json expected;
      expected["file"]    = "registry.snapshot";
      expected["dir"]     = "/var/whale";
      expected["attempt"] = 2;

      BOOST_CHECK_EQUAL( e.get_json(), expected );
      BOOST_CHECK_EQUAL( e.get_message(), "snapshot registry.snapshot in /var/whale is invalid" );
   }

   BOOST_TEST_MESSAGE( "Keys that are never captured stay in the message" );
   try
   {
      try
      {
         WHALE_THROW( test_exception, "mint ${id} to ${owner}" );
      }
      WHALE_CAPTURE_CATCH_AND_RETHROW( ("id", 3) )
   }
   catch ( const whale::exception& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "mint 3 to ${owner}" );
   }
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( message_format_test )
{ try {
   BOOST_TEST_MESSAGE( "Dollar signs that are not substitutions stay in the message" );
   try
   {
      WHALE_THROW( test_exception, "escaped ${$id} stays", ("id", 1) );
   }
   catch ( const whale::exception& e )
   {
      BOOST_CHECK_EQUAL( e.what(), std::string( "escaped ${$id} stays" ) );
   }

   try
   {
      WHALE_THROW( test_exception, "unterminated ${id", ("id", 1) );
   }
   catch ( const whale::exception& e )
   {
      BOOST_CHECK_EQUAL( e.what(), std::string( "unterminated ${id" ) );
   }

   try
   {
      WHALE_THROW( test_exception, "value $5 for ${id}, not ${}", ("id", 2) );
   }
   catch ( const whale::exception& e )
   {
      BOOST_CHECK_EQUAL( e.what(), std::string( "value $5 for 2, not ${}" ) );
   }

   nlohmann::json values;
   values["a"] = 1;
   values["b"] = "x";
   BOOST_CHECK_EQUAL( whale::detail::json_strpolate( "${a}${b}${a}", values ), "1x1" );
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( hierarchy_test )
{ try {
   BOOST_TEST_MESSAGE( "A derived exception is caught through its base and carries a stacktrace" );
   try
   {
      WHALE_ASSERT( false, test_derived_exception, "derived ${n}", ("n", 7) );
   }
   catch ( const test_exception& e )
   {
      BOOST_CHECK_EQUAL( e.what(), std::string( "derived 7" ) );
      BOOST_CHECK( !e.get_stacktrace().empty() );
      BOOST_CHECK( boost::diagnostic_information( e ).find( "derived 7" ) != std::string::npos );
   }

   BOOST_CHECK_NO_THROW( WHALE_ASSERT( true, test_exception, "never thrown" ) );
} WHALE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
