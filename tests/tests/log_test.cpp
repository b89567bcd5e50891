#include <boost/test/unit_test.hpp>

#include <whale/log.hpp>
#include <whale/log/exceptions.hpp>
#include <whale/util/random.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

struct log_fixture
{
   log_fixture()
   {
      buf = std::cout.rdbuf();
      std::cout.rdbuf( stream.rdbuf() );
   }

   ~log_fixture()
   {
      boost::log::core::get()->remove_all_sinks();
      std::cout.rdbuf( buf );
   }

   std::stringstream stream;
   std::streambuf*   buf;
};

BOOST_FIXTURE_TEST_SUITE( log_tests, log_fixture )

BOOST_AUTO_TEST_CASE( log_color_tests )
{
   whale::initialize_logging( "whale_test", "abc12", "debug", {}, true, false );

   LOG( trace )   << "filtered";
   LOG( debug )   << "test";
   LOG( info )    << "test";
   LOG( warning ) << "test";
   LOG( error )   << "test";
   LOG( fatal )   << "test";

   std::vector< std::string > expected {
      "<\033[32mdebug\033[0m>: test",
      "<\033[32minfo\033[0m>: test",
      "<\033[33mwarning\033[0m>: test",
      "<\033[31merror\033[0m>: test",
      "<\033[31mfatal\033[0m>: test"
   };

   std::vector< std::string > lines;
   std::string line;
   while ( std::getline( stream, line ) )
      lines.push_back( line );

   BOOST_REQUIRE_EQUAL( lines.size(), expected.size() );

   for ( std::size_t i = 0; i < lines.size(); i++ )
   {
      BOOST_CHECK( lines[i].rfind( "whale_test.abc12 [log_test.cpp:", 0 ) == 0 );
      BOOST_CHECK( lines[i].find( expected[i] ) != std::string::npos );
   }
}

BOOST_AUTO_TEST_CASE( log_no_color_tests )
{
   whale::initialize_logging( "whale_test", {}, "warning", {}, false, false );

   LOG( info )    << "filtered";
   LOG( warning ) << "plain";

   auto output = stream.str();
   BOOST_CHECK( output.find( "filtered" ) == std::string::npos );
   BOOST_CHECK( output.find( "whale_test [log_test.cpp:" ) == 0 );
   BOOST_CHECK( output.find( "<warning>: plain" ) != std::string::npos );
   BOOST_CHECK( output.find( "\033[" ) == std::string::npos );
}

BOOST_AUTO_TEST_CASE( log_file_tests )
{
   auto temp = std::filesystem::temp_directory_path() / whale::util::random_alphanumeric( 8 );
   std::filesystem::create_directory( temp );

   whale::initialize_logging( "whale_test", "file", "info", temp, false, true );

   LOG( info ) << "written to file";

   boost::log::core::get()->remove_all_sinks();

   std::string contents;
   for ( const auto& entry : std::filesystem::directory_iterator( temp ) )
   {
      std::ifstream ifs( entry.path() );
      std::stringstream ss;
      ss << ifs.rdbuf();
      contents += ss.str();
   }

   std::filesystem::remove_all( temp );

   BOOST_CHECK( contents.find( "<info>: written to file" ) != std::string::npos );
}

BOOST_AUTO_TEST_CASE( log_invalid_level_tests )
{
   BOOST_REQUIRE_THROW( whale::initialize_logging( "whale_test", {}, "loud" ), whale::invalid_log_level );
}

BOOST_AUTO_TEST_SUITE_END()
