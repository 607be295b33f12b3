// Standard library includes
#include <fstream>

#include "cinit.hh"

namespace {

  const char* const USAGE =
    "usage: cinit-extract entries [-c config.yaml] [file...]\n"
    "       cinit-extract eval [-c config.yaml] <expression>...\n"
    "       cinit-extract tables <element type> [file...]\n"
    "Files are read in order and later entries override earlier ones.\n"
    "Standard input is read when no file is given.\n";

  std::string read_file( const std::string& path ) {
    std::ifstream in( path, std::ios::binary );
    if ( !in ) throw std::runtime_error( "cannot open '" + path + "'" );
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::vector< std::string > read_sources(
    const std::vector< std::string >& paths )
  {
    std::vector< std::string > texts;
    if ( paths.empty() ) {
      std::ostringstream ss;
      ss << std::cin.rdbuf();
      texts.push_back( ss.str() );
    }
    for ( const auto& p : paths ) texts.push_back( read_file(p) );
    return texts;
  }

  void report( const std::vector< std::string >& diagnostics ) {
    for ( const auto& d : diagnostics ) {
      std::cerr << "[cinit] warning: " << d << "\n";
    }
  }

  // Strips a leading "-c FILE" pair from args and loads that configuration
  cinit::Config take_config( std::vector< std::string >& args ) {
    if ( args.size() < 2 || args[ 0 ] != "-c" ) return cinit::Config();
    const std::string path = args[ 1 ];
    args.erase( args.begin(), args.begin() + 2 );
    return cinit::load_config( read_file(path) );
  }

  int run_entries( std::vector< std::string > args ) {
    cinit::Extractor extractor( take_config(args) );
    cinit::ordered_node doc = extractor.extract( read_sources(args) );
    report( extractor.diagnostics() );
    std::cout << cinit::ordered_node::serialize( doc );
    return 0;
  }

  int run_eval( std::vector< std::string > args ) {
    const cinit::Config config = take_config( args );
    if ( args.empty() ) {
      std::cerr << USAGE;
      return 2;
    }
    for ( const auto& expr : args ) {
      std::cout << cinit::evaluate_expression( expr, config.symbols ) << "\n";
    }
    return 0;
  }

  int run_tables( std::vector< std::string > args ) {
    if ( args.empty() ) {
      std::cerr << USAGE;
      return 2;
    }
    const std::string element_type = args[ 0 ];
    args.erase( args.begin() );

    std::vector< std::string > diagnostics;
    cinit::ordered_node doc = cinit::ordered_node::mapping();
    for ( const auto& text : read_sources(args) ) {
      for ( const auto& t : cinit::scan_array_tables(text, element_type,
        &diagnostics) )
      {
        std::vector< cinit::ordered_node > items;
        for ( const auto& item : cinit::split_top_level(t.body) ) {
          items.push_back( cinit::ordered_node( item ) );
        }
        doc[ t.name ] = cinit::ordered_node( items );
      }
    }
    report( diagnostics );
    std::cout << cinit::ordered_node::serialize( doc );
    return 0;
  }

} // namespace

int main( int argc, char** argv ) {
  std::vector< std::string > args( argv + 1, argv + argc );
  if ( args.empty() ) {
    std::cerr << USAGE;
    return 2;
  }
  const std::string command = args[ 0 ];
  args.erase( args.begin() );

  try {
    if ( command == "entries" ) return run_entries( args );
    if ( command == "eval" ) return run_eval( args );
    if ( command == "tables" ) return run_tables( args );
    std::cerr << USAGE;
    return 2;
  }
  catch ( const cinit::Error& ex ) {
    std::cerr << "[cinit] " << cinit::error_kind_name( ex.kind() ) << ": "
      << ex.what() << "\n";
    return 1;
  }
  catch ( const std::exception& ex ) {
    std::cerr << "[cinit] error: " << ex.what() << "\n";
    return 1;
  }
}
