#include "scaffolder.hh"

namespace {

  const char* const USAGE =
    "usage: scaffolder [options] <template-dir> <dest-dir>\n"
    "\n"
    "Render the template directory into the destination directory.\n"
    "\n"
    "options:\n"
    "  --json FILE, --context FILE  JSON or YAML file containing the context\n"
    "  --exclude REGEX              skip template paths matching REGEX\n"
    "                               (repeatable)\n"
    "  --suffix TEXT                template marker suffix (default .tmpl)\n"
    "  --verbose                    report every written path\n"
    "  --version                    show version\n"
    "  --help                       show this message\n";

  struct Arguments {
    std::string context_file;
    std::vector< std::string > exclude;
    std::string suffix = ".tmpl";
    bool verbose = false;
    std::vector< std::string > positional;
  };

  // Returns an exit code when the program should stop right away
  int parse_arguments( int argc, char* argv[], Arguments& args ) {
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      auto value = [&]() -> std::string {
        if ( i + 1 >= argc ) {
          throw std::invalid_argument( "missing value for " + arg );
        }
        return argv[ ++i ];
      };

      if ( arg == "--help" || arg == "-h" ) {
        std::cout << USAGE;
        return 0;
      }
      if ( arg == "--version" ) {
        std::cout << "scaffolder " << scaffolder::VERSION << '\n';
        return 0;
      }
      if ( arg == "--json" || arg == "--context" ) args.context_file = value();
      else if ( arg == "--exclude" ) args.exclude.push_back( value() );
      else if ( arg == "--suffix" ) args.suffix = value();
      else if ( arg == "--verbose" || arg == "-v" ) args.verbose = true;
      else if ( arg.size() > 1 && arg[0] == '-' ) {
        throw std::invalid_argument( "unknown option " + arg );
      }
      else args.positional.push_back( arg );
    }
    if ( args.positional.size() != 2 ) {
      throw std::invalid_argument( "expected <template-dir> and <dest-dir>" );
    }
    for ( const auto& dir : args.positional ) {
      if ( !std::filesystem::is_directory(dir) ) {
        throw std::invalid_argument( dir + " is not an existing directory" );
      }
    }
    return -1;
  }

} // anonymous namespace

int main( int argc, char* argv[] ) {
  Arguments args;
  try {
    const int code = parse_arguments( argc, argv, args );
    if ( code >= 0 ) return code;
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[scaffolder] error: " << ex.what() << "\n\n" << USAGE;
    return 2;
  }

  try {
    scaffolder::ordered_node context = args.context_file.empty()
      ? scaffolder::ordered_node::mapping()
      : scaffolder::load_context_file( args.context_file );

    scaffolder::Scaffolder s;
    s.functions( scaffolder::text_functions() )
      .exclude( args.exclude )
      .template_suffix( args.suffix );
    if ( args.verbose ) {
      s.after_each( []( const std::filesystem::path& path ) {
        std::cerr << "[scaffolder] wrote " << path.string() << '\n';
      } );
    }
    s.scaffold( args.positional[0], args.positional[1], context );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[scaffolder] error: " << ex.what() << "\n";
    return 1;
  }
}
