#include "testing.hh"

#include <memory>
#include <stdexcept>

using namespace scaffoldertest;
using scaffolder::Config;
using scaffolder::ErrorKind;
using scaffolder::ExtendFunc;
using scaffolder::ordered_node;

class ExtensionTest : public ::testing::Test {
protected:
  TempDir tmp_;
  fs::path src_ = tmp_ / "template";
  fs::path dst_ = tmp_ / "out";

  void SetUp() override {
    write_file( src_ / "a/x.txt", "{{.Name}}" );
    write_file( src_ / "b.txt", "b" );
  }

  std::shared_ptr< ExtendFunc > extension( std::function< void( Config& ) > fn ) {
    return std::make_shared< ExtendFunc >( std::move(fn) );
  }

  std::string extension_error( scaffolder::Scaffolder& s ) {
    try {
      s.scaffold( src_, dst_, yaml("Name: test") );
    }
    catch ( const scaffolder::Error& ex ) {
      EXPECT_EQ( ErrorKind::Extension, ex.kind() );
      return ex.what();
    }
    ADD_FAILURE() << "expected an extension error";
    return std::string();
  }
};

TEST_F(ExtensionTest, ExtendRunsInOrderBeforeTheWalk) {
  std::vector< std::string > calls;
  scaffolder::Scaffolder s;
  s.extend( extension([&]( Config& cfg ) {
      EXPECT_FALSE( fs::exists(cfg.target()) );
      calls.push_back( "first" );
    }) )
    .extend( extension([&]( Config& ) { calls.push_back( "second" ); }) );
  s.scaffold( src_, dst_, yaml("Name: test") );
  EXPECT_EQ( (std::vector< std::string >{ "first", "second" }), calls );
}

TEST_F(ExtensionTest, ConfigExposesCleanRoots) {
  fs::path seen_source, seen_target;
  scaffolder::Scaffolder s;
  s.extend( extension([&]( Config& cfg ) {
    seen_source = cfg.source();
    seen_target = cfg.target();
  }) );
  s.scaffold( src_.string() + "/", ( tmp_ / "x/../out" ), yaml("{}") );
  EXPECT_EQ( src_.string(), seen_source.string() );
  EXPECT_EQ( dst_.string(), seen_target.string() );
}

TEST_F(ExtensionTest, ExtensionsCanAddFunctions) {
  write_file( src_ / "b.txt", "{{ shout .Name }}" );
  scaffolder::Scaffolder s;
  s.extend( extension([]( Config& cfg ) {
    cfg.functions[ "shout" ] = []( const std::vector< ordered_node >& args ) {
      return scaffolder::internal::make_node_from(
        args.at( 0 ).get_value< std::string >() + "!" );
    };
  }) );
  s.scaffold( src_, dst_, yaml("Name: test") );
  EXPECT_EQ( "test!", read_file(dst_ / "b.txt") );
}

TEST_F(ExtensionTest, ExtensionsCanAddExclusions) {
  scaffolder::Scaffolder s;
  s.extend( extension([]( Config& cfg ) { cfg.exclude.push_back( "^a" ); }) );
  s.scaffold( src_, dst_, yaml("Name: test") );
  expect_files_equal( dst_, { { "b.txt", RW, "b" } } );
}

TEST_F(ExtensionTest, ExtensionsCanReplaceTheContext) {
  scaffolder::Scaffolder s;
  s.extend( extension([]( Config& cfg ) {
    cfg.context = yaml( "Name: replaced" );
  }) );
  s.scaffold( src_, dst_, yaml("Name: test") );
  EXPECT_EQ( "replaced", read_file(dst_ / "a/x.txt") );
}

TEST_F(ExtensionTest, ExtendFailureStopsBeforeAnyWrite) {
  scaffolder::Scaffolder s;
  s.extend( extension([]( Config& ) {
    throw std::runtime_error( "missing license" );
  }) );
  EXPECT_NE( std::string::npos, extension_error(s)
    .find("failed to extend scaffolder: missing license") );
  EXPECT_FALSE( fs::exists(dst_) );
}

TEST_F(ExtensionTest, AfterEachSeesDirectoriesAndFilesInWalkOrder) {
  std::vector< std::string > seen;
  scaffolder::Scaffolder s;
  s.after_each( [&]( const fs::path& p ) {
    EXPECT_TRUE( fs::exists(p) );
    seen.push_back( p.lexically_relative(dst_).generic_string() );
  } );
  s.scaffold( src_, dst_, yaml("Name: test") );
  EXPECT_EQ( (std::vector< std::string >{ "a", "a/x.txt", "b.txt" }), seen );
}

TEST_F(ExtensionTest, AfterEachCanAdjustPermissions) {
  scaffolder::Scaffolder s;
  s.after_each( []( const fs::path& p ) {
    if ( p.extension() == ".txt" ) {
      fs::permissions( p, fs::perms::owner_all, fs::perm_options::replace );
    }
  } );
  s.scaffold( src_, dst_, yaml("Name: test") );
  EXPECT_EQ( fs::perms::owner_all, fs::status(dst_ / "b.txt").permissions() );
}

TEST_F(ExtensionTest, AfterEachFailureAbortsTheRun) {
  scaffolder::Scaffolder s;
  s.after_each( []( const fs::path& p ) {
    if ( p.filename() == "a" ) throw std::runtime_error( "denied" );
  } );
  const std::string msg = extension_error( s );
  EXPECT_NE( std::string::npos, msg.find("failed to run after each for") );
  EXPECT_NE( std::string::npos, msg.find("denied") );
  EXPECT_FALSE( fs::exists(dst_ / "a/x.txt") );
  EXPECT_FALSE( fs::exists(dst_ / "b.txt") );
}

namespace {

  // Counts files and forces a context value
  class CountingExtension : public scaffolder::Extension {
  public:
    void extend( Config& cfg ) override {
      cfg.context = yaml( "Name: counted" );
    }
    void after_each( const fs::path& p ) override {
      if ( fs::is_regular_file(p) ) ++files;
    }
    int files = 0;
  };

} // anonymous namespace

TEST_F(ExtensionTest, CustomExtensionClasses) {
  auto counter = std::make_shared< CountingExtension >();
  scaffolder::Scaffolder s;
  s.extend( counter );
  s.scaffold( src_, dst_, yaml("Name: test") );
  EXPECT_EQ( 2, counter->files );
  EXPECT_EQ( "counted", read_file(dst_ / "a/x.txt") );
}

TEST_F(ExtensionTest, ScaffolderCanBeReused) {
  scaffolder::Scaffolder s;
  s.scaffold( src_, dst_, yaml("Name: one") );
  TempDir other;
  s.scaffold( src_, other.path(), yaml("Name: two") );
  EXPECT_EQ( "one", read_file(dst_ / "a/x.txt") );
  EXPECT_EQ( "two", read_file(other / "a/x.txt") );
}
