//  scaffolder
//  Template-driven file tree generation
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include <fkYAML/node.hpp>

namespace scaffolder {

  inline constexpr const char* VERSION = "0.1.0";

  // Context values handed to templates. fkyaml::ordered_map keeps mapping
  // keys in the order they were authored.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Categories of failure reported by a scaffolding run
  enum class ErrorKind {
    Config, // invalid exclusion pattern, unreadable context document
    Template, // parse or execution failure
    Filesystem, // read/write/mkdir/symlink/remove failures
    UnsupportedEntry, // device, pipe, socket, ...
    Extension // failure raised by an Extension hook
  };

  class Error : public std::runtime_error {
  public:
    Error( ErrorKind kind, const std::string& msg )
      : std::runtime_error( msg ), kind_( kind ) {}

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
  };

  // Template functions take positional arguments and return a single value.
  // Failures are reported by throwing; the evaluator turns them into template
  // errors.
  using Function = std::function<
    ordered_node( const std::vector< ordered_node >& args ) >;
  using FunctionMap = std::unordered_map< std::string, Function >;

namespace internal {

  // Constants used by the generation engine
  inline const std::string TEMPLATE_SUFFIX = ".tmpl";
  inline const std::string DIR_FUNCTION = "dir";
  inline constexpr char FAN_OUT_SEPARATOR = '\0';
  inline const std::string NO_VALUE = "<no value>";

  inline const std::string OPEN_ACTION = "{{";
  inline const std::string CLOSE_ACTION = "}}";

  // Template tokens, one vector per action
  enum class TokenKind {
    Dot, // .
    Field, // .Name
    Variable, // $ or $name
    Identifier, // function name or keyword
    String, // already unquoted
    Number,
    Bool,
    Nil,
    LeftParen,
    RightParen,
    Pipe,
    Declare, // :=
    Assign, // =
    Comma
  };

  struct Token {
    TokenKind kind;
    std::string text;
    // True if whitespace separated this token from the previous one. Field
    // chains such as $x.Name or (f).Name require adjacency.
    bool spaced = true;
  };

  // Lexer output: literal text or the tokens of one {{ action }}
  struct Chunk {
    bool action = false;
    std::string text;
    std::vector< Token > tokens;
    int line = 1;
  };

  struct Pipeline;

  struct Operand {
    enum class Kind { Dot, Field, Variable, Function, Literal, Nested };
    Kind kind = Kind::Dot;
    std::string name; // variable or function name
    std::vector< std::string > fields; // trailing field chain
    ordered_node literal;
    std::shared_ptr< Pipeline > nested;
  };

  struct Command {
    std::vector< Operand > operands;
  };

  struct Pipeline {
    std::vector< std::string > variables;
    bool declare = false; // := rather than =
    std::vector< Command > commands;
  };

  enum class NodeKind { Text, Action, If, Range, With };

  struct Node {
    NodeKind kind = NodeKind::Text;
    int line = 1;
    std::string text;
    Pipeline pipeline;
    std::vector< Node > list;
    std::vector< Node > else_list;
  };

} // namespace scaffolder::internal

  // A parsed template. Parsing checks that every function named by the
  // template is present in the function table or among the builtins.
  class Template {
  public:
    static Template parse( const std::string& name, const std::string& text,
      const FunctionMap& funcs );

    std::string execute( const ordered_node& data ) const;

    const std::string& name() const { return name_; }

  private:
    Template( std::string name, std::vector< internal::Node > root,
      FunctionMap funcs )
      : name_( std::move(name) ), root_( std::move(root) ),
        funcs_( std::move(funcs) ) {}

    std::string name_;
    std::vector< internal::Node > root_;
    FunctionMap funcs_;
  };

  // Parse and execute in one step. The name labels diagnostics only.
  std::string evaluate( const std::string& name, const std::string& text,
    const ordered_node& data, const FunctionMap& funcs );

  // Case conversion and related helpers (snake, camel, kebab, ...)
  FunctionMap text_functions();

  // Context loading. YAML and JSON documents are both accepted.
  ordered_node load_context( std::istream& in );
  ordered_node load_context_file( const std::filesystem::path& path );

  // Result of a walk_dir callback. Skip on a directory prunes its subtree,
  // on anything else it simply moves on.
  enum class WalkAction { Continue, Skip };

  using WalkFunction = std::function< WalkAction(
    const std::filesystem::path& path,
    const std::filesystem::directory_entry& entry ) >;

  // Depth-first, pre-order walk of dir. fn sees a directory before its
  // children. Exceptions thrown by fn abort the walk.
  void walk_dir( const std::filesystem::path& dir, const WalkFunction& fn );

  // Configuration shared by a scaffolding run. Extensions may change the
  // public members before the walk starts.
  struct Config {
    ordered_node context;
    FunctionMap functions;
    std::vector< std::string > exclude;

    const std::filesystem::path& source() const { return source_; }
    const std::filesystem::path& target() const { return target_; }

  private:
    friend class Scaffolder;
    std::filesystem::path source_;
    std::filesystem::path target_;
  };

  // Extension hooks. extend() runs once before the walk; after_each() runs
  // after every file or directory is written. Both default to no-ops.
  class Extension {
  public:
    virtual ~Extension() = default;
    virtual void extend( Config& mutable_config ) { (void)mutable_config; }
    virtual void after_each( const std::filesystem::path& path ) {
      (void)path;
    }
  };

  // Adapter for an extension that only mutates the configuration
  class ExtendFunc : public Extension {
  public:
    explicit ExtendFunc( std::function< void( Config& ) > fn )
      : fn_( std::move(fn) ) {}
    void extend( Config& mutable_config ) override { fn_( mutable_config ); }

  private:
    std::function< void( Config& ) > fn_;
  };

  // Adapter for an extension that only observes materialized paths
  class AfterEachFunc : public Extension {
  public:
    explicit AfterEachFunc(
      std::function< void( const std::filesystem::path& ) > fn )
      : fn_( std::move(fn) ) {}
    void after_each( const std::filesystem::path& path ) override {
      fn_( path );
    }

  private:
    std::function< void( const std::filesystem::path& ) > fn_;
  };

  // Symlinks recorded during the walk and created once it is over, so that
  // their targets (possibly other symlinks) exist by then.
  class DeferredSymlinks {
  public:
    // Record link -> target. target is the rendered link text.
    void defer( const std::filesystem::path& link,
      const std::filesystem::path& target );

    bool empty() const { return pending_.empty(); }
    std::size_t size() const { return pending_.size(); }

    // Create every pending link, targets first, then check that each one
    // resolves. Throws on cycles and on links that do not resolve to an
    // existing path.
    void apply();

  private:
    void resolve( std::filesystem::path link,
      std::vector< std::filesystem::path >& in_progress,
      std::vector< std::filesystem::path >& created );

    std::map< std::filesystem::path, std::filesystem::path > pending_;
  };

  class Scaffolder {
  public:
    Scaffolder();

    // Add template functions. Later registrations override earlier ones.
    Scaffolder& functions( const FunctionMap& funcs );

    // Append an extension
    Scaffolder& extend( std::shared_ptr< Extension > plugin );

    // Append exclusion regexes. They are matched against the path relative
    // to the source root before any template evaluation or suffix removal.
    Scaffolder& exclude( const std::vector< std::string >& patterns );

    // Append an after-each callback, e.g. for adjusting permissions
    Scaffolder& after_each(
      std::function< void( const std::filesystem::path& ) > fn );

    // Literal suffix removed from rendered destination names
    Scaffolder& template_suffix( std::string suffix );

    // Render the tree at source into destination using context
    void scaffold( const std::filesystem::path& source,
      const std::filesystem::path& destination, const ordered_node& context );

  private:
    FunctionMap funcs_;
    std::vector< std::shared_ptr< Extension > > plugins_;
    std::vector< std::string > exclude_;
    std::string suffix_ = internal::TEMPLATE_SUFFIX;

    // Wraps internal state refreshed upon each call to scaffold(...)
    struct ScaffoldSession {
      Config config;
      std::vector< std::pair< std::string, std::regex > > exclusions;
    };

    ScaffoldSession session_;

    // Processing stages
    void run_extend_phase();
    void compile_exclusions();
    void scaffold_directory( const std::filesystem::path& src_dir,
      const std::filesystem::path& dst_dir, const ordered_node& ctx,
      DeferredSymlinks& symlinks );
    void scaffold_entry( const std::filesystem::path& src_path,
      const std::filesystem::directory_entry& entry,
      const std::filesystem::path& dst_dir, const ordered_node& ctx,
      DeferredSymlinks& symlinks );
    void materialize( const std::filesystem::path& src_path,
      const std::filesystem::directory_entry& entry,
      const std::filesystem::path& dst_path, const ordered_node& ctx,
      DeferredSymlinks& symlinks );
    void run_after_each( const std::filesystem::path& dst_path );

    bool is_excluded( const std::string& rel_path ) const;
    std::string strip_suffix( const std::string& name ) const;

  }; // class Scaffolder

  // Scaffold with the default configuration
  void scaffold( const std::filesystem::path& source,
    const std::filesystem::path& destination, const ordered_node& context );

namespace internal {

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline bool is_number( const ordered_node& n ) {
    return n.is_integer() || n.is_float_number();
  }

  inline double to_double( const ordered_node& n ) {
    if ( n.is_integer() ) {
      return static_cast< double >( n.get_value< std::int64_t >() );
    }
    return n.get_value< double >();
  }

  // Shortest text that round-trips a double
  inline std::string format_double( double d ) {
    char buf[ 64 ];
    auto res = std::to_chars( buf, buf + sizeof(buf), d );
    return std::string( buf, res.ptr );
  }

  inline std::string type_name( const ordered_node& n ) {
    if ( n.is_null() ) return "nil";
    if ( n.is_boolean() ) return "bool";
    if ( n.is_integer() ) return "int";
    if ( n.is_float_number() ) return "float64";
    if ( n.is_string() ) return "string";
    if ( n.is_sequence() ) return "slice";
    return "map";
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_double(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Mapping keys are normally strings but YAML allows any scalar
  inline std::string key_string( const ordered_node& k ) {
    return k.is_string() ? k.get_value< std::string >() : to_string_any( k );
  }

  // Mapping items sorted by key, the iteration order used by range and
  // when printing a mapping
  inline std::vector< std::pair< std::string, ordered_node > >
    sorted_items( const ordered_node& m )
  {
    std::vector< std::pair< std::string, ordered_node > > items;
    for ( const auto& [mk, mv] : m.map_items() ) {
      items.emplace_back( key_string(mk), mv );
    }
    std::stable_sort( items.begin(), items.end(),
      []( const auto& a, const auto& b ) { return a.first < b.first; } );
    return items;
  }

  // Text rendered for a value by {{ }} and print. Nested nulls print as
  // <nil>, a top-level null as <no value>.
  inline std::string format_value( const ordered_node& n,
    bool nested = false )
  {
    if ( n.is_null() ) return nested ? "<nil>" : NO_VALUE;
    if ( n.is_sequence() ) {
      std::string s = "[";
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        if ( i ) s += ' ';
        s += format_value( n.at(i), true );
      }
      return s + ']';
    }
    if ( n.is_mapping() ) {
      std::string s = "map[";
      bool first = true;
      for ( const auto& [k, v] : sorted_items(n) ) {
        if ( !first ) s += ' ';
        first = false;
        s += k + ':' + format_value( v, true );
      }
      return s + ']';
    }
    return to_string_any( n );
  }

  // Template truth: null, false, zero and empty values are false
  inline bool is_truthy( const ordered_node& n ) {
    if ( n.is_null() ) return false;
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_integer() ) return n.get_value< std::int64_t >() != 0;
    if ( n.is_float_number() ) return n.get_value< double >() != 0.0;
    if ( n.is_string() ) return !n.get_value< std::string >().empty();
    return n.size() > 0;
  }

  inline bool is_space( char c ) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  }

  inline bool is_ident_char( char c ) {
    unsigned char u = static_cast< unsigned char >( c );
    return std::isalnum( u ) || c == '_';
  }

  [[noreturn]] inline void throw_filesystem_error( const std::string& what,
    const std::filesystem::path& path, const std::error_code& ec )
  {
    std::ostringstream oss;
    oss << what << " " << path;
    if ( ec ) oss << ": " << ec.message();
    throw Error( ErrorKind::Filesystem, oss.str() );
  }

  // Absolute, normalized form without a trailing separator
  inline std::filesystem::path clean_root( const std::filesystem::path& p ) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute( p, ec );
    if ( ec ) throw_filesystem_error( "failed to resolve path", p, ec );
    abs = abs.lexically_normal();
    if ( !abs.has_filename() && abs != abs.root_path() ) {
      abs = abs.parent_path();
    }
    return abs;
  }

  // Template machinery
  std::vector< Chunk > lex_template( const std::string& name,
    const std::string& text );
  const FunctionMap& builtin_functions();
  std::vector< std::string > split_words( const std::string& s );

  class Parser {
  public:
    Parser( const std::string& name, std::vector< Chunk > chunks,
      const FunctionMap& funcs )
      : name_( name ), chunks_( std::move(chunks) ), funcs_( funcs ) {}

    std::vector< Node > parse();

  private:
    // Where parse_list stopped: "end", "else" or empty at end of input
    struct Stop {
      std::string keyword;
      std::size_t chunk = 0;
    };

    std::vector< Node > parse_list( Stop& stop );
    Node parse_control( NodeKind kind, std::size_t chunk, std::size_t first );
    Pipeline parse_pipeline( const Chunk& chunk, std::size_t first,
      NodeKind context );
    void parse_commands( const Chunk& chunk, std::size_t& pos, bool nested,
      Pipeline& pipe );
    Operand parse_operand( const Chunk& chunk, std::size_t& pos );
    bool is_function( const std::string& name ) const;

    [[noreturn]] void fail( int line, const std::string& msg ) const;

    const std::string& name_;
    std::vector< Chunk > chunks_;
    const FunctionMap& funcs_;
    std::size_t next_ = 0;
  };

  class Executor {
  public:
    Executor( const std::string& name, const FunctionMap& funcs,
      const ordered_node& data )
      : name_( name ), funcs_( funcs )
    {
      vars_.push_back( { "$", data } );
    }

    void run( const std::vector< Node >& list, const ordered_node& dot,
      std::string& out );

  private:
    struct Variable {
      std::string name;
      ordered_node value;
    };

    void run_range( const Node& node, const ordered_node& dot,
      std::string& out );
    ordered_node eval_pipeline( const Pipeline& pipe, const ordered_node& dot,
      int line, bool bind );
    ordered_node eval_command( const Command& cmd, const ordered_node& dot,
      const ordered_node* final, int line );
    ordered_node eval_operand( const Operand& op, const ordered_node& dot,
      int line );
    ordered_node eval_fields( ordered_node receiver,
      const std::vector< std::string >& fields, int line );
    ordered_node call( const std::string& fn_name,
      const std::vector< ordered_node >& args, int line );
    ordered_node& lookup_var( const std::string& var_name, int line );

    [[noreturn]] void fail( int line, const std::string& msg ) const;

    const std::string& name_;
    const FunctionMap& funcs_;
    std::vector< Variable > vars_;
  };

} // namespace scaffolder::internal

} // namespace scaffolder

// Template lexer. Splits text into literal chunks and action chunks, handles
// the {{- and -}} trim markers and drops {{/* comments */}}.
inline std::vector< scaffolder::internal::Chunk >
  scaffolder::internal::lex_template( const std::string& name,
    const std::string& text )
{
  std::vector< Chunk > chunks;
  std::size_t pos = 0;
  int line = 1;
  bool trim_next = false;

  auto fail = [&]( int at_line, const std::string& msg ) {
    std::ostringstream oss;
    oss << "template: " << name << ':' << at_line << ": " << msg;
    throw Error( ErrorKind::Template, oss.str() );
  };

  auto push_text = [&]( std::string lit ) {
    if ( trim_next ) {
      std::size_t k = 0;
      while ( k < lit.size() && is_space(lit[k]) ) ++k;
      lit.erase( 0, k );
      trim_next = false;
    }
    if ( lit.empty() ) return;
    Chunk c;
    c.text = std::move( lit );
    c.line = line;
    chunks.push_back( std::move(c) );
  };

  while ( pos < text.size() ) {
    const std::size_t open = text.find( OPEN_ACTION, pos );
    if ( open == std::string::npos ) {
      push_text( text.substr(pos) );
      break;
    }

    std::string lit = text.substr( pos, open - pos );
    std::size_t p = open + OPEN_ACTION.size();

    // "{{- " trims the whitespace preceding the action
    const bool trim_left = p + 1 < text.size() && text[ p ] == '-'
      && is_space( text[p + 1] );
    if ( trim_left ) {
      while ( !lit.empty() && is_space(lit.back()) ) lit.pop_back();
      p += 1;
    }
    push_text( std::move(lit) );
    line += static_cast< int >(
      std::count( text.begin() + pos, text.begin() + open, '\n' ) );
    const int action_line = line;

    while ( p < text.size() && is_space(text[p]) ) ++p;

    // Comments
    if ( text.compare(p, 2, "/*") == 0 ) {
      const std::size_t close = text.find( "*/", p + 2 );
      if ( close == std::string::npos ) fail( action_line, "unclosed comment" );
      std::size_t q = close + 2;
      while ( q < text.size() && is_space(text[q]) ) ++q;
      if ( text.compare(q, 3, "-}}") == 0 ) {
        trim_next = true;
        q += 3;
      }
      else if ( text.compare(q, 2, CLOSE_ACTION) == 0 ) {
        q += 2;
      }
      else {
        fail( action_line, "comment ends before closing delimiter" );
      }
      line += static_cast< int >(
        std::count( text.begin() + open, text.begin() + q, '\n' ) );
      pos = q;
      continue;
    }

    Chunk action;
    action.action = true;
    action.line = action_line;
    bool closed = false;
    bool spaced = true;

    while ( p < text.size() ) {
      const char c = text[ p ];

      if ( is_space(c) ) {
        ++p;
        spaced = true;
        continue;
      }
      if ( c == '-' && spaced && text.compare(p + 1, 2, CLOSE_ACTION) == 0 ) {
        trim_next = true;
        p += 3;
        closed = true;
        break;
      }
      if ( text.compare(p, 2, CLOSE_ACTION) == 0 ) {
        p += 2;
        closed = true;
        break;
      }

      Token tok;
      tok.spaced = spaced;
      spaced = false;

      if ( c == '"' ) {
        std::string s;
        ++p;
        bool done = false;
        while ( p < text.size() ) {
          char d = text[ p++ ];
          if ( d == '"' ) { done = true; break; }
          if ( d == '\n' ) break;
          if ( d == '\\' && p < text.size() ) {
            char e = text[ p++ ];
            switch ( e ) {
              case 'n': s += '\n'; break;
              case 't': s += '\t'; break;
              case 'r': s += '\r'; break;
              case '0': s += '\0'; break;
              case '\\': s += '\\'; break;
              case '"': s += '"'; break;
              case '\'': s += '\''; break;
              default:
                fail( action_line, std::string("unknown escape sequence \\")
                  + e );
            }
            continue;
          }
          s += d;
        }
        if ( !done ) fail( action_line, "unterminated quoted string" );
        tok.kind = TokenKind::String;
        tok.text = std::move( s );
      }
      else if ( c == '`' ) {
        const std::size_t close = text.find( '`', p + 1 );
        if ( close == std::string::npos ) {
          fail( action_line, "unterminated raw quoted string" );
        }
        tok.kind = TokenKind::String;
        tok.text = text.substr( p + 1, close - p - 1 );
        p = close + 1;
      }
      else if ( c == '(' ) { tok.kind = TokenKind::LeftParen; ++p; }
      else if ( c == ')' ) { tok.kind = TokenKind::RightParen; ++p; }
      else if ( c == '|' ) { tok.kind = TokenKind::Pipe; ++p; }
      else if ( c == ',' ) { tok.kind = TokenKind::Comma; ++p; }
      else if ( c == '=' ) { tok.kind = TokenKind::Assign; ++p; }
      else if ( c == ':' ) {
        if ( p + 1 >= text.size() || text[p + 1] != '=' ) {
          fail( action_line, "expected :=" );
        }
        tok.kind = TokenKind::Declare;
        p += 2;
      }
      else if ( c == '$' ) {
        std::size_t q = p + 1;
        while ( q < text.size() && is_ident_char(text[q]) ) ++q;
        tok.kind = TokenKind::Variable;
        tok.text = text.substr( p, q - p );
        p = q;
      }
      else if ( c == '.' && p + 1 < text.size()
        && std::isdigit(static_cast< unsigned char >(text[p + 1])) == 0
        && is_ident_char(text[p + 1]) )
      {
        std::size_t q = p + 1;
        while ( q < text.size() && is_ident_char(text[q]) ) ++q;
        tok.kind = TokenKind::Field;
        tok.text = text.substr( p, q - p );
        p = q;
      }
      else if ( std::isdigit(static_cast< unsigned char >(c))
        || ( (c == '-' || c == '+' || c == '.') && p + 1 < text.size()
          && std::isdigit(static_cast< unsigned char >(text[p + 1])) ) )
      {
        std::size_t q = p + 1;
        while ( q < text.size() ) {
          const char d = text[ q ];
          const bool exponent_sign = ( d == '-' || d == '+' )
            && ( text[q - 1] == 'e' || text[q - 1] == 'E' )
            && text.compare( p, 2, "0x" ) != 0;
          if ( std::isalnum(static_cast< unsigned char >(d)) || d == '.'
            || d == '_' || exponent_sign )
          {
            ++q;
            continue;
          }
          break;
        }
        tok.kind = TokenKind::Number;
        tok.text = text.substr( p, q - p );
        p = q;
      }
      else if ( c == '.' ) { tok.kind = TokenKind::Dot; ++p; }
      else if ( is_ident_char(c) ) {
        std::size_t q = p;
        while ( q < text.size() && is_ident_char(text[q]) ) ++q;
        tok.text = text.substr( p, q - p );
        if ( tok.text == "true" || tok.text == "false" ) {
          tok.kind = TokenKind::Bool;
        }
        else if ( tok.text == "nil" ) tok.kind = TokenKind::Nil;
        else tok.kind = TokenKind::Identifier;
        p = q;
      }
      else {
        fail( action_line, std::string("unexpected character '") + c
          + "' in action" );
      }
      action.tokens.push_back( std::move(tok) );
    }

    if ( !closed ) fail( action_line, "unclosed action" );
    line += static_cast< int >(
      std::count( text.begin() + open, text.begin() + p, '\n' ) );
    chunks.push_back( std::move(action) );
    pos = p;
  }
  return chunks;
}

[[noreturn]] inline void scaffolder::internal::Parser::fail( int line,
  const std::string& msg ) const
{
  std::ostringstream oss;
  oss << "template: " << name_ << ':' << line << ": " << msg;
  throw Error( ErrorKind::Template, oss.str() );
}

inline bool scaffolder::internal::Parser::is_function(
  const std::string& fn_name ) const
{
  return funcs_.count( fn_name ) > 0 || builtin_functions().count( fn_name ) > 0;
}

inline std::vector< scaffolder::internal::Node >
  scaffolder::internal::Parser::parse()
{
  Stop stop;
  std::vector< Node > root = this->parse_list( stop );
  if ( !stop.keyword.empty() ) {
    fail( chunks_[stop.chunk].line, "unexpected {{" + stop.keyword + "}}" );
  }
  return root;
}

inline std::vector< scaffolder::internal::Node >
  scaffolder::internal::Parser::parse_list( Stop& stop )
{
  std::vector< Node > list;
  while ( next_ < chunks_.size() ) {
    const std::size_t index = next_++;
    const Chunk& c = chunks_[ index ];

    if ( !c.action ) {
      Node text;
      text.kind = NodeKind::Text;
      text.line = c.line;
      text.text = c.text;
      list.push_back( std::move(text) );
      continue;
    }
    if ( c.tokens.empty() ) fail( c.line, "missing value for command" );

    const Token& first = c.tokens.front();
    if ( first.kind == TokenKind::Identifier ) {
      const std::string& kw = first.text;
      if ( kw == "end" || kw == "else" ) {
        stop.keyword = kw;
        stop.chunk = index;
        return list;
      }
      if ( kw == "if" ) {
        list.push_back( this->parse_control(NodeKind::If, index, 1) );
        continue;
      }
      if ( kw == "range" ) {
        list.push_back( this->parse_control(NodeKind::Range, index, 1) );
        continue;
      }
      if ( kw == "with" ) {
        list.push_back( this->parse_control(NodeKind::With, index, 1) );
        continue;
      }
      if ( kw == "define" || kw == "template" || kw == "block"
        || kw == "break" || kw == "continue" )
      {
        fail( c.line, "unsupported action {{" + kw + "}}" );
      }
    }

    Node action;
    action.kind = NodeKind::Action;
    action.line = c.line;
    action.pipeline = this->parse_pipeline( c, 0, NodeKind::Action );
    list.push_back( std::move(action) );
  }
  stop.keyword.clear();
  return list;
}

inline scaffolder::internal::Node scaffolder::internal::Parser::parse_control(
  NodeKind kind, std::size_t chunk, std::size_t first )
{
  const std::string keyword = ( kind == NodeKind::If ? "if"
    : kind == NodeKind::Range ? "range" : "with" );

  Node node;
  node.kind = kind;
  node.line = chunks_[ chunk ].line;
  node.pipeline = this->parse_pipeline( chunks_[chunk], first, kind );

  Stop stop;
  node.list = this->parse_list( stop );

  if ( stop.keyword == "end" ) {
    if ( chunks_[stop.chunk].tokens.size() != 1 ) {
      fail( chunks_[stop.chunk].line, "unexpected tokens in {{end}}" );
    }
    return node;
  }
  if ( stop.keyword.empty() ) {
    fail( node.line, "unexpected EOF in {{" + keyword + "}}" );
  }

  // {{else}}, {{else if ...}} or {{else with ...}}
  const Chunk& e = chunks_[ stop.chunk ];
  if ( e.tokens.size() == 1 ) {
    Stop after;
    node.else_list = this->parse_list( after );
    if ( after.keyword != "end" ) {
      fail( e.line, "expected {{end}}; found "
        + ( after.keyword.empty() ? std::string("EOF")
          : "{{" + after.keyword + "}}" ) );
    }
    return node;
  }
  if ( kind != NodeKind::Range && e.tokens[1].kind == TokenKind::Identifier
    && e.tokens[1].text == keyword )
  {
    // The chained node consumes the shared {{end}}
    node.else_list.push_back( this->parse_control(kind, stop.chunk, 2) );
    return node;
  }
  fail( e.line, "unexpected tokens in {{else}}" );
}

inline scaffolder::internal::Pipeline
  scaffolder::internal::Parser::parse_pipeline( const Chunk& chunk,
    std::size_t first, NodeKind context )
{
  const auto& t = chunk.tokens;
  Pipeline pipe;
  std::size_t i = first;

  // Declarations: $x := ..., $x = ..., and in range $i, $e := ...
  if ( i < t.size() && t[i].kind == TokenKind::Variable ) {
    if ( i + 1 < t.size() && ( t[i + 1].kind == TokenKind::Declare
      || t[i + 1].kind == TokenKind::Assign ) )
    {
      pipe.variables.push_back( t[i].text );
      pipe.declare = ( t[i + 1].kind == TokenKind::Declare );
      i += 2;
    }
    else if ( context == NodeKind::Range && i + 3 < t.size()
      && t[i + 1].kind == TokenKind::Comma
      && t[i + 2].kind == TokenKind::Variable
      && t[i + 3].kind == TokenKind::Declare )
    {
      pipe.variables = { t[i].text, t[i + 2].text };
      pipe.declare = true;
      i += 4;
    }
  }
  if ( !pipe.variables.empty() && !pipe.declare
    && context == NodeKind::Range )
  {
    fail( chunk.line, "range can only declare variables with :=" );
  }
  if ( i >= t.size() ) fail( chunk.line, "missing value for command" );

  this->parse_commands( chunk, i, false, pipe );
  return pipe;
}

inline void scaffolder::internal::Parser::parse_commands( const Chunk& chunk,
  std::size_t& pos, bool nested, Pipeline& pipe )
{
  const auto& t = chunk.tokens;
  while ( true ) {
    Command cmd;
    while ( pos < t.size() && t[pos].kind != TokenKind::Pipe
      && t[pos].kind != TokenKind::RightParen )
    {
      cmd.operands.push_back( this->parse_operand(chunk, pos) );
    }
    if ( cmd.operands.empty() ) fail( chunk.line, "missing value for command" );
    pipe.commands.push_back( std::move(cmd) );

    if ( pos >= t.size() ) {
      if ( nested ) fail( chunk.line, "unclosed left paren" );
      return;
    }
    if ( t[pos].kind == TokenKind::Pipe ) {
      ++pos;
      continue;
    }
    // Right paren
    if ( !nested ) fail( chunk.line, "unexpected right paren" );
    ++pos;
    return;
  }
}

inline scaffolder::internal::Operand
  scaffolder::internal::Parser::parse_operand( const Chunk& chunk,
    std::size_t& pos )
{
  const auto& t = chunk.tokens;
  const Token& tok = t[ pos++ ];
  Operand op;

  switch ( tok.kind ) {
    case TokenKind::Dot:
      op.kind = Operand::Kind::Dot;
      break;
    case TokenKind::Field:
      op.kind = Operand::Kind::Field;
      op.fields.push_back( tok.text.substr(1) );
      break;
    case TokenKind::Variable:
      op.kind = Operand::Kind::Variable;
      op.name = tok.text;
      break;
    case TokenKind::Identifier:
      if ( tok.text == "if" || tok.text == "else" || tok.text == "end"
        || tok.text == "range" || tok.text == "with" )
      {
        fail( chunk.line, "unexpected keyword " + tok.text + " in command" );
      }
      if ( !this->is_function(tok.text) ) {
        fail( chunk.line, "function \"" + tok.text + "\" not defined" );
      }
      op.kind = Operand::Kind::Function;
      op.name = tok.text;
      break;
    case TokenKind::String:
      op.kind = Operand::Kind::Literal;
      op.literal = make_node_from( tok.text );
      break;
    case TokenKind::Bool:
      op.kind = Operand::Kind::Literal;
      op.literal = make_node_from( tok.text == "true" );
      break;
    case TokenKind::Nil:
      op.kind = Operand::Kind::Literal;
      break;
    case TokenKind::Number: {
      op.kind = Operand::Kind::Literal;
      const std::string& s = tok.text;
      const bool hex = s.find( "0x" ) != std::string::npos
        || s.find( "0X" ) != std::string::npos;
      const bool is_float = !hex && s.find_first_of( ".eE" ) != std::string::npos;
      try {
        std::size_t used = 0;
        if ( is_float ) {
          op.literal = make_node_from( std::stod(s, &used) );
        }
        else {
          op.literal = make_node_from< std::int64_t >( std::stoll(s, &used, 0) );
        }
        if ( used != s.size() ) throw std::invalid_argument( s );
      }
      catch ( const std::exception& ) {
        fail( chunk.line, "bad number syntax: " + s );
      }
      break;
    }
    case TokenKind::LeftParen:
      op.kind = Operand::Kind::Nested;
      op.nested = std::make_shared< Pipeline >();
      this->parse_commands( chunk, pos, true, *op.nested );
      break;
    default:
      fail( chunk.line, "unexpected token in operand" );
  }

  // Field chains: .A.B, $x.A, (pipeline).A
  if ( op.kind == Operand::Kind::Field || op.kind == Operand::Kind::Variable
    || op.kind == Operand::Kind::Nested )
  {
    while ( pos < t.size() && t[pos].kind == TokenKind::Field
      && !t[pos].spaced )
    {
      op.fields.push_back( t[pos].text.substr(1) );
      ++pos;
    }
  }
  return op;
}

[[noreturn]] inline void scaffolder::internal::Executor::fail( int line,
  const std::string& msg ) const
{
  std::ostringstream oss;
  oss << "template: " << name_ << ':' << line << ": " << msg;
  throw Error( ErrorKind::Template, oss.str() );
}

inline void scaffolder::internal::Executor::run( const std::vector< Node >& list,
  const ordered_node& dot, std::string& out )
{
  for ( const Node& node : list ) {
    switch ( node.kind ) {
      case NodeKind::Text:
        out += node.text;
        break;

      case NodeKind::Action: {
        ordered_node v = this->eval_pipeline( node.pipeline, dot, node.line,
          true );
        // Declarations print nothing
        if ( node.pipeline.variables.empty() ) out += format_value( v );
        break;
      }

      case NodeKind::If: {
        const std::size_t mark = vars_.size();
        ordered_node v = this->eval_pipeline( node.pipeline, dot, node.line,
          true );
        this->run( is_truthy(v) ? node.list : node.else_list, dot, out );
        vars_.resize( mark );
        break;
      }

      case NodeKind::With: {
        const std::size_t mark = vars_.size();
        ordered_node v = this->eval_pipeline( node.pipeline, dot, node.line,
          true );
        if ( is_truthy(v) ) this->run( node.list, v, out );
        else this->run( node.else_list, dot, out );
        vars_.resize( mark );
        break;
      }

      case NodeKind::Range:
        this->run_range( node, dot, out );
        break;
    }
  }
}

inline void scaffolder::internal::Executor::run_range( const Node& node,
  const ordered_node& dot, std::string& out )
{
  const std::size_t mark = vars_.size();
  const ordered_node v = this->eval_pipeline( node.pipeline, dot, node.line,
    false );
  const auto& decl = node.pipeline.variables;

  auto iteration = [&]( const ordered_node& key, const ordered_node& elem ) {
    if ( decl.size() == 1 ) vars_.push_back( { decl[0], elem } );
    if ( decl.size() == 2 ) {
      vars_.push_back( { decl[0], key } );
      vars_.push_back( { decl[1], elem } );
    }
    this->run( node.list, elem, out );
    vars_.resize( mark );
  };

  std::size_t count = 0;
  if ( v.is_sequence() ) {
    for ( std::size_t i = 0; i < v.size(); ++i, ++count ) {
      iteration( make_node_from< std::int64_t >(
        static_cast< std::int64_t >(i) ), v.at(i) );
    }
  }
  else if ( v.is_mapping() ) {
    for ( const auto& [k, elem] : sorted_items(v) ) {
      iteration( make_node_from(k), elem );
      ++count;
    }
  }
  else if ( v.is_integer() ) {
    const std::int64_t n = v.get_value< std::int64_t >();
    for ( std::int64_t i = 0; i < n; ++i, ++count ) {
      const ordered_node idx = make_node_from< std::int64_t >( i );
      iteration( idx, idx );
    }
  }
  else if ( !v.is_null() ) {
    fail( node.line, "range can't iterate over " + format_value(v) );
  }

  if ( count == 0 ) this->run( node.else_list, dot, out );
  vars_.resize( mark );
}

inline scaffolder::ordered_node scaffolder::internal::Executor::eval_pipeline(
  const Pipeline& pipe, const ordered_node& dot, int line, bool bind )
{
  ordered_node value;
  bool have = false;
  for ( const Command& cmd : pipe.commands ) {
    value = this->eval_command( cmd, dot, have ? &value : nullptr, line );
    have = true;
  }
  if ( bind ) {
    for ( const std::string& var : pipe.variables ) {
      if ( pipe.declare ) vars_.push_back( { var, value } );
      else this->lookup_var( var, line ) = value;
    }
  }
  return value;
}

inline scaffolder::ordered_node scaffolder::internal::Executor::eval_command(
  const Command& cmd, const ordered_node& dot, const ordered_node* final,
  int line )
{
  const Operand& head = cmd.operands.front();
  if ( head.kind == Operand::Kind::Function ) {
    std::vector< ordered_node > args;
    args.reserve( cmd.operands.size() );
    for ( std::size_t i = 1; i < cmd.operands.size(); ++i ) {
      args.push_back( this->eval_operand(cmd.operands[i], dot, line) );
    }
    if ( final ) args.push_back( *final );
    return this->call( head.name, args, line );
  }

  if ( cmd.operands.size() > 1 || final ) {
    fail( line, "can't give argument to non-function" );
  }
  return this->eval_operand( head, dot, line );
}

inline scaffolder::ordered_node scaffolder::internal::Executor::eval_operand(
  const Operand& op, const ordered_node& dot, int line )
{
  switch ( op.kind ) {
    case Operand::Kind::Dot:
      return dot;
    case Operand::Kind::Field:
      return this->eval_fields( dot, op.fields, line );
    case Operand::Kind::Variable:
      return this->eval_fields( this->lookup_var(op.name, line), op.fields,
        line );
    case Operand::Kind::Function:
      // A function in argument position is called without arguments
      return this->call( op.name, {}, line );
    case Operand::Kind::Literal:
      return op.literal;
    case Operand::Kind::Nested:
      return this->eval_fields(
        this->eval_pipeline(*op.nested, dot, line, false), op.fields, line );
  }
  return ordered_node();
}

inline scaffolder::ordered_node scaffolder::internal::Executor::eval_fields(
  ordered_node receiver, const std::vector< std::string >& fields, int line )
{
  for ( const std::string& field : fields ) {
    // Missing keys and fields of missing values yield null
    if ( receiver.is_null() ) continue;
    if ( !receiver.is_mapping() ) {
      fail( line, "can't evaluate field " + field + " in type "
        + type_name(receiver) );
    }
    if ( receiver.contains(field) ) {
      ordered_node next = receiver.at( field );
      receiver = next;
    }
    else {
      receiver = ordered_node();
    }
  }
  return receiver;
}

inline scaffolder::ordered_node scaffolder::internal::Executor::call(
  const std::string& fn_name, const std::vector< ordered_node >& args,
  int line )
{
  // User functions shadow builtins of the same name
  const Function* fn = nullptr;
  auto it = funcs_.find( fn_name );
  if ( it != funcs_.end() ) fn = &it->second;
  else {
    const FunctionMap& builtins = builtin_functions();
    auto bit = builtins.find( fn_name );
    if ( bit != builtins.end() ) fn = &bit->second;
  }
  if ( !fn || !*fn ) fail( line, "function \"" + fn_name + "\" not defined" );

  try {
    return ( *fn )( args );
  }
  catch ( const std::exception& ex ) {
    fail( line, "error calling " + fn_name + ": " + ex.what() );
  }
}

inline scaffolder::ordered_node& scaffolder::internal::Executor::lookup_var(
  const std::string& var_name, int line )
{
  for ( auto it = vars_.rbegin(); it != vars_.rend(); ++it ) {
    if ( it->name == var_name ) return it->value;
  }
  fail( line, "undefined variable: " + var_name );
}

inline scaffolder::Template scaffolder::Template::parse(
  const std::string& name, const std::string& text, const FunctionMap& funcs )
{
  internal::Parser parser( name, internal::lex_template(name, text), funcs );
  std::vector< internal::Node > root = parser.parse();
  return Template( name, std::move(root), funcs );
}

inline std::string scaffolder::Template::execute(
  const ordered_node& data ) const
{
  std::string out;
  internal::Executor exec( name_, funcs_, data );
  exec.run( root_, data, out );
  return out;
}

inline std::string scaffolder::evaluate( const std::string& name,
  const std::string& text, const ordered_node& data, const FunctionMap& funcs )
{
  return Template::parse( name, text, funcs ).execute( data );
}

namespace scaffolder::internal {

  inline void require_args( const std::string& fn_name,
    const std::vector< ordered_node >& args, std::size_t min,
    std::size_t max )
  {
    if ( args.size() < min || args.size() > max ) {
      std::ostringstream oss;
      oss << "wrong number of args for " << fn_name << ": want ";
      if ( min == max ) oss << min;
      else if ( max == SIZE_MAX ) oss << "at least " << min;
      else oss << min << " to " << max;
      oss << " got " << args.size();
      throw std::runtime_error( oss.str() );
    }
  }

  inline bool basic_equal( const ordered_node& a, const ordered_node& b ) {
    if ( a.is_null() || b.is_null() ) return a.is_null() && b.is_null();
    if ( a.is_integer() && b.is_integer() ) {
      return a.get_value< std::int64_t >() == b.get_value< std::int64_t >();
    }
    if ( is_number(a) && is_number(b) ) return to_double( a ) == to_double( b );
    if ( a.is_string() && b.is_string() ) {
      return a.get_value< std::string >() == b.get_value< std::string >();
    }
    if ( a.is_boolean() && b.is_boolean() ) {
      return a.get_value< bool >() == b.get_value< bool >();
    }
    if ( a.is_sequence() || a.is_mapping() || b.is_sequence()
      || b.is_mapping() )
    {
      throw std::runtime_error( "non-comparable type " + type_name(
        a.is_sequence() || a.is_mapping() ? a : b ) );
    }
    throw std::runtime_error( "incompatible types for comparison: "
      + type_name(a) + " and " + type_name(b) );
  }

  inline bool basic_less( const ordered_node& a, const ordered_node& b ) {
    if ( a.is_integer() && b.is_integer() ) {
      return a.get_value< std::int64_t >() < b.get_value< std::int64_t >();
    }
    if ( is_number(a) && is_number(b) ) return to_double( a ) < to_double( b );
    if ( a.is_string() && b.is_string() ) {
      return a.get_value< std::string >() < b.get_value< std::string >();
    }
    throw std::runtime_error( "incompatible types for comparison: "
      + type_name(a) + " and " + type_name(b) );
  }

  inline std::string quote( const std::string& s ) {
    std::string out = "\"";
    for ( char c : s ) {
      switch ( c ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
      }
    }
    return out + '"';
  }

  // printf with the verbs %s %d %v %q %t %f %x and %%
  inline std::string sprintf_values( const std::string& format,
    const std::vector< ordered_node >& args )
  {
    std::string out;
    std::size_t next = 0;
    for ( std::size_t i = 0; i < format.size(); ++i ) {
      const char c = format[ i ];
      if ( c != '%' || i + 1 >= format.size() ) {
        out += c;
        continue;
      }
      const char verb = format[ ++i ];
      if ( verb == '%' ) {
        out += '%';
        continue;
      }
      if ( next >= args.size() ) {
        out += std::string( "%!" ) + verb + "(MISSING)";
        continue;
      }
      const ordered_node& arg = args[ next++ ];
      switch ( verb ) {
        case 'v':
        case 's':
          out += format_value( arg );
          break;
        case 'q':
          out += quote( arg.is_string() ? arg.get_value< std::string >()
            : format_value(arg) );
          break;
        case 'd':
          if ( arg.is_integer() ) out += to_string_any( arg );
          else out += "%!d(" + type_name( arg ) + '=' + format_value( arg ) + ')';
          break;
        case 't':
          if ( arg.is_boolean() ) out += to_string_any( arg );
          else out += "%!t(" + type_name( arg ) + '=' + format_value( arg ) + ')';
          break;
        case 'f':
          if ( is_number(arg) ) {
            const double v = to_double( arg );
            const int n = std::snprintf( nullptr, 0, "%f", v );
            std::string buf( static_cast< std::size_t >( n ) + 1, '\0' );
            std::snprintf( &buf[0], buf.size(), "%f", v );
            buf.resize( static_cast< std::size_t >( n ) );
            out += buf;
          }
          else out += "%!f(" + type_name( arg ) + '=' + format_value( arg ) + ')';
          break;
        case 'x':
          if ( arg.is_integer() ) {
            std::ostringstream oss;
            oss << std::hex << arg.get_value< std::int64_t >();
            out += oss.str();
          }
          else if ( arg.is_string() ) {
            static const char* digits = "0123456789abcdef";
            for ( unsigned char b : arg.get_value< std::string >() ) {
              out += digits[ b >> 4 ];
              out += digits[ b & 0xf ];
            }
          }
          else out += "%!x(" + type_name( arg ) + '=' + format_value( arg ) + ')';
          break;
        default:
          out += std::string( "%!" ) + verb + '(' + type_name( arg ) + '='
            + format_value( arg ) + ')';
      }
    }
    return out;
  }

} // namespace scaffolder::internal

// Functions available to every template. Entries of the same name in a
// caller's function table take precedence.
inline const scaffolder::FunctionMap& scaffolder::internal::builtin_functions()
{
  static const FunctionMap builtins = {
    { "and", []( const std::vector< ordered_node >& args ) {
        require_args( "and", args, 1, SIZE_MAX );
        for ( const auto& a : args ) if ( !is_truthy(a) ) return a;
        return args.back();
      } },
    { "or", []( const std::vector< ordered_node >& args ) {
        require_args( "or", args, 1, SIZE_MAX );
        for ( const auto& a : args ) if ( is_truthy(a) ) return a;
        return args.back();
      } },
    { "not", []( const std::vector< ordered_node >& args ) {
        require_args( "not", args, 1, 1 );
        return make_node_from( !is_truthy(args[0]) );
      } },
    { "eq", []( const std::vector< ordered_node >& args ) {
        require_args( "eq", args, 2, SIZE_MAX );
        for ( std::size_t i = 1; i < args.size(); ++i ) {
          if ( basic_equal(args[0], args[i]) ) return make_node_from( true );
        }
        return make_node_from( false );
      } },
    { "ne", []( const std::vector< ordered_node >& args ) {
        require_args( "ne", args, 2, 2 );
        return make_node_from( !basic_equal(args[0], args[1]) );
      } },
    { "lt", []( const std::vector< ordered_node >& args ) {
        require_args( "lt", args, 2, 2 );
        return make_node_from( basic_less(args[0], args[1]) );
      } },
    { "le", []( const std::vector< ordered_node >& args ) {
        require_args( "le", args, 2, 2 );
        return make_node_from( !basic_less(args[1], args[0]) );
      } },
    { "gt", []( const std::vector< ordered_node >& args ) {
        require_args( "gt", args, 2, 2 );
        return make_node_from( basic_less(args[1], args[0]) );
      } },
    { "ge", []( const std::vector< ordered_node >& args ) {
        require_args( "ge", args, 2, 2 );
        return make_node_from( !basic_less(args[0], args[1]) );
      } },
    { "len", []( const std::vector< ordered_node >& args ) {
        require_args( "len", args, 1, 1 );
        const ordered_node& a = args[ 0 ];
        std::int64_t n = 0;
        if ( a.is_string() ) {
          n = static_cast< std::int64_t >( a.get_value< std::string >().size() );
        }
        else if ( a.is_sequence() || a.is_mapping() ) {
          n = static_cast< std::int64_t >( a.size() );
        }
        else throw std::runtime_error( "len of type " + type_name(a) );
        return make_node_from< std::int64_t >( n );
      } },
    { "index", []( const std::vector< ordered_node >& args ) {
        require_args( "index", args, 1, SIZE_MAX );
        ordered_node item = args[ 0 ];
        for ( std::size_t i = 1; i < args.size(); ++i ) {
          const ordered_node& idx = args[ i ];
          if ( item.is_sequence() ) {
            if ( !idx.is_integer() ) {
              throw std::runtime_error( "cannot index slice with "
                + type_name(idx) );
            }
            const std::int64_t k = idx.get_value< std::int64_t >();
            if ( k < 0 || static_cast< std::size_t >( k ) >= item.size() ) {
              throw std::runtime_error( "index out of range: "
                + std::to_string(k) );
            }
            ordered_node next = item.at( static_cast< std::size_t >(k) );
            item = next;
          }
          else if ( item.is_mapping() ) {
            const std::string key = key_string( idx );
            if ( item.contains(key) ) {
              ordered_node next = item.at( key );
              item = next;
            }
            else item = ordered_node();
          }
          else if ( item.is_null() ) {
            throw std::runtime_error( "index of untyped nil" );
          }
          else {
            throw std::runtime_error( "can't index item of type "
              + type_name(item) );
          }
        }
        return item;
      } },
    { "print", []( const std::vector< ordered_node >& args ) {
        // Operands are separated by a space when neither is a string
        std::string out;
        for ( std::size_t i = 0; i < args.size(); ++i ) {
          if ( i && !args[i - 1].is_string() && !args[i].is_string() ) {
            out += ' ';
          }
          out += format_value( args[i], true );
        }
        return make_node_from( out );
      } },
    { "println", []( const std::vector< ordered_node >& args ) {
        std::string out;
        for ( std::size_t i = 0; i < args.size(); ++i ) {
          if ( i ) out += ' ';
          out += format_value( args[i], true );
        }
        return make_node_from( out + '\n' );
      } },
    { "printf", []( const std::vector< ordered_node >& args ) {
        require_args( "printf", args, 1, SIZE_MAX );
        if ( !args[0].is_string() ) {
          throw std::runtime_error( "printf format must be a string" );
        }
        return make_node_from( sprintf_values(
          args[0].get_value< std::string >(),
          std::vector< ordered_node >( args.begin() + 1, args.end() ) ) );
      } },
  };
  return builtins;
}

// Split an identifier-like string into words at separators, lower-to-upper
// transitions, letter/digit transitions and the end of an acronym run
// ("HTTPServer" -> "HTTP", "Server").
inline std::vector< std::string > scaffolder::internal::split_words(
  const std::string& s )
{
  std::vector< std::string > words;
  std::string current;
  auto flush = [&]() {
    if ( !current.empty() ) words.push_back( std::move(current) );
    current.clear();
  };

  for ( std::size_t i = 0; i < s.size(); ++i ) {
    const unsigned char c = static_cast< unsigned char >( s[i] );
    if ( !std::isalnum(c) ) {
      flush();
      continue;
    }
    if ( !current.empty() ) {
      const unsigned char prev = static_cast< unsigned char >( s[i - 1] );
      const bool lower_to_upper = std::islower( prev ) && std::isupper( c );
      const bool digit_change = ( std::isdigit(prev) != 0 )
        != ( std::isdigit(c) != 0 );
      const bool acronym_end = std::isupper( prev ) && std::isupper( c )
        && i + 1 < s.size()
        && std::islower( static_cast< unsigned char >(s[i + 1]) );
      if ( lower_to_upper || digit_change || acronym_end ) flush();
    }
    current += static_cast< char >( c );
  }
  flush();
  return words;
}

namespace scaffolder::internal {

  inline std::string lower( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::tolower(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  inline std::string upper( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::toupper(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  inline std::string capitalize( const std::string& word ) {
    std::string s = lower( word );
    if ( !s.empty() ) {
      s[ 0 ] = static_cast< char >(
        std::toupper(static_cast< unsigned char >(s[0])) );
    }
    return s;
  }

  inline std::string join_words( const std::string& s, const std::string& sep,
    std::string (*transform)( std::string ) )
  {
    std::string out;
    for ( const auto& word : split_words(s) ) {
      if ( !out.empty() ) out += sep;
      out += transform( word );
    }
    return out;
  }

  inline std::string camel( const std::string& s, bool lower_first ) {
    std::string out;
    for ( const auto& word : split_words(s) ) {
      out += ( out.empty() && lower_first ) ? lower( word ) : capitalize( word );
    }
    return out;
  }

  // Upper-case the first letter of every word, leaving the rest alone
  inline std::string title( std::string s ) {
    bool at_start = true;
    for ( char& c : s ) {
      const unsigned char u = static_cast< unsigned char >( c );
      if ( std::isalnum(u) || c == '\'' ) {
        if ( at_start ) c = static_cast< char >( std::toupper(u) );
        at_start = false;
      }
      else {
        at_start = true;
      }
    }
    return s;
  }

  // Adapt a string transform to the template calling convention
  inline Function string_function( const std::string& fn_name,
    std::function< std::string( const std::string& ) > fn )
  {
    return [fn_name, fn]( const std::vector< ordered_node >& args ) {
      require_args( fn_name, args, 1, 1 );
      if ( args[0].is_sequence() || args[0].is_mapping() ) {
        throw std::runtime_error( fn_name + " expects a scalar, got "
          + type_name(args[0]) );
      }
      const std::string in = args[ 0 ].is_null() ? std::string()
        : to_string_any( args[0] );
      return make_node_from( fn(in) );
    };
  }

} // namespace scaffolder::internal

inline scaffolder::FunctionMap scaffolder::text_functions() {
  using internal::join_words;
  using internal::string_function;
  return {
    { "snake", string_function( "snake", []( const std::string& s ) {
        return join_words( s, "_", internal::lower ); } ) },
    { "screamingSnake", string_function( "screamingSnake",
      []( const std::string& s ) {
        return join_words( s, "_", internal::upper ); } ) },
    { "kebab", string_function( "kebab", []( const std::string& s ) {
        return join_words( s, "-", internal::lower ); } ) },
    { "screamingKebab", string_function( "screamingKebab",
      []( const std::string& s ) {
        return join_words( s, "-", internal::upper ); } ) },
    { "camel", string_function( "camel", []( const std::string& s ) {
        return internal::camel( s, false ); } ) },
    { "lowerCamel", string_function( "lowerCamel", []( const std::string& s ) {
        return internal::camel( s, true ); } ) },
    { "upper", string_function( "upper", []( const std::string& s ) {
        return internal::upper( s ); } ) },
    { "lower", string_function( "lower", []( const std::string& s ) {
        return internal::lower( s ); } ) },
    { "title", string_function( "title", []( const std::string& s ) {
        return internal::title( s ); } ) },
  };
}

// Read from an input stream until end-of-file, then parse the document
inline scaffolder::ordered_node scaffolder::load_context( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();

  // An empty document yields an empty mapping
  if ( text.find_first_not_of(" \t\r\n") == std::string::npos ) {
    return ordered_node::mapping();
  }
  try {
    ordered_node doc = ordered_node::deserialize( text );
    if ( doc.is_null() ) return ordered_node::mapping();
    return doc;
  }
  catch ( const std::exception& ex ) {
    throw Error( ErrorKind::Config,
      std::string("failed to parse context: ") + ex.what() );
  }
}

inline scaffolder::ordered_node scaffolder::load_context_file(
  const std::filesystem::path& path )
{
  std::ifstream in( path, std::ios::binary );
  if ( !in ) {
    std::ostringstream oss;
    oss << "failed to open context file " << path;
    throw Error( ErrorKind::Config, oss.str() );
  }
  try {
    return load_context( in );
  }
  catch ( const Error& ex ) {
    std::ostringstream oss;
    oss << path.string() << ": " << ex.what();
    throw Error( ex.kind(), oss.str() );
  }
}

// Entries of a directory are visited in file name order
inline void scaffolder::walk_dir( const std::filesystem::path& dir,
  const WalkFunction& fn )
{
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::directory_entry root( dir, ec );
  if ( ec || !root.exists() ) {
    internal::throw_filesystem_error( "failed to stat", dir,
      ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory) );
  }
  if ( fn(dir, root) == WalkAction::Skip ) return;

  std::vector< fs::directory_entry > entries;
  fs::directory_iterator it( dir, ec );
  if ( ec ) internal::throw_filesystem_error( "failed to read directory", dir,
    ec );
  for ( ; it != fs::directory_iterator(); it.increment(ec) ) {
    entries.push_back( *it );
  }
  if ( ec ) internal::throw_filesystem_error( "failed to read directory", dir,
    ec );
  std::sort( entries.begin(), entries.end(),
    []( const fs::directory_entry& a, const fs::directory_entry& b ) {
      return a.path().filename() < b.path().filename();
    } );

  for ( const auto& entry : entries ) {
    // Symlinks to directories are reported as entries, not followed
    const fs::file_status status = entry.symlink_status( ec );
    if ( ec ) internal::throw_filesystem_error( "failed to stat", entry.path(),
      ec );
    if ( fs::is_directory(status) ) {
      walk_dir( entry.path(), fn );
    }
    else {
      fn( entry.path(), entry );
    }
  }
}

inline void scaffolder::DeferredSymlinks::defer(
  const std::filesystem::path& link, const std::filesystem::path& target )
{
  pending_[ link ] = target;
}

inline void scaffolder::DeferredSymlinks::apply() {
  namespace fs = std::filesystem;
  std::vector< fs::path > created;
  while ( !pending_.empty() ) {
    std::vector< fs::path > in_progress;
    this->resolve( pending_.begin()->first, in_progress, created );
  }

  // A link may reach another link through a linked directory, so nothing
  // can be checked until every link exists
  for ( const auto& link : created ) {
    std::error_code ec;
    const fs::file_status st = fs::status( link, ec );
    if ( ec == std::errc::too_many_symbolic_link_levels ) {
      std::ostringstream oss;
      oss << "symlink cycle: " << link << " -> " << fs::read_symlink( link, ec );
      throw Error( ErrorKind::Filesystem, oss.str() );
    }
    if ( !fs::exists(st) ) {
      std::error_code target_ec;
      std::ostringstream oss;
      oss << "symlink " << link << " -> " << fs::read_symlink( link, target_ec )
        << " does not resolve to a generated or existing path";
      throw Error( ErrorKind::Filesystem, oss.str() );
    }
  }
}

// Create link after everything its target depends on. Each ancestor
// directory of the target, and then the target itself, is resolved first
// when it is another pending link. link is taken by value because it may
// name the map entry erased below.
inline void scaffolder::DeferredSymlinks::resolve( std::filesystem::path link,
  std::vector< std::filesystem::path >& in_progress,
  std::vector< std::filesystem::path >& created )
{
  namespace fs = std::filesystem;
  auto it = pending_.find( link );
  if ( it == pending_.end() ) return;

  if ( std::find(in_progress.begin(), in_progress.end(), link)
    != in_progress.end() )
  {
    std::ostringstream oss;
    oss << "symlink cycle: ";
    for ( const auto& p : in_progress ) oss << p.string() << " -> ";
    oss << link.string();
    throw Error( ErrorKind::Filesystem, oss.str() );
  }

  const fs::path target = it->second;
  const fs::path target_path
    = ( link.parent_path() / target ).lexically_normal();

  in_progress.push_back( link );
  fs::path prefix;
  for ( const auto& part : target_path ) {
    prefix /= part;
    this->resolve( prefix, in_progress, created );
  }
  in_progress.pop_back();
  pending_.erase( link );

  std::error_code ec;
  const fs::file_status existing = fs::symlink_status( link, ec );
  if ( fs::exists(existing) ) {
    fs::remove( link, ec );
    if ( ec ) internal::throw_filesystem_error(
      "failed to remove existing entry at", link, ec );
  }
  fs::create_symlink( target, link, ec );
  if ( ec ) internal::throw_filesystem_error( "failed to create symlink", link,
    ec );
  created.push_back( link );
}

inline scaffolder::Scaffolder::Scaffolder() {
  // Only callable while a path name is evaluated; the walk installs a
  // capturing version for each entry
  funcs_[ internal::DIR_FUNCTION ] = []( const std::vector< ordered_node >& ) {
    throw std::runtime_error( internal::DIR_FUNCTION
      + " can only be used in file and directory names" );
    return ordered_node();
  };
}

inline scaffolder::Scaffolder& scaffolder::Scaffolder::functions(
  const FunctionMap& funcs )
{
  for ( const auto& [k, v] : funcs ) funcs_[ k ] = v;
  return *this;
}

inline scaffolder::Scaffolder& scaffolder::Scaffolder::extend(
  std::shared_ptr< Extension > plugin )
{
  plugins_.push_back( std::move(plugin) );
  return *this;
}

inline scaffolder::Scaffolder& scaffolder::Scaffolder::exclude(
  const std::vector< std::string >& patterns )
{
  exclude_.insert( exclude_.end(), patterns.begin(), patterns.end() );
  return *this;
}

inline scaffolder::Scaffolder& scaffolder::Scaffolder::after_each(
  std::function< void( const std::filesystem::path& ) > fn )
{
  plugins_.push_back( std::make_shared< AfterEachFunc >( std::move(fn) ) );
  return *this;
}

inline scaffolder::Scaffolder& scaffolder::Scaffolder::template_suffix(
  std::string suffix )
{
  suffix_ = std::move( suffix );
  return *this;
}

inline void scaffolder::Scaffolder::scaffold(
  const std::filesystem::path& source,
  const std::filesystem::path& destination, const ordered_node& context )
{
  // Rebuild default session state for this call
  session_ = ScaffoldSession();
  session_.config.context = context;
  session_.config.functions = funcs_;
  session_.config.exclude = exclude_;
  session_.config.source_ = internal::clean_root( source );
  session_.config.target_ = internal::clean_root( destination );

  // 1) Extensions mutate the configuration before anything is written
  this->run_extend_phase();

  // 2) Exclusion patterns are validated up front
  this->compile_exclusions();

  // 3) Walk the source tree, deferring symlinks
  DeferredSymlinks symlinks;
  this->scaffold_directory( session_.config.source(), session_.config.target(),
    session_.config.context, symlinks );

  // 4) Create the symlinks now that their targets exist
  symlinks.apply();
}

inline void scaffolder::Scaffolder::run_extend_phase() {
  for ( const auto& plugin : plugins_ ) {
    try {
      plugin->extend( session_.config );
    }
    catch ( const std::exception& ex ) {
      throw Error( ErrorKind::Extension,
        std::string("failed to extend scaffolder: ") + ex.what() );
    }
  }
}

inline void scaffolder::Scaffolder::compile_exclusions() {
  for ( const auto& pattern : session_.config.exclude ) {
    try {
      session_.exclusions.emplace_back( pattern, std::regex(pattern) );
    }
    catch ( const std::regex_error& ex ) {
      std::ostringstream oss;
      oss << "invalid exclude pattern \"" << pattern << "\": " << ex.what();
      throw Error( ErrorKind::Config, oss.str() );
    }
  }
}

inline bool scaffolder::Scaffolder::is_excluded(
  const std::string& rel_path ) const
{
  for ( const auto& [pattern, re] : session_.exclusions ) {
    if ( std::regex_search(rel_path, re) ) return true;
  }
  return false;
}

inline std::string scaffolder::Scaffolder::strip_suffix(
  const std::string& name ) const
{
  if ( suffix_.empty() || name.size() <= suffix_.size() ) return name;
  if ( name.compare(name.size() - suffix_.size(), suffix_.size(), suffix_)
    != 0 )
  {
    return name;
  }
  return name.substr( 0, name.size() - suffix_.size() );
}

// One level of the tree. The walk visits src_dir itself, then each child;
// child directories are recursed into by materialize() with their own
// destination and context, so the walker is told to skip them.
inline void scaffolder::Scaffolder::scaffold_directory(
  const std::filesystem::path& src_dir, const std::filesystem::path& dst_dir,
  const ordered_node& ctx, DeferredSymlinks& symlinks )
{
  namespace fs = std::filesystem;
  walk_dir( src_dir, [&]( const fs::path& src_path,
    const fs::directory_entry& entry )
  {
    if ( src_path == src_dir ) {
      std::error_code ec;
      if ( fs::create_directories(dst_dir, ec) ) {
        fs::permissions( dst_dir, fs::perms::owner_all,
          fs::perm_options::replace, ec );
      }
      if ( ec ) internal::throw_filesystem_error(
        "failed to create directory", dst_dir, ec );
      return WalkAction::Continue;
    }
    this->scaffold_entry( src_path, entry, dst_dir, ctx, symlinks );
    return WalkAction::Skip;
  } );
}

inline void scaffolder::Scaffolder::scaffold_entry(
  const std::filesystem::path& src_path,
  const std::filesystem::directory_entry& entry,
  const std::filesystem::path& dst_dir, const ordered_node& ctx,
  DeferredSymlinks& symlinks )
{
  const std::string rel_path
    = src_path.lexically_relative( session_.config.source() ).generic_string();
  if ( this->is_excluded(rel_path) ) return;

  // Fresh function table per entry; dir() records (name, context) pairs
  // for this entry only
  std::vector< std::pair< std::string, ordered_node > > fan_out;
  FunctionMap funcs = session_.config.functions;
  funcs[ internal::DIR_FUNCTION ] = [&fan_out](
    const std::vector< ordered_node >& args )
  {
    internal::require_args( internal::DIR_FUNCTION, args, 2, 2 );
    if ( !args[0].is_string() ) {
      throw std::runtime_error( "dir name must be a string, got "
        + internal::type_name(args[0]) );
    }
    const std::string name = args[ 0 ].get_value< std::string >();
    auto it = std::find_if( fan_out.begin(), fan_out.end(),
      [&]( const auto& p ) { return p.first == name; } );
    if ( it != fan_out.end() ) it->second = args[ 1 ];
    else fan_out.emplace_back( name, args[1] );
    return internal::make_node_from( name + internal::FAN_OUT_SEPARATOR );
  };

  std::string dst_name;
  try {
    dst_name = evaluate( src_path.string(), src_path.filename().string(), ctx,
      funcs );
  }
  catch ( const Error& ex ) {
    std::ostringstream oss;
    oss << "failed to evaluate path name \"" << rel_path << "\": "
      << ex.what();
    throw Error( ex.kind(), oss.str() );
  }

  // Rendering a name to nothing omits the entry (and its subtree)
  if ( dst_name.empty() ) return;

  if ( fan_out.empty() ) {
    this->materialize( src_path, entry, dst_dir / this->strip_suffix(dst_name),
      ctx, symlinks );
    return;
  }
  for ( const auto& [name, sub_ctx] : fan_out ) {
    this->materialize( src_path, entry, dst_dir / this->strip_suffix(name),
      sub_ctx, symlinks );
  }
}

inline void scaffolder::Scaffolder::materialize(
  const std::filesystem::path& src_path,
  const std::filesystem::directory_entry& entry,
  const std::filesystem::path& dst_path, const ordered_node& ctx,
  DeferredSymlinks& symlinks )
{
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::file_status status = entry.symlink_status( ec );
  if ( ec ) internal::throw_filesystem_error( "failed to get file info",
    src_path, ec );

  if ( fs::is_symlink(status) ) {
    const fs::path raw = fs::read_symlink( src_path, ec );
    if ( ec ) internal::throw_filesystem_error( "failed to read symlink",
      src_path, ec );

    std::string target;
    try {
      target = evaluate( src_path.string(), raw.string(), ctx,
        session_.config.functions );
    }
    catch ( const Error& ex ) {
      throw Error( ex.kind(),
        std::string("failed to evaluate symlink target: ") + ex.what() );
    }

    // Links are always relative to their own directory
    fs::path link_target( target );
    if ( link_target.is_absolute() ) {
      link_target = link_target.lexically_relative( dst_path.parent_path() );
      if ( link_target.empty() ) {
        std::ostringstream oss;
        oss << "failed to make symlink target " << target << " relative to "
          << dst_path.parent_path();
        throw Error( ErrorKind::Filesystem, oss.str() );
      }
    }
    symlinks.defer( dst_path, link_target );
    return;
  }

  if ( fs::is_directory(status) ) {
    if ( fs::create_directories(dst_path, ec) ) {
      fs::permissions( dst_path, fs::perms::owner_all,
        fs::perm_options::replace, ec );
    }
    if ( ec ) internal::throw_filesystem_error( "failed to create directory",
      dst_path, ec );
    this->run_after_each( dst_path );
    this->scaffold_directory( src_path, dst_path, ctx, symlinks );
    return;
  }

  if ( fs::is_regular_file(status) ) {
    std::ifstream in( src_path, std::ios::binary );
    if ( !in ) internal::throw_filesystem_error( "failed to read file",
      src_path, std::make_error_code(std::errc::io_error) );
    std::ostringstream raw;
    raw << in.rdbuf();

    std::string content;
    try {
      content = evaluate( src_path.string(), raw.str(), ctx,
        session_.config.functions );
    }
    catch ( const Error& ex ) {
      throw Error( ex.kind(), src_path.string()
        + ": failed to evaluate template: " + ex.what() );
    }

    // A previous run may have left a link or a read-only file here
    const fs::file_status existing = fs::symlink_status( dst_path, ec );
    if ( fs::is_symlink(existing) || fs::is_regular_file(existing) ) {
      fs::remove( dst_path, ec );
      if ( ec ) internal::throw_filesystem_error(
        "failed to remove existing entry at", dst_path, ec );
    }

    std::ofstream out( dst_path, std::ios::binary | std::ios::trunc );
    out.write( content.data(),
      static_cast< std::streamsize >( content.size() ) );
    out.close();
    if ( !out ) internal::throw_filesystem_error( "failed to write file",
      dst_path, std::make_error_code(std::errc::io_error) );

    fs::permissions( dst_path, status.permissions(),
      fs::perm_options::replace, ec );
    if ( ec ) internal::throw_filesystem_error( "failed to set mode on",
      dst_path, ec );
    this->run_after_each( dst_path );
    return;
  }

  std::ostringstream oss;
  oss << src_path.string() << ": unsupported file type";
  switch ( status.type() ) {
    case fs::file_type::block: oss << " (block device)"; break;
    case fs::file_type::character: oss << " (character device)"; break;
    case fs::file_type::fifo: oss << " (named pipe)"; break;
    case fs::file_type::socket: oss << " (socket)"; break;
    default: oss << " (unknown)"; break;
  }
  throw Error( ErrorKind::UnsupportedEntry, oss.str() );
}

inline void scaffolder::Scaffolder::run_after_each(
  const std::filesystem::path& dst_path )
{
  for ( const auto& plugin : plugins_ ) {
    try {
      plugin->after_each( dst_path );
    }
    catch ( const std::exception& ex ) {
      std::ostringstream oss;
      oss << "failed to run after each for " << dst_path << ": " << ex.what();
      throw Error( ErrorKind::Extension, oss.str() );
    }
  }
}

inline void scaffolder::scaffold( const std::filesystem::path& source,
  const std::filesystem::path& destination, const ordered_node& context )
{
  Scaffolder().scaffold( source, destination, context );
}
