#include "testing.hh"

#include <stdexcept>

using namespace scaffoldertest;
using scaffolder::ErrorKind;
using scaffolder::FunctionMap;
using scaffolder::ordered_node;
using scaffolder::internal::make_node_from;

namespace {

  const char* const CONTEXT = R"(
Name: test
Count: 3
Ratio: 1.5
Enabled: false
Empty: ""
Owner:
  Name: alice
  Email: alice@example.com
Items:
  - Name: first
    Port: 8080
  - Name: second
    Port: 9090
Labels:
  zone: west
  app: api
Tags: [red, green]
)";

  std::string render( const std::string& text, const FunctionMap& funcs = {} ) {
    return scaffolder::evaluate( "test", text, yaml(CONTEXT), funcs );
  }

  // Message of the template error raised by text
  std::string render_error( const std::string& text,
    const FunctionMap& funcs = {} )
  {
    try {
      render( text, funcs );
    }
    catch ( const scaffolder::Error& ex ) {
      EXPECT_EQ( ErrorKind::Template, ex.kind() );
      return ex.what();
    }
    ADD_FAILURE() << "expected a template error for: " << text;
    return std::string();
  }

} // anonymous namespace

TEST(Template, PlainTextIsCopied) {
  EXPECT_EQ( "no actions here\n", render("no actions here\n") );
  EXPECT_EQ( "", render("") );
}

TEST(Template, FieldsAreSubstituted) {
  EXPECT_EQ( "Hello, test!\n", render("Hello, {{.Name}}!\n") );
  EXPECT_EQ( "alice <alice@example.com>",
    render("{{ .Owner.Name }} <{{ .Owner.Email }}>") );
  EXPECT_EQ( "3 1.5 false", render("{{.Count}} {{.Ratio}} {{.Enabled}}") );
}

TEST(Template, MissingKeysPrintNoValue) {
  EXPECT_EQ( "<no value>", render("{{ .Missing }}") );
  EXPECT_EQ( "<no value>", render("{{ .Missing.Deeper }}") );
}

TEST(Template, FieldOfScalarIsAnError) {
  EXPECT_NE( std::string::npos,
    render_error("{{ .Name.Length }}").find("can't evaluate field Length") );
}

TEST(Template, ContainersPrintLikeGo) {
  EXPECT_EQ( "[red green]", render("{{ .Tags }}") );
  EXPECT_EQ( "map[app:api zone:west]", render("{{ .Labels }}") );
}

TEST(Template, IfElseChains) {
  const std::string t = "{{ if .Enabled }}on{{ else if eq .Count 3 }}three"
    "{{ else }}other{{ end }}";
  EXPECT_EQ( "three", render(t) );
  EXPECT_EQ( "yes", render("{{if .Name}}yes{{end}}") );
  EXPECT_EQ( "", render("{{if .Empty}}yes{{end}}") );
  EXPECT_EQ( "no", render("{{if .Missing}}yes{{else}}no{{end}}") );
}

TEST(Template, RangeOverSequence) {
  EXPECT_EQ( "first:8080,second:9090,",
    render("{{ range .Items }}{{ .Name }}:{{ .Port }},{{ end }}") );
  EXPECT_EQ( "0=red 1=green ",
    render("{{ range $i, $t := .Tags }}{{ $i }}={{ $t }} {{ end }}") );
}

TEST(Template, RangeOverMappingIsSortedByKey) {
  EXPECT_EQ( "app=api zone=west ",
    render("{{ range $k, $v := .Labels }}{{ $k }}={{ $v }} {{ end }}") );
}

TEST(Template, RangeElseRunsWhenEmpty) {
  EXPECT_EQ( "none", render("{{ range .Missing }}x{{ else }}none{{ end }}") );
}

TEST(Template, RangeOverScalarIsAnError) {
  EXPECT_NE( std::string::npos,
    render_error("{{ range .Name }}{{ end }}").find("can't iterate") );
}

TEST(Template, WithChangesDot) {
  EXPECT_EQ( "alice", render("{{ with .Owner }}{{ .Name }}{{ end }}") );
  EXPECT_EQ( "test", render("{{ with .Missing }}x{{ else }}{{ .Name }}{{ end }}") );
}

TEST(Template, VariablesAndRootReference) {
  EXPECT_EQ( "test", render("{{ $n := .Name }}{{ $n }}") );
  EXPECT_EQ( "b", render("{{ $n := \"a\" }}{{ $n = \"b\" }}{{ $n }}") );
  EXPECT_EQ( "first-test second-test ",
    render("{{ range .Items }}{{ .Name }}-{{ $.Name }} {{ end }}") );
  EXPECT_NE( std::string::npos,
    render_error("{{ $nope }}").find("undefined variable") );
}

TEST(Template, VariablesAreScopedToTheirBlock) {
  EXPECT_NE( std::string::npos,
    render_error("{{ if true }}{{ $x := 1 }}{{ end }}{{ $x }}")
      .find("undefined variable: $x") );
}

TEST(Template, PipelinesPassTheResultAsTheLastArgument) {
  EXPECT_EQ( "<test>", render("{{ .Name | printf \"<%s>\" }}") );
  EXPECT_EQ( "true", render("{{ .Count | eq 3 }}") );
}

TEST(Template, ParenthesizedPipelinesAndFieldChains) {
  EXPECT_EQ( "second", render("{{ (index .Items 1).Name }}") );
  EXPECT_EQ( "9090", render("{{ $i := index .Items 1 }}{{ $i.Port }}") );
}

TEST(Template, Builtins) {
  EXPECT_EQ( "true false", render("{{ ne .Count 4 }} {{ lt .Count 2 }}") );
  EXPECT_EQ( "true true", render("{{ le 3 .Count }} {{ ge .Ratio 1 }}") );
  EXPECT_EQ( "true", render("{{ gt \"b\" \"a\" }}") );
  EXPECT_EQ( "2 4 2", render("{{ len .Items }} {{ len .Name }} {{ len .Labels }}") );
  EXPECT_EQ( "api green", render("{{ index .Labels \"app\" }} {{ index .Tags 1 }}") );
  EXPECT_EQ( "test", render("{{ and .Count .Name }}") );
  EXPECT_EQ( "false", render("{{ or .Enabled .Empty .Enabled }}") );
  EXPECT_EQ( "true", render("{{ not .Enabled }}") );
  EXPECT_EQ( "true", render("{{ eq .Name \"x\" \"test\" }}") );
  EXPECT_EQ( "a1 2b", render("{{ print \"a\" 1 2 \"b\" }}") );
  EXPECT_EQ( "a 1\n", render("{{ println \"a\" 1 }}") );
  EXPECT_EQ( "test=3 50% \"q\" ff 1.500000",
    render("{{ printf \"%s=%d 50%% %q %x %f\" .Name .Count \"q\" 255 .Ratio }}") );
}

TEST(Template, PrintfFloatKeepsEveryDigit) {
  const std::string out = render( "{{ printf \"%f\" 1e300 }}" );
  EXPECT_EQ( 308u, out.size() );
  EXPECT_EQ( '1', out.front() );
  EXPECT_EQ( ".000000", out.substr(out.size() - 7) );
}

TEST(Template, BuiltinErrorsAreTemplateErrors) {
  EXPECT_NE( std::string::npos,
    render_error("{{ index .Tags 5 }}").find("index out of range") );
  EXPECT_NE( std::string::npos,
    render_error("{{ eq .Tags .Tags }}").find("non-comparable") );
  EXPECT_NE( std::string::npos,
    render_error("{{ len .Count }}").find("len of type int") );
  EXPECT_NE( std::string::npos,
    render_error("{{ not }}").find("wrong number of args for not") );
}

TEST(Template, TrimMarkersRemoveAdjacentWhitespace) {
  EXPECT_EQ( "a,b,", render("{{ range .Tags -}}\n  {{- if eq . \"red\" }}a"
    "{{ else }}b{{ end }},\n{{- end }}") );
  EXPECT_EQ( "x-y", render("x  \n {{- \"-\" -}} \n\t y") );
}

TEST(Template, CommentsProduceNothing) {
  EXPECT_EQ( "ab", render("a{{/* a comment */}}b") );
  EXPECT_EQ( "ab", render("a  {{- /* trimmed */ -}}  b") );
}

TEST(Template, StringLiterals) {
  EXPECT_EQ( "tab\there", render("{{ \"tab\\there\" }}") );
  EXPECT_EQ( "raw\\n", render("{{ `raw\\n` }}") );
}

TEST(Template, UserFunctionsAreCalledWithPositionalArguments) {
  FunctionMap funcs;
  funcs[ "join" ] = []( const std::vector< ordered_node >& args ) {
    std::string out;
    for ( const auto& a : args ) out += scaffolder::internal::to_string_any( a );
    return make_node_from( out );
  };
  EXPECT_EQ( "test3x", render("{{ join .Name .Count \"x\" }}", funcs) );
  EXPECT_EQ( "xtest", render("{{ .Name | join \"x\" }}", funcs) );
}

TEST(Template, UserFunctionsOverrideBuiltins) {
  FunctionMap funcs;
  funcs[ "len" ] = []( const std::vector< ordered_node >& ) {
    return make_node_from( std::string("custom") );
  };
  EXPECT_EQ( "custom", render("{{ len .Items }}", funcs) );
}

TEST(Template, FunctionFailuresAreReportedWithTheFunctionName) {
  FunctionMap funcs;
  funcs[ "fail" ] = []( const std::vector< ordered_node >& ) -> ordered_node {
    throw std::runtime_error( "it broke" );
  };
  const std::string msg = render_error( "line one\n{{ fail }}", funcs );
  EXPECT_NE( std::string::npos, msg.find("template: test:2:") );
  EXPECT_NE( std::string::npos, msg.find("error calling fail: it broke") );
}

TEST(Template, UndefinedFunctionsFailAtParseTime) {
  const std::string msg = render_error( "{{ nosuch .Name }}" );
  EXPECT_NE( std::string::npos, msg.find("function \"nosuch\" not defined") );
}

TEST(Template, SyntaxErrors) {
  EXPECT_NE( std::string::npos, render_error("{{ .Name ").find("unclosed action") );
  EXPECT_NE( std::string::npos, render_error("{{ if .Name }}x").find("unexpected EOF") );
  EXPECT_NE( std::string::npos, render_error("x{{ end }}").find("unexpected {{end}}") );
  EXPECT_NE( std::string::npos, render_error("{{ \"open }}").find("unterminated") );
  EXPECT_NE( std::string::npos, render_error("{{ .Name 3 }}").find("non-function") );
  EXPECT_NE( std::string::npos, render_error("{{ define \"x\" }}").find("unsupported") );
}

TEST(Template, ParsedTemplatesCanBeExecutedRepeatedly) {
  const auto t = scaffolder::Template::parse( "greeting", "Hi {{ .Name }}", {} );
  EXPECT_EQ( "greeting", t.name() );
  EXPECT_EQ( "Hi a", t.execute(yaml("Name: a")) );
  EXPECT_EQ( "Hi b", t.execute(yaml("Name: b")) );
}
