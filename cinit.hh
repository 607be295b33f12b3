//  ┏━╸╻┏┓╻╻╺┳╸
//  ┃  ┃┃┗┫┃ ┃
//  ┗━╸╹╹ ╹╹ ╹
//  C INitializer Text extraction
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace cinit {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Closed set of failure categories carried by cinit::Error
  enum class ErrorKind {
    Syntax, // malformed or unsupported token stream in an expression
    Arithmetic, // division/modulo by zero, out-of-range shift or quotient
    Parse, // unbalanced delimiters or missing segments in extracted text
    UnresolvedIdentifier, // expression names a symbol outside the table
    Config // invalid YAML configuration document
  };

  inline const char* error_kind_name( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::Syntax: return "syntax error";
      case ErrorKind::Arithmetic: return "arithmetic error";
      case ErrorKind::Parse: return "parse error";
      case ErrorKind::UnresolvedIdentifier: return "unresolved identifier";
      case ErrorKind::Config: return "configuration error";
    }
    return "error";
  }

  class Error : public std::runtime_error {
  public:
    inline Error( ErrorKind kind, const std::string& msg,
      std::string fragment = std::string() )
      : std::runtime_error( msg ), kind_( kind ),
      fragment_( std::move(fragment) ) {}

    ErrorKind kind() const { return kind_; }

    // Offending piece of the input text (may be empty)
    const std::string& fragment() const { return fragment_; }

  private:
    ErrorKind kind_;
    std::string fragment_;
  };

  // Nesting depth reported by the structural scanner
  struct Depths {
    int paren = 0;
    int brace = 0;

    bool balanced() const { return paren == 0 && brace == 0; }
    bool operator==( const Depths& o ) const {
      return paren == o.paren && brace == o.brace;
    }
  };

  // Field name -> raw (unevaluated) value text for one initializer body
  using FieldMap = std::map< std::string, std::string >;

  // Entry key (e.g., SPECIES_BULBASAUR) -> fields of that entry
  using IndexedEntryMap = std::map< std::string, FieldMap >;

  // Identifier -> value for the expression evaluator
  using SymbolTable = std::unordered_map< std::string, std::int64_t >;

  // (name, value text) pairs from #define lines, in source order
  using DefineList = std::vector< std::pair< std::string, std::string > >;

  // One decoded group of an entry list such as
  // EVOLUTION({EVO_LEVEL, 16, SPECIES_IVYSAUR})
  struct EntryTuple {
    std::string method;
    std::string parameter;
    std::string target;
    std::vector< std::string > conditions;

    bool operator==( const EntryTuple& o ) const {
      return method == o.method && parameter == o.parameter
        && target == o.target && conditions == o.conditions;
    }
  };

  struct LevelUpMove {
    std::int64_t level = 0;
    std::string move;

    bool operator==( const LevelUpMove& o ) const {
      return level == o.level && move == o.move;
    }
  };

  // Body (interior of the outer braces) of a "static const T name[] = {...};"
  // declaration
  struct ArrayTable {
    std::string name;
    std::string body;
  };

  struct ExtractOptions {
    // Commit a field whose delimiters are still open at end of input instead
    // of raising a Parse error
    bool commit_unterminated = true;
  };

  // Structure and splitting
  inline Depths scan_structure( const std::string& text,
    Depths start = Depths() );
  inline std::vector< std::string > split_top_level( const std::string& text );

  // Integer constant expressions
  inline std::int64_t evaluate_expression( const std::string& text );
  inline std::int64_t evaluate_expression( const std::string& text,
    const SymbolTable& symbols );

  // Initializer bodies and indexed entries
  inline FieldMap extract_field_map( const std::string& block_interior,
    const ExtractOptions& options = ExtractOptions() );
  inline IndexedEntryMap scan_indexed_entries( const std::string& text,
    const std::string& key_pattern,
    const ExtractOptions& options = ExtractOptions(),
    std::vector< std::string >* diagnostics = nullptr );
  inline IndexedEntryMap overlay_entries( const IndexedEntryMap& base,
    const IndexedEntryMap& overlay );

  // Value decoders
  inline std::string decode_string( const std::string& raw );
  inline std::vector< std::string > decode_macro_arguments(
    const std::string& raw );
  inline std::vector< std::string > decode_brace_list( const std::string& raw );
  inline std::vector< EntryTuple > decode_entry_list( const std::string& raw );
  inline std::vector< EntryTuple > decode_entry_list( const std::string& raw,
    const std::vector< std::string >& nested_keywords );

  // Re-serialization in the shape the decoders accept
  inline std::string format_brace_list(
    const std::vector< std::string >& items );
  inline std::string format_entry_list(
    const std::vector< EntryTuple >& entries,
    const std::string& wrapper = "EVOLUTION",
    const std::string& nested_keyword = "CONDITIONS" );

  // Array tables and their element lists
  inline std::vector< ArrayTable > scan_array_tables( const std::string& text,
    const std::string& element_type,
    std::vector< std::string >* diagnostics = nullptr );
  inline std::vector< LevelUpMove > decode_level_up_moves(
    const std::string& body );
  inline std::vector< LevelUpMove > decode_level_up_moves(
    const std::string& body, const SymbolTable& symbols,
    const std::vector< std::string >& sentinels );
  inline std::vector< std::string > decode_flat_list( const std::string& body );
  inline std::vector< std::string > decode_flat_list( const std::string& body,
    const std::vector< std::string >& excluded );

  // Constants declared in headers
  inline DefineList scan_defines( const std::string& text,
    const std::string& prefix );
  inline std::vector< std::string > scan_enum_constants(
    const std::string& text, const std::string& prefix );
  inline std::map< std::string, std::string > scan_guard_families(
    const std::string& text, const std::string& guard_prefix,
    const std::string& key_pattern );
  inline SymbolTable symbols_from_defines( const DefineList& defines,
    const SymbolTable& known = SymbolTable() );

namespace internal {

  inline const std::string IDENTIFIER_PATTERN = "[A-Za-z_][A-Za-z0-9_]*";
  inline const std::string NESTED_LIST_KEYWORD = "CONDITIONS";
  inline const std::string NULL_LIST = "NULL";
  inline const std::string LEVEL_UP_MACRO = "LEVEL_UP_MOVE";
  inline const std::string MOVE_FIELD = "move";
  inline const std::string LEVEL_FIELD = "level";

  inline const std::vector< std::string > LEVEL_UP_SENTINELS = {
    "MOVE_UNAVAILABLE", "LEVEL_UP_MOVE_END", "MOVE_NONE"
  };
  inline const std::vector< std::string > FLAT_LIST_SENTINELS = {
    "MOVE_UNAVAILABLE", "MOVE_NONE"
  };

  // Deepest parenthesis/unary nesting accepted by the evaluator
  inline constexpr int MAX_EXPRESSION_DEPTH = 256;

  // Longest fragment quoted verbatim in an error message
  inline constexpr std::size_t MAX_EXCERPT = 60;

  inline bool is_space( char ch ) {
    return std::isspace( static_cast< unsigned char >(ch) ) != 0;
  }

  inline bool is_ident_start( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalpha( c ) || c == '_';
  }

  inline bool is_ident_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '_';
  }

  inline std::string trim( const std::string& s ) {
    std::size_t b = 0, e = s.size();
    while ( b < e && is_space(s[ b ]) ) ++b;
    while ( e > b && is_space(s[ e - 1 ]) ) --e;
    return s.substr( b, e - b );
  }

  inline bool starts_with( const std::string& s, const std::string& prefix ) {
    return s.rfind( prefix, 0 ) == 0;
  }

  inline bool is_identifier( const std::string& s ) {
    if ( s.empty() || !is_ident_start(s[ 0 ]) ) return false;
    for ( char c : s ) {
      if ( !is_ident_char(c) ) return false;
    }
    return true;
  }

  inline bool contains( const std::vector< std::string >& v,
    const std::string& s )
  {
    for ( const auto& item : v ) {
      if ( item == s ) return true;
    }
    return false;
  }

  inline std::string join( const std::vector< std::string >& parts,
    const std::string& sep )
  {
    std::string out;
    for ( std::size_t i = 0; i < parts.size(); ++i ) {
      if ( i ) out += sep;
      out += parts[ i ];
    }
    return out;
  }

  // Split on '\n', dropping a trailing '\r' from each line
  inline std::vector< std::string > split_lines( const std::string& text ) {
    std::vector< std::string > lines;
    std::size_t start = 0;
    while ( start <= text.size() ) {
      std::size_t pos = text.find( '\n', start );
      if ( pos == std::string::npos ) pos = text.size();
      std::string line = text.substr( start, pos - start );
      if ( !line.empty() && line.back() == '\r' ) line.pop_back();
      lines.push_back( std::move(line) );
      start = pos + 1;
    }
    return lines;
  }

  // Shortened copy of a fragment for use inside an error message
  inline std::string excerpt( const std::string& s ) {
    if ( s.size() <= MAX_EXCERPT ) return s;
    return s.substr( 0, MAX_EXCERPT ) + "...";
  }

  [[noreturn]] inline void throw_error( ErrorKind kind,
    const std::string& where, const std::string& msg,
    const std::string& fragment )
  {
    std::ostringstream oss;
    oss << where << ": " << msg;
    if ( !fragment.empty() ) oss << " in '" << excerpt( fragment ) << "'";
    throw Error( kind, oss.str(), fragment );
  }

  // Incremental form of the structural scanner. Feeding one character at a
  // time lets the splitter, the field extractor and the delimiter matchers
  // share a single string/escape state machine.
  struct StructureCursor {
    Depths depths;
    bool in_string = false;
    bool escape = false;

    // Returns false while the character belongs to a string literal
    bool feed( char c ) {
      if ( c == '"' && !escape ) in_string = !in_string;
      if ( in_string ) {
        escape = ( c == '\\' && !escape );
        return false;
      }
      escape = false;
      switch ( c ) {
        case '(': ++depths.paren; break;
        case ')': --depths.paren; break;
        case '{': ++depths.brace; break;
        case '}': --depths.brace; break;
        default: break;
      }
      return true;
    }

    bool at_top_level() const { return !in_string && depths.balanced(); }
  };

  // Index of the delimiter closing the '(' or '{' found at s[open], or npos
  // when the input ends first
  inline std::size_t match_close( const std::string& s, std::size_t open ) {
    const bool paren = ( s[ open ] == '(' );
    StructureCursor cur;
    for ( std::size_t i = open; i < s.size(); ++i ) {
      if ( !cur.feed(s[ i ]) ) continue;
      const int depth = paren ? cur.depths.paren : cur.depths.brace;
      if ( depth == 0 ) return i;
    }
    return std::string::npos;
  }

  // Interior of "IDENT( ... )" or "( ... )" when the opening parenthesis is
  // closed by the very last character of the text
  inline std::optional< std::string > call_interior( const std::string& text ) {
    if ( text.empty() || text.back() != ')' ) return std::nullopt;
    std::size_t i = 0;
    if ( is_ident_start(text[ 0 ]) ) {
      while ( i < text.size() && is_ident_char(text[ i ]) ) ++i;
      while ( i < text.size() && is_space(text[ i ]) ) ++i;
    }
    if ( i >= text.size() || text[ i ] != '(' ) return std::nullopt;
    if ( match_close(text, i) != text.size() - 1 ) return std::nullopt;
    return text.substr( i + 1, text.size() - i - 2 );
  }

  // Interior of "{ ... }" when the first brace is closed by the last character
  inline std::optional< std::string > brace_interior( const std::string& text ) {
    if ( text.size() < 2 || text.front() != '{' ) return std::nullopt;
    if ( match_close(text, 0) != text.size() - 1 ) return std::nullopt;
    return text.substr( 1, text.size() - 2 );
  }

  // Interiors of the top-level "{...}" groups of a comma-separated sequence
  // such as "{a, b}, {c, d}". Anything other than commas and whitespace
  // between the groups is rejected.
  inline std::vector< std::string > collect_brace_groups(
    const std::string& text, const std::string& where )
  {
    std::vector< std::string > groups;
    std::size_t i = 0;
    while ( i < text.size() ) {
      const char c = text[ i ];
      if ( c == ',' || is_space(c) ) { ++i; continue; }
      if ( c != '{' ) {
        std::size_t stop = text.find( ',', i );
        throw_error( ErrorKind::Parse, where,
          "unexpected text outside a brace group",
          trim( text.substr(i, stop == std::string::npos
            ? std::string::npos : stop - i) ) );
      }
      const std::size_t close = match_close( text, i );
      if ( close == std::string::npos ) {
        throw_error( ErrorKind::Parse, where, "unclosed brace group",
          text.substr(i) );
      }
      groups.push_back( text.substr(i + 1, close - i - 1) );
      i = close + 1;
    }
    return groups;
  }

  inline int hex_digit_value( char c ) {
    if ( c >= '0' && c <= '9' ) return c - '0';
    if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
    if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
    return -1;
  }

  // Decode the C escape sequences of one string literal body (quotes
  // already removed)
  inline std::string decode_escapes( const std::string& body ) {
    std::string out;
    out.reserve( body.size() );
    for ( std::size_t i = 0; i < body.size(); ++i ) {
      char c = body[ i ];
      if ( c != '\\' || i + 1 >= body.size() ) { out += c; continue; }
      char e = body[ ++i ];
      switch ( e ) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'a': out += '\a'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'v': out += '\v'; break;
        case 'x': {
          int value = 0, digits = 0;
          while ( digits < 2 && i + 1 < body.size()
            && hex_digit_value(body[ i + 1 ]) >= 0 )
          {
            value = value * 16 + hex_digit_value( body[ ++i ] );
            ++digits;
          }
          if ( digits == 0 ) out += 'x';
          else out += static_cast< char >( value );
          break;
        }
        default:
          if ( e >= '0' && e <= '7' ) {
            int value = e - '0', digits = 1;
            while ( digits < 3 && i + 1 < body.size()
              && body[ i + 1 ] >= '0' && body[ i + 1 ] <= '7' )
            {
              value = value * 8 + ( body[ ++i ] - '0' );
              ++digits;
            }
            out += static_cast< char >( value );
          }
          else {
            // \\ \" \' \? and unknown escapes yield the escaped character
            out += e;
          }
      }
    }
    return out;
  }

  // Bodies of every "..." literal in the text, in order
  inline std::vector< std::string > string_literal_bodies(
    const std::string& text, const std::string& where )
  {
    std::vector< std::string > bodies;
    std::size_t i = 0;
    while ( ( i = text.find('"', i) ) != std::string::npos ) {
      std::size_t j = i + 1;
      bool closed = false;
      while ( j < text.size() ) {
        if ( text[ j ] == '\\' ) { j += 2; continue; }
        if ( text[ j ] == '"' ) { closed = true; break; }
        ++j;
      }
      if ( !closed ) {
        throw_error( ErrorKind::Parse, where, "unterminated string literal",
          text.substr(i) );
      }
      bodies.push_back( text.substr(i + 1, j - i - 1) );
      i = j + 1;
    }
    return bodies;
  }

  // Put every ", .field" that ends a field at nesting depth zero onto its own
  // line so that each assignment starts at a line boundary. Designators inside
  // nested braces or parentheses stay where they are.
  inline std::string break_inline_fields( const std::string& body ) {
    std::string out;
    out.reserve( body.size() + 16 );
    StructureCursor cur;
    for ( std::size_t i = 0; i < body.size(); ++i ) {
      const char c = body[ i ];
      const bool structural = cur.feed( c );
      out += c;
      if ( !structural || c != ',' || !cur.depths.balanced() ) continue;

      std::size_t j = i + 1;
      while ( j < body.size() && (body[ j ] == ' ' || body[ j ] == '\t') ) ++j;
      if ( j + 1 < body.size() && body[ j ] == '.'
        && is_ident_start(body[ j + 1 ]) )
      {
        out += '\n';
        i = j - 1;
      }
    }
    return out;
  }

  // Escape regex metacharacters of a literal and let any run of whitespace
  // match any other run of whitespace
  inline std::string literal_pattern( const std::string& text ) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    bool in_space = false;
    for ( char c : trim(text) ) {
      if ( is_space(c) ) {
        if ( !in_space ) out += R"(\s+)";
        in_space = true;
        continue;
      }
      in_space = false;
      if ( special.find(c) != std::string::npos ) out += '\\';
      out += c;
    }
    return out;
  }

  inline std::regex compile_pattern( const std::string& pattern,
    const std::string& where )
  {
    try {
      return std::regex( pattern );
    }
    catch ( const std::regex_error& ex ) {
      throw_error( ErrorKind::Parse, where,
        std::string("invalid pattern (") + ex.what() + ")", pattern );
    }
  }

  // Matches an indexed-entry header "[KEY] =" with KEY captured as group 1
  inline std::regex entry_header_regex( const std::string& key_pattern ) {
    return compile_pattern( R"(\[\s*()" + key_pattern + R"()\s*\]\s*=)",
      "scan_indexed_entries" );
  }

  // True when only blanks separate s[i] from the start of its line
  inline bool at_line_start( const std::string& s, std::size_t i ) {
    while ( i > 0 && ( s[ i - 1 ] == ' ' || s[ i - 1 ] == '\t' ) ) --i;
    return i == 0 || s[ i - 1 ] == '\n';
  }

  // Position of the first entry header inside the block opened at s[open]
  // and closed at s[close], or npos. Only headers that begin a line at the
  // block's own brace level count; nested designators and string contents
  // are not headers.
  inline std::size_t header_inside_block( const std::string& s,
    std::size_t open, std::size_t close, const std::regex& header )
  {
    StructureCursor cur;
    std::smatch m;
    for ( std::size_t i = open; i < close; ++i ) {
      if ( !cur.feed(s[ i ]) ) continue;
      if ( s[ i ] != '[' || cur.depths.brace != 1 || !at_line_start(s, i) ) {
        continue;
      }
      if ( std::regex_search(s.cbegin() + i, s.cend(), m, header,
        std::regex_constants::match_continuous) ) return i;
    }
    return std::string::npos;
  }

  // Expression tokens. Identifiers are resolved while tokenizing, so the
  // parser only ever sees numbers and operators.
  struct Token {
    enum class Kind { Number, Operator, End };

    Kind kind = Kind::End;
    std::int64_t number = 0;
    std::string symbol;
    std::size_t offset = 0; // position in the expression text

    bool is_operator( const char* op ) const {
      return kind == Kind::Operator && symbol == op;
    }
  };

  inline const SymbolTable& builtin_symbols() {
    static const SymbolTable table = { { "TRUE", 1 }, { "FALSE", 0 } };
    return table;
  }

  inline std::vector< Token > tokenize_expression( const std::string& text,
    const SymbolTable& symbols )
  {
    static const char* const TWO_CHAR_OPS[] = {
      "==", "!=", "<=", ">=", "<<", ">>", "&&", "||"
    };
    static const std::string ONE_CHAR_OPS = "+-*/%&|^~!?():<>";

    std::vector< Token > tokens;
    std::size_t i = 0;
    while ( i < text.size() ) {
      const char c = text[ i ];
      if ( is_space(c) ) { ++i; continue; }

      Token tok;
      tok.offset = i;

      if ( std::isdigit(static_cast< unsigned char >(c)) ) {
        // Unsigned magnitude first, reinterpreted as signed afterwards
        std::uint64_t value = 0;
        unsigned base = 10;
        std::size_t j = i;
        if ( c == '0' && j + 1 < text.size()
          && (text[ j + 1 ] == 'x' || text[ j + 1 ] == 'X') )
        {
          base = 16;
          j += 2;
        }
        else if ( c == '0' ) {
          base = 8;
        }
        const std::size_t digits_begin = j;
        while ( j < text.size() ) {
          int d = hex_digit_value( text[ j ] );
          if ( d < 0 || (base != 16 && d >= 10) ) break;
          if ( static_cast< unsigned >(d) >= base ) {
            throw_error( ErrorKind::Syntax, "evaluate_expression",
              "invalid digit in octal literal", text.substr(i) );
          }
          if ( value > ( std::numeric_limits< std::uint64_t >::max() - d )
            / base )
          {
            throw_error( ErrorKind::Syntax, "evaluate_expression",
              "integer literal out of range", text.substr(i) );
          }
          value = value * base + static_cast< unsigned >( d );
          ++j;
        }
        if ( j == digits_begin ) {
          throw_error( ErrorKind::Syntax, "evaluate_expression",
            "hexadecimal literal has no digits", text.substr(i) );
        }
        // C integer suffixes carry no value
        while ( j < text.size() && ( text[ j ] == 'u' || text[ j ] == 'U'
          || text[ j ] == 'l' || text[ j ] == 'L' ) ) ++j;
        if ( j < text.size() && is_ident_char(text[ j ]) ) {
          throw_error( ErrorKind::Syntax, "evaluate_expression",
            "malformed integer literal", text.substr(i) );
        }
        tok.kind = Token::Kind::Number;
        tok.number = static_cast< std::int64_t >( value );
        tokens.push_back( tok );
        i = j;
        continue;
      }

      if ( is_ident_start(c) ) {
        std::size_t j = i;
        while ( j < text.size() && is_ident_char(text[ j ]) ) ++j;
        const std::string name = text.substr( i, j - i );
        auto it = symbols.find( name );
        if ( it == symbols.end() ) {
          it = builtin_symbols().find( name );
          if ( it == builtin_symbols().end() ) {
            throw_error( ErrorKind::UnresolvedIdentifier,
              "evaluate_expression", "unknown identifier '" + name + "'",
              text );
          }
        }
        tok.kind = Token::Kind::Number;
        tok.number = it->second;
        tokens.push_back( tok );
        i = j;
        continue;
      }

      bool matched = false;
      for ( const char* op : TWO_CHAR_OPS ) {
        if ( text.compare(i, 2, op) == 0 ) {
          tok.kind = Token::Kind::Operator;
          tok.symbol = op;
          i += 2;
          matched = true;
          break;
        }
      }
      if ( !matched && ONE_CHAR_OPS.find(c) != std::string::npos ) {
        tok.kind = Token::Kind::Operator;
        tok.symbol = std::string( 1, c );
        ++i;
        matched = true;
      }
      if ( !matched ) {
        throw_error( ErrorKind::Syntax, "evaluate_expression",
          "unsupported token", text.substr(i) );
      }
      tokens.push_back( tok );
    }

    Token end;
    end.offset = text.size();
    tokens.push_back( end );
    return tokens;
  }

  // Recursive-descent evaluator over a token vector. Each precedence level
  // computes its value directly; no tree is built.
  class ExpressionParser {
  public:
    inline ExpressionParser( const std::string& text,
      const SymbolTable& symbols )
      : text_( text ), tokens_( tokenize_expression(text, symbols) ) {}

    inline std::int64_t evaluate();

  private:
    const std::string& text_;
    std::vector< Token > tokens_;
    std::size_t pos_ = 0;
    int depth_ = 0;

    const Token& peek() const { return tokens_[ pos_ ]; }
    const Token& next() { return tokens_[ pos_++ ]; }

    bool peek_any( std::initializer_list< const char* > ops ) const {
      for ( const char* op : ops ) {
        if ( peek().is_operator(op) ) return true;
      }
      return false;
    }

    inline void expect( const char* op );
    [[noreturn]] inline void throw_unexpected() const;

    inline std::int64_t parse_ternary();
    inline std::int64_t parse_or();
    inline std::int64_t parse_and();
    inline std::int64_t parse_bit_or();
    inline std::int64_t parse_bit_xor();
    inline std::int64_t parse_bit_and();
    inline std::int64_t parse_eq();
    inline std::int64_t parse_rel();
    inline std::int64_t parse_shift();
    inline std::int64_t parse_add();
    inline std::int64_t parse_mul();
    inline std::int64_t parse_unary();
    inline std::int64_t parse_primary();

    // Guards against unbounded recursion on inputs like "((((((..."
    struct DepthGuard {
      ExpressionParser& p;
      explicit DepthGuard( ExpressionParser& parser ) : p( parser ) {
        if ( ++p.depth_ > MAX_EXPRESSION_DEPTH ) {
          throw_error( ErrorKind::Syntax, "evaluate_expression",
            "expression nested too deeply", p.text_ );
        }
      }
      ~DepthGuard() { --p.depth_; }
    };
  };

  // Two's-complement wrapping arithmetic without signed overflow
  inline std::int64_t wrap_add( std::int64_t a, std::int64_t b ) {
    return static_cast< std::int64_t >( static_cast< std::uint64_t >(a)
      + static_cast< std::uint64_t >(b) );
  }

  inline std::int64_t wrap_sub( std::int64_t a, std::int64_t b ) {
    return static_cast< std::int64_t >( static_cast< std::uint64_t >(a)
      - static_cast< std::uint64_t >(b) );
  }

  inline std::int64_t wrap_mul( std::int64_t a, std::int64_t b ) {
    return static_cast< std::int64_t >( static_cast< std::uint64_t >(a)
      * static_cast< std::uint64_t >(b) );
  }

} // namespace cinit::internal

} // namespace cinit

// ExpressionParser member function definitions

inline std::int64_t cinit::internal::ExpressionParser::evaluate() {
  const std::int64_t value = parse_ternary();
  if ( peek().kind != Token::Kind::End ) throw_unexpected();
  return value;
}

inline void cinit::internal::ExpressionParser::expect( const char* op ) {
  if ( !peek().is_operator(op) ) {
    if ( peek().kind == Token::Kind::End ) {
      throw_error( ErrorKind::Syntax, "evaluate_expression",
        std::string("expected '") + op + "' before end of expression", text_ );
    }
    throw_error( ErrorKind::Syntax, "evaluate_expression",
      std::string("expected '") + op + "'", text_.substr(peek().offset) );
  }
  ++pos_;
}

[[noreturn]] inline void
  cinit::internal::ExpressionParser::throw_unexpected() const
{
  if ( peek().kind == Token::Kind::End ) {
    throw_error( ErrorKind::Syntax, "evaluate_expression",
      "unexpected end of expression", text_ );
  }
  throw_error( ErrorKind::Syntax, "evaluate_expression", "unexpected token",
    text_.substr(peek().offset) );
}

// Both branches are evaluated; operands have no side effects
inline std::int64_t cinit::internal::ExpressionParser::parse_ternary() {
  DepthGuard guard( *this );
  const std::int64_t cond = parse_or();
  if ( !peek().is_operator("?") ) return cond;
  next();
  const std::int64_t when_true = parse_ternary();
  expect( ":" );
  const std::int64_t when_false = parse_ternary();
  return cond != 0 ? when_true : when_false;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_or() {
  std::int64_t v = parse_and();
  while ( peek().is_operator("||") ) {
    next();
    const std::int64_t r = parse_and();
    v = ( v != 0 || r != 0 ) ? 1 : 0;
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_and() {
  std::int64_t v = parse_bit_or();
  while ( peek().is_operator("&&") ) {
    next();
    const std::int64_t r = parse_bit_or();
    v = ( v != 0 && r != 0 ) ? 1 : 0;
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_bit_or() {
  std::int64_t v = parse_bit_xor();
  while ( peek().is_operator("|") ) {
    next();
    v |= parse_bit_xor();
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_bit_xor() {
  std::int64_t v = parse_bit_and();
  while ( peek().is_operator("^") ) {
    next();
    v ^= parse_bit_and();
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_bit_and() {
  std::int64_t v = parse_eq();
  while ( peek().is_operator("&") ) {
    next();
    v &= parse_eq();
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_eq() {
  std::int64_t v = parse_rel();
  while ( peek_any({ "==", "!=" }) ) {
    const bool eq = next().symbol == "==";
    const std::int64_t r = parse_rel();
    v = ( (v == r) == eq ) ? 1 : 0;
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_rel() {
  std::int64_t v = parse_shift();
  while ( peek_any({ "<", ">", "<=", ">=" }) ) {
    const std::string op = next().symbol;
    const std::int64_t r = parse_shift();
    if ( op == "<" ) v = ( v < r ) ? 1 : 0;
    else if ( op == ">" ) v = ( v > r ) ? 1 : 0;
    else if ( op == "<=" ) v = ( v <= r ) ? 1 : 0;
    else v = ( v >= r ) ? 1 : 0;
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_shift() {
  std::int64_t v = parse_add();
  while ( peek_any({ "<<", ">>" }) ) {
    const Token& op = next();
    const bool left = op.symbol == "<<";
    const std::size_t op_offset = op.offset;
    const std::int64_t r = parse_add();
    if ( r < 0 || r > 63 ) {
      throw_error( ErrorKind::Arithmetic, "evaluate_expression",
        "shift count out of range", text_.substr(op_offset) );
    }
    if ( left ) {
      v = static_cast< std::int64_t >( static_cast< std::uint64_t >(v) << r );
    }
    else {
      v = v >> r;
    }
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_add() {
  std::int64_t v = parse_mul();
  while ( peek_any({ "+", "-" }) ) {
    const bool plus = next().symbol == "+";
    const std::int64_t r = parse_mul();
    v = plus ? wrap_add( v, r ) : wrap_sub( v, r );
  }
  return v;
}

inline std::int64_t
  cinit::internal::ExpressionParser::parse_mul()
{
  std::int64_t v = parse_unary();
  while ( peek_any({ "*", "/", "%" }) ) {
    const Token& op = next();
    const char kind = op.symbol[ 0 ];
    const std::size_t op_offset = op.offset;
    const std::int64_t r = parse_unary();
    if ( kind == '*' ) {
      v = wrap_mul( v, r );
      continue;
    }
    if ( r == 0 ) {
      throw_error( ErrorKind::Arithmetic, "evaluate_expression",
        kind == '/' ? "division by zero" : "modulo by zero",
        text_.substr(op_offset) );
    }
    if ( v == std::numeric_limits< std::int64_t >::min() && r == -1 ) {
      if ( kind == '%' ) { v = 0; continue; }
      throw_error( ErrorKind::Arithmetic, "evaluate_expression",
        "quotient out of range", text_.substr(op_offset) );
    }
    // C++ integer division already truncates toward zero, like C
    v = ( kind == '/' ) ? v / r : v % r;
  }
  return v;
}

inline std::int64_t cinit::internal::ExpressionParser::parse_unary() {
  if ( !peek_any({ "+", "-", "!", "~" }) ) return parse_primary();
  DepthGuard guard( *this );
  const char op = next().symbol[ 0 ];
  const std::int64_t operand = parse_unary();
  switch ( op ) {
    case '-': return wrap_sub( 0, operand );
    case '!': return operand == 0 ? 1 : 0;
    case '~': return ~operand;
    default: return operand;
  }
}

inline std::int64_t cinit::internal::ExpressionParser::parse_primary() {
  const Token& tok = peek();
  if ( tok.is_operator("(") ) {
    next();
    const std::int64_t v = parse_ternary();
    expect( ")" );
    return v;
  }
  if ( tok.kind == Token::Kind::Number ) {
    next();
    return tok.number;
  }
  throw_unexpected();
}

// Structural scanner and splitter

inline cinit::Depths cinit::scan_structure( const std::string& text,
  Depths start )
{
  internal::StructureCursor cur;
  cur.depths = start;
  for ( char c : text ) cur.feed( c );
  return cur.depths;
}

inline std::vector< std::string > cinit::split_top_level(
  const std::string& text )
{
  std::vector< std::string > parts;
  std::string current;
  internal::StructureCursor cur;
  for ( char c : text ) {
    const bool structural = cur.feed( c );
    if ( structural && c == ',' && cur.depths.balanced() ) {
      std::string part = internal::trim( current );
      if ( !part.empty() ) parts.push_back( std::move(part) );
      current.clear();
      continue;
    }
    current += c;
  }
  std::string tail = internal::trim( current );
  if ( !tail.empty() ) parts.push_back( std::move(tail) );
  return parts;
}

// Expression evaluator entry points

inline std::int64_t cinit::evaluate_expression( const std::string& text ) {
  return evaluate_expression( text, SymbolTable() );
}

// Whitespace-only text evaluates to 0 so that absent fields can be passed
// through as empty strings
inline std::int64_t cinit::evaluate_expression( const std::string& text,
  const SymbolTable& symbols )
{
  if ( internal::trim(text).empty() ) return 0;
  internal::ExpressionParser parser( text, symbols );
  return parser.evaluate();
}

// Block-assignment extractor

inline cinit::FieldMap cinit::extract_field_map(
  const std::string& block_interior, const ExtractOptions& options )
{
  FieldMap fields;
  std::optional< std::string > field;
  std::vector< std::string > fragments;
  Depths depths;

  auto commit = [&]() {
    std::string value = internal::join( fragments, " " );
    if ( !value.empty() && value.back() == ',' ) value.pop_back();
    fields[ *field ] = internal::trim( value );
    field.reset();
    fragments.clear();
    depths = Depths();
  };

  const std::string text = internal::break_inline_fields( block_interior );
  for ( const std::string& raw_line : internal::split_lines(text) ) {
    const std::string line = internal::trim( raw_line );
    if ( line.empty() ) continue;

    std::string fragment;
    if ( !field ) {
      // Only ".name = value" opens a field; anything else between fields
      // is ignored
      if ( line[ 0 ] != '.' ) continue;
      const std::size_t eq = line.find( '=' );
      if ( eq == std::string::npos ) continue;
      const std::string name = internal::trim( line.substr(1, eq - 1) );
      if ( !internal::is_identifier(name) ) continue;
      field = name;
      fragment = internal::trim( line.substr(eq + 1) );
    }
    else {
      fragment = line;
    }

    if ( !fragment.empty() ) {
      depths = scan_structure( fragment, depths );
      fragments.push_back( fragment );
    }
    if ( depths.balanced() && !fragment.empty() && fragment.back() == ',' ) {
      commit();
    }
  }

  if ( field ) {
    // A field still open at end of input is complete when its delimiters
    // balance (C allows the last initializer without a trailing comma).
    // Otherwise the partial value is kept unless strict mode was requested.
    if ( !depths.balanced() && !options.commit_unterminated ) {
      internal::throw_error( ErrorKind::Parse, "extract_field_map",
        "field '." + *field + "' is not terminated",
        internal::join(fragments, " ") );
    }
    if ( !fragments.empty() ) commit();
    else field.reset();
  }
  return fields;
}

// Indexed-entry scanner. A malformed entry is reported through diagnostics
// and skipped; it never aborts the scan.
inline cinit::IndexedEntryMap cinit::scan_indexed_entries(
  const std::string& text, const std::string& key_pattern,
  const ExtractOptions& options, std::vector< std::string >* diagnostics )
{
  const std::regex header = internal::entry_header_regex(
    key_pattern.empty() ? internal::IDENTIFIER_PATTERN : key_pattern );

  auto skip = [&]( const std::string& key, const std::string& why ) {
    if ( diagnostics ) diagnostics->push_back( "skipped entry [" + key + "]: "
      + why );
  };

  IndexedEntryMap entries;
  std::size_t pos = 0;
  // Tracks string state up to `scanned` so that header-shaped text inside a
  // literal is never taken for a header
  internal::StructureCursor outer;
  std::size_t scanned = 0;
  std::smatch m;
  while ( pos < text.size()
    && std::regex_search(text.cbegin() + pos, text.cend(), m, header) )
  {
    const std::size_t header_at = pos + m.position( 0 );
    for ( ; scanned < header_at; ++scanned ) outer.feed( text[ scanned ] );
    if ( outer.in_string ) {
      pos = header_at + 1;
      continue;
    }

    const std::string key = m[ 1 ].str();
    const std::size_t header_end = header_at + m.length( 0 );
    pos = header_end;

    const std::size_t open = text.find_first_not_of( " \t\r\n", header_end );
    if ( open == std::string::npos || text[ open ] != '{' ) {
      skip( key, "no '{' after the header" );
      continue;
    }

    // The block must close before the next header starts, otherwise it
    // would swallow its neighbours
    const std::size_t close = internal::match_close( text, open );
    if ( close == std::string::npos
      || internal::header_inside_block(text, open, close, header)
        != std::string::npos )
    {
      skip( key, "block is not closed" );
      continue;
    }

    const std::string interior = text.substr( open + 1, close - open - 1 );
    pos = close + 1;
    if ( internal::trim(interior).empty() ) {
      skip( key, "block is empty" );
      continue;
    }
    try {
      entries[ key ] = extract_field_map( interior, options );
    }
    catch ( const Error& ex ) {
      if ( ex.kind() != ErrorKind::Parse ) throw;
      skip( key, ex.what() );
    }
  }
  return entries;
}

// Later sources override earlier ones entry by entry
inline cinit::IndexedEntryMap cinit::overlay_entries(
  const IndexedEntryMap& base, const IndexedEntryMap& overlay )
{
  IndexedEntryMap merged = base;
  for ( const auto& [key, fields] : overlay ) merged[ key ] = fields;
  return merged;
}

// Value decoders

// Adjacent literals concatenate as in C: _("Bulba" "saur") -> "Bulbasaur"
inline std::string cinit::decode_string( const std::string& raw ) {
  std::string text = internal::trim( raw );
  if ( text.empty() ) return text;
  while ( auto inner = internal::call_interior(text) ) {
    text = internal::trim( *inner );
  }
  const std::vector< std::string > bodies
    = internal::string_literal_bodies( text, "decode_string" );
  if ( bodies.empty() ) return text;
  std::string out;
  for ( const auto& body : bodies ) out += internal::decode_escapes( body );
  return out;
}

inline std::vector< std::string > cinit::decode_macro_arguments(
  const std::string& raw )
{
  const std::string text = internal::trim( raw );
  if ( text.empty() ) return {};
  const std::size_t start = text.find( '(' );
  const std::size_t end = text.rfind( ')' );
  if ( start == std::string::npos && end == std::string::npos ) {
    return { text };
  }
  if ( start == std::string::npos || end == std::string::npos || end < start ) {
    internal::throw_error( ErrorKind::Parse, "decode_macro_arguments",
      "unbalanced parentheses", text );
  }
  const std::string inner = text.substr( start + 1, end - start - 1 );
  if ( !scan_structure(inner).balanced() ) {
    internal::throw_error( ErrorKind::Parse, "decode_macro_arguments",
      "unbalanced argument list", text );
  }
  return split_top_level( inner );
}

inline std::vector< std::string > cinit::decode_brace_list(
  const std::string& raw )
{
  std::string text = internal::trim( raw );
  if ( text.empty() ) return {};
  if ( auto inner = internal::brace_interior(text) ) text = *inner;
  if ( !scan_structure(text).balanced() ) {
    internal::throw_error( ErrorKind::Parse, "decode_brace_list",
      "unbalanced braces", internal::trim(raw) );
  }
  return split_top_level( text );
}

inline std::vector< cinit::EntryTuple > cinit::decode_entry_list(
  const std::string& raw )
{
  return decode_entry_list( raw, { internal::NESTED_LIST_KEYWORD } );
}

inline std::vector< cinit::EntryTuple > cinit::decode_entry_list(
  const std::string& raw, const std::vector< std::string >& nested_keywords )
{
  static const std::string WHERE = "decode_entry_list";

  std::string text = internal::trim( raw );
  if ( auto inner = internal::call_interior(text) ) {
    text = internal::trim( *inner );
  }
  if ( text.empty() || text == internal::NULL_LIST ) return {};

  // Keyword followed by an argument list, e.g. CONDITIONS({IF_X, 1})
  auto nested_keyword_of = [&]( const std::string& part )
    -> std::optional< std::string >
  {
    for ( const auto& kw : nested_keywords ) {
      if ( !internal::starts_with(part, kw) ) continue;
      const std::string rest = internal::trim( part.substr(kw.size()) );
      if ( !rest.empty() && rest[ 0 ] == '(' ) return kw;
    }
    return std::nullopt;
  };

  std::vector< EntryTuple > entries;
  for ( const auto& group : internal::collect_brace_groups(text, WHERE) ) {
    const std::vector< std::string > parts = split_top_level( group );
    if ( parts.size() < 3 ) {
      internal::throw_error( ErrorKind::Parse, WHERE,
        "entry needs a method, a parameter and a target", group );
    }

    EntryTuple entry{ parts[ 0 ], parts[ 1 ], parts[ 2 ], {} };
    for ( std::size_t i = 3; i < parts.size(); ++i ) {
      const std::string& extra = parts[ i ];
      if ( !nested_keyword_of(extra) ) {
        entry.conditions.push_back( extra );
        continue;
      }
      const std::size_t start = extra.find( '(' );
      const std::size_t end = extra.rfind( ')' );
      if ( end == std::string::npos || end < start ) {
        internal::throw_error( ErrorKind::Parse, WHERE,
          "unbalanced nested list", extra );
      }
      const std::string block = extra.substr( start + 1, end - start - 1 );
      for ( const auto& cond : internal::collect_brace_groups(block, WHERE) ) {
        const std::vector< std::string > cond_parts = split_top_level( cond );
        if ( !cond_parts.empty() ) {
          entry.conditions.push_back( internal::join(cond_parts, " ") );
        }
      }
    }
    entries.push_back( std::move(entry) );
  }
  return entries;
}

inline std::string cinit::format_brace_list(
  const std::vector< std::string >& items )
{
  if ( items.empty() ) return "{ }";
  return "{ " + internal::join( items, ", " ) + " }";
}

inline std::string cinit::format_entry_list(
  const std::vector< EntryTuple >& entries, const std::string& wrapper,
  const std::string& nested_keyword )
{
  std::vector< std::string > groups;
  for ( const auto& e : entries ) {
    std::string g = "{" + e.method + ", " + e.parameter + ", " + e.target;
    if ( !e.conditions.empty() ) {
      std::vector< std::string > conds;
      for ( const auto& c : e.conditions ) conds.push_back( "{" + c + "}" );
      g += ", " + nested_keyword + "(" + internal::join( conds, ", " ) + ")";
    }
    groups.push_back( g + "}" );
  }
  std::string body = groups.empty() ? internal::NULL_LIST
    : internal::join( groups, ", " );
  if ( wrapper.empty() ) return groups.empty() ? std::string() : body;
  return wrapper + "(" + body + ")";
}

// Array tables

inline std::vector< cinit::ArrayTable > cinit::scan_array_tables(
  const std::string& text, const std::string& element_type,
  std::vector< std::string >* diagnostics )
{
  const std::regex decl = internal::compile_pattern(
    R"(static\s+const\s+)" + internal::literal_pattern( element_type )
    + R"(\s+()" + internal::IDENTIFIER_PATTERN + R"()\s*\[\s*\]\s*=)",
    "scan_array_tables" );

  std::vector< ArrayTable > tables;
  std::size_t pos = 0;
  std::smatch m;
  while ( pos < text.size()
    && std::regex_search(text.cbegin() + pos, text.cend(), m, decl) )
  {
    const std::string name = m[ 1 ].str();
    pos += m.position( 0 ) + m.length( 0 );

    const std::size_t open = text.find_first_not_of( " \t\r\n", pos );
    const std::size_t close = ( open != std::string::npos
      && text[ open ] == '{' ) ? internal::match_close( text, open )
      : std::string::npos;
    if ( close == std::string::npos ) {
      if ( diagnostics ) diagnostics->push_back( "skipped table " + name
        + ": initializer is not a closed brace block" );
      continue;
    }
    tables.push_back( { name, text.substr(open + 1, close - open - 1) } );
    pos = close + 1;
  }
  return tables;
}

inline std::vector< cinit::LevelUpMove > cinit::decode_level_up_moves(
  const std::string& body )
{
  return decode_level_up_moves( body, SymbolTable(),
    internal::LEVEL_UP_SENTINELS );
}

// Elements are either designated "{ .move = M, .level = L }" groups or
// LEVEL_UP_MOVE(L, M) calls. Sentinel and raw hexadecimal moves are dropped.
inline std::vector< cinit::LevelUpMove > cinit::decode_level_up_moves(
  const std::string& body, const SymbolTable& symbols,
  const std::vector< std::string >& sentinels )
{
  std::vector< LevelUpMove > moves;
  for ( const auto& item : split_top_level(body) ) {
    std::string move, level;
    if ( auto inner = internal::brace_interior(item) ) {
      const FieldMap fields = extract_field_map( *inner );
      auto m = fields.find( internal::MOVE_FIELD );
      auto l = fields.find( internal::LEVEL_FIELD );
      if ( m == fields.end() || l == fields.end() ) continue;
      move = m->second;
      level = l->second;
    }
    else if ( internal::starts_with(item, internal::LEVEL_UP_MACRO)
      && internal::starts_with(internal::trim(
        item.substr(internal::LEVEL_UP_MACRO.size())), "(") )
    {
      const std::vector< std::string > args = decode_macro_arguments( item );
      if ( args.size() != 2 ) {
        internal::throw_error( ErrorKind::Parse, "decode_level_up_moves",
          "expected a level and a move", item );
      }
      level = args[ 0 ];
      move = args[ 1 ];
    }
    else {
      continue;
    }

    if ( internal::contains(sentinels, move)
      || internal::starts_with(move, "0x") ) continue;
    moves.push_back( { evaluate_expression(level, symbols), move } );
  }
  return moves;
}

inline std::vector< std::string > cinit::decode_flat_list(
  const std::string& body )
{
  return decode_flat_list( body, internal::FLAT_LIST_SENTINELS );
}

inline std::vector< std::string > cinit::decode_flat_list(
  const std::string& body, const std::vector< std::string >& excluded )
{
  std::vector< std::string > out;
  for ( auto& item : split_top_level(body) ) {
    if ( !internal::contains(excluded, item) ) out.push_back( std::move(item) );
  }
  return out;
}

// Header constants

inline cinit::DefineList cinit::scan_defines( const std::string& text,
  const std::string& prefix )
{
  static const std::regex define( R"(^\s*#\s*define\s+()"
    + internal::IDENTIFIER_PATTERN + R"()\s+(.*)$)" );

  DefineList defines;
  std::smatch m;
  for ( const auto& line : internal::split_lines(text) ) {
    if ( !std::regex_match(line, m, define) ) continue;
    const std::string name = m[ 1 ].str();
    if ( !internal::starts_with(name, prefix) ) continue;

    std::string value = m[ 2 ].str();
    for ( const char* comment : { "//", "/*" } ) {
      const std::size_t at = value.find( comment );
      if ( at != std::string::npos ) value.erase( at );
    }
    value = internal::trim( value );
    // Multi-line macros are not constants
    if ( value.empty() || value.back() == '\\' ) continue;
    defines.emplace_back( name, value );
  }
  return defines;
}

// A line mentioning the prefix switches collection on; a line starting with
// '}' switches it off again
inline std::vector< std::string > cinit::scan_enum_constants(
  const std::string& text, const std::string& prefix )
{
  static const std::regex enumerator( R"(^\s*([A-Z0-9_]+)\s*(?:=\s*[^,]+)?,?)" );

  std::vector< std::string > names;
  bool inside = false;
  std::smatch m;
  for ( const auto& line : internal::split_lines(text) ) {
    if ( line.find(prefix) != std::string::npos ) inside = true;
    if ( !inside ) continue;
    if ( std::regex_search(line, m, enumerator) ) {
      const std::string name = m[ 1 ].str();
      if ( internal::starts_with(name, prefix) ) names.push_back( name );
    }
    if ( internal::starts_with(line, "}") ) inside = false;
  }
  return names;
}

inline std::map< std::string, std::string > cinit::scan_guard_families(
  const std::string& text, const std::string& guard_prefix,
  const std::string& key_pattern )
{
  const std::regex key_header = internal::compile_pattern( R"(^\[\s*()"
    + ( key_pattern.empty() ? internal::IDENTIFIER_PATTERN : key_pattern )
    + R"()\s*\])", "scan_guard_families" );

  std::map< std::string, std::string > families;
  std::optional< std::string > current;
  std::smatch m;
  for ( const auto& line : internal::split_lines(text) ) {
    const std::string s = internal::trim( line );
    if ( internal::starts_with(s, "#if " + guard_prefix) ) {
      std::istringstream words( s );
      std::string directive, guard;
      words >> directive >> guard;
      current = guard;
      continue;
    }
    if ( internal::starts_with(s, "#endif") ) {
      if ( s.find(guard_prefix) != std::string::npos ) current.reset();
      continue;
    }
    if ( current && std::regex_search(s, m, key_header) ) {
      families[ m[ 1 ].str() ] = *current;
    }
  }
  return families;
}

// Values that are not integer expressions over the symbols known so far are
// left out
inline cinit::SymbolTable cinit::symbols_from_defines(
  const DefineList& defines, const SymbolTable& known )
{
  SymbolTable table = known;
  for ( const auto& [name, value] : defines ) {
    try {
      table[ name ] = evaluate_expression( value, table );
    }
    catch ( const Error& ) {
      continue;
    }
  }
  return table;
}

// YAML bridge: configuration and output for callers that work with
// documents rather than raw maps

namespace cinit {

  // How the raw text of a configured field is turned into a YAML value
  enum class FieldDecoder { Raw, Integer, String, MacroArguments, BraceList,
    EntryList };

  struct Config {
    std::string key_pattern = internal::IDENTIFIER_PATTERN;
    SymbolTable symbols;
    std::vector< std::string > nested_keywords
      = { internal::NESTED_LIST_KEYWORD };
    ExtractOptions extract;
    // Emit fields without a configured decoder as raw text
    bool keep_unlisted_fields = true;
    // Configured fields, in configuration order
    std::vector< std::pair< std::string, FieldDecoder > > fields;
  };

  inline Config load_config( const std::string& yaml_text );
  inline Config load_config( std::istream& in );

namespace internal {

  // Configuration keys
  inline const std::string KEY_PATTERN = "key pattern";
  inline const std::string SYMBOLS = "symbols";
  inline const std::string NESTED_KEYWORDS = "nested list keywords";
  inline const std::string COMMIT_UNTERMINATED = "commit unterminated fields";
  inline const std::string KEEP_UNLISTED = "keep unlisted fields";
  inline const std::string FIELDS = "fields";

  // Keys of a decoded entry-list element
  inline const std::string METHOD = "method";
  inline const std::string PARAMETER = "parameter";
  inline const std::string TARGET = "target";
  inline const std::string CONDITIONS = "conditions";

  inline const std::vector< std::pair< std::string, FieldDecoder > >&
    decoder_names()
  {
    static const std::vector< std::pair< std::string, FieldDecoder > > names = {
      { "raw", FieldDecoder::Raw },
      { "integer", FieldDecoder::Integer },
      { "string", FieldDecoder::String },
      { "macro arguments", FieldDecoder::MacroArguments },
      { "brace list", FieldDecoder::BraceList },
      { "entry list", FieldDecoder::EntryList }
    };
    return names;
  }

  [[noreturn]] inline void throw_config_error( const std::string& msg ) {
    throw Error( ErrorKind::Config, "config: " + msg );
  }

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

  inline ordered_node make_sequence_node(
    const std::vector< std::string >& items )
  {
    std::vector< ordered_node > seq;
    seq.reserve( items.size() );
    for ( const auto& s : items ) seq.push_back( make_node_from(s) );
    return make_node_from( seq );
  }

  inline ordered_node make_entry_node( const EntryTuple& e ) {
    ordered_node n = ordered_node::mapping();
    n[ METHOD ] = make_node_from( e.method );
    n[ PARAMETER ] = make_node_from( e.parameter );
    n[ TARGET ] = make_node_from( e.target );
    n[ CONDITIONS ] = make_sequence_node( e.conditions );
    return n;
  }

  inline std::string required_string( const ordered_node& n,
    const std::string& what )
  {
    if ( !n.is_string() ) throw_config_error( "'" + what
      + "' must be a string" );
    return to_native_checked< std::string >( n );
  }

  inline bool required_bool( const ordered_node& n, const std::string& what ) {
    if ( !n.is_boolean() ) throw_config_error( "'" + what
      + "' must be true or false" );
    return n.get_value< bool >();
  }

} // namespace cinit::internal

  // Scans one or more preprocessed sources and emits the decoded entries as
  // an ordered YAML mapping { KEY: { field: value, ... }, ... }
  class Extractor {
  public:
    inline explicit Extractor( Config config = Config() )
      : config_( std::move(config) ) {}

    // Each call starts from an empty entry map; sources are overlaid in
    // order (later sources win)
    ordered_node extract( std::istream& in );
    ordered_node extract( const std::string& text );
    ordered_node extract( const std::vector< std::string >& texts );

    // Skipped entries and fields that fell back to raw text during the
    // most recent extract(...) call
    const std::vector< std::string >& diagnostics() const {
      return diagnostics_;
    }

    const Config& config() const { return config_; }

  private:
    Config config_;
    std::vector< std::string > diagnostics_;

    ordered_node decode_entry( const std::string& key,
      const FieldMap& fields );
    ordered_node decode_field( FieldDecoder decoder, const std::string& raw );
  };

} // namespace cinit

inline cinit::Config cinit::load_config( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_config( ss.str() );
}

inline cinit::Config cinit::load_config( const std::string& yaml_text ) {
  using namespace internal;

  Config config;
  if ( trim(yaml_text).empty() ) return config;

  ordered_node doc;
  try {
    doc = ordered_node::deserialize( yaml_text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw_config_error( std::string("invalid YAML (") + ex.what() + ")" );
  }
  if ( doc.is_null() ) return config;
  if ( !doc.is_mapping() ) throw_config_error( "document must be a mapping" );

  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string k = mk.get_value< std::string >();

    if ( k == KEY_PATTERN ) {
      config.key_pattern = required_string( mv, k );
      try {
        std::regex check( config.key_pattern );
      }
      catch ( const std::regex_error& ex ) {
        throw_config_error( "'" + k + "' is not a valid regular expression ("
          + ex.what() + ")" );
      }
    }
    else if ( k == SYMBOLS ) {
      if ( !mv.is_mapping() ) throw_config_error( "'" + k
        + "' must be a mapping" );
      for ( const auto& [sk, sv] : mv.map_items() ) {
        const std::string name = sk.get_value< std::string >();
        if ( sv.is_integer() ) {
          config.symbols[ name ] = to_native_checked< std::int64_t >( sv );
        }
        else if ( sv.is_boolean() ) {
          config.symbols[ name ] = sv.get_value< bool >() ? 1 : 0;
        }
        else {
          throw_config_error( "symbol '" + name + "' must be an integer" );
        }
      }
    }
    else if ( k == NESTED_KEYWORDS ) {
      if ( !mv.is_sequence() ) throw_config_error( "'" + k
        + "' must be a sequence" );
      config.nested_keywords.clear();
      for ( std::size_t i = 0; i < mv.size(); ++i ) {
        config.nested_keywords.push_back( required_string(mv.at( i ), k) );
      }
    }
    else if ( k == COMMIT_UNTERMINATED ) {
      config.extract.commit_unterminated = required_bool( mv, k );
    }
    else if ( k == KEEP_UNLISTED ) {
      config.keep_unlisted_fields = required_bool( mv, k );
    }
    else if ( k == FIELDS ) {
      if ( !mv.is_mapping() ) throw_config_error( "'" + k
        + "' must be a mapping" );
      for ( const auto& [fk, fv] : mv.map_items() ) {
        const std::string field = fk.get_value< std::string >();
        const std::string name = required_string( fv, field );
        std::optional< FieldDecoder > decoder;
        for ( const auto& [dn, dv] : decoder_names() ) {
          if ( dn == name ) decoder = dv;
        }
        if ( !decoder ) {
          std::ostringstream oss;
          oss << "unknown decoder '" << name << "' for field '" << field
            << "' (expected one of: ";
          for ( std::size_t i = 0; i < decoder_names().size(); ++i ) {
            if ( i ) oss << ", ";
            oss << decoder_names()[ i ].first;
          }
          oss << ")";
          throw_config_error( oss.str() );
        }
        config.fields.emplace_back( field, *decoder );
      }
    }
    else {
      throw_config_error( "unknown key '" + k + "'" );
    }
  }
  return config;
}

// Read from an input stream until end-of-file, then extract from the
// resulting string
inline cinit::ordered_node cinit::Extractor::extract( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->extract( ss.str() );
}

inline cinit::ordered_node cinit::Extractor::extract(
  const std::string& text )
{
  return this->extract( std::vector< std::string >{ text } );
}

inline cinit::ordered_node cinit::Extractor::extract(
  const std::vector< std::string >& texts )
{
  diagnostics_.clear();

  IndexedEntryMap merged;
  for ( const auto& text : texts ) {
    merged = overlay_entries( merged, scan_indexed_entries(text,
      config_.key_pattern, config_.extract, &diagnostics_) );
  }

  ordered_node doc = ordered_node::mapping();
  for ( const auto& [key, fields] : merged ) {
    doc[ key ] = this->decode_entry( key, fields );
  }
  return doc;
}

// Configured fields come first, in configuration order, followed by the
// remaining fields as raw text
inline cinit::ordered_node cinit::Extractor::decode_entry(
  const std::string& key, const FieldMap& fields )
{
  ordered_node entry = ordered_node::mapping();
  for ( const auto& [name, decoder] : config_.fields ) {
    auto it = fields.find( name );
    if ( it == fields.end() ) continue;
    try {
      entry[ name ] = this->decode_field( decoder, it->second );
    }
    catch ( const Error& ex ) {
      diagnostics_.push_back( key + "." + name + ": " + ex.what()
        + " (kept raw text)" );
      entry[ name ] = internal::make_node_from( it->second );
    }
  }

  if ( !config_.keep_unlisted_fields ) return entry;
  for ( const auto& [name, raw] : fields ) {
    if ( entry.contains(name) ) continue;
    entry[ name ] = internal::make_node_from( raw );
  }
  return entry;
}

inline cinit::ordered_node cinit::Extractor::decode_field(
  FieldDecoder decoder, const std::string& raw )
{
  switch ( decoder ) {
    case FieldDecoder::Integer:
      return internal::make_node_from< std::int64_t >(
        evaluate_expression(raw, config_.symbols) );
    case FieldDecoder::String:
      return internal::make_node_from( decode_string(raw) );
    case FieldDecoder::MacroArguments:
      return internal::make_sequence_node( decode_macro_arguments(raw) );
    case FieldDecoder::BraceList:
      return internal::make_sequence_node( decode_brace_list(raw) );
    case FieldDecoder::EntryList: {
      std::vector< ordered_node > seq;
      for ( const auto& e : decode_entry_list(raw, config_.nested_keywords) ) {
        seq.push_back( internal::make_entry_node(e) );
      }
      return internal::make_node_from( seq );
    }
    case FieldDecoder::Raw:
      break;
  }
  return internal::make_node_from( raw );
}
