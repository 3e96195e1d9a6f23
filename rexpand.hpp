#ifndef _REXPAND_HPP_
#define _REXPAND_HPP_
/*****************************************************************************
  Regex macro grammar compiler

    A grammar is a list of named regex fragments ("macros"), one per line,
    composed by reference:

        // whitespace
        $(!ws)=[ \t]*
        $(!id)=[A-Za-z_]\w*
        $(ClassHead)=class$(ws)(?<name>$(id))

    `!` marks an internal (composition-only) macro. A macro can only refer to
    macros defined above it, so the expansion order is just the file order,
    and cycles can't happen.

    compile() expands every macro exactly once (into a single arena string),
    and CompiledGrammar::pattern() then adapts an expansion to the abilities
    of some actual regex engine, described by a DialectProfile (named
    captures, duplicate group names, variable-length lookbehind, explicit
    capture mode). Adapted patterns are cached per (macro, profile, options).

  NOTE:

  - Nothing here executes the resulting regexes. (std::regex is only used for
    taking apart the grammar lines themselves.)

  - The compiled grammar copies everything it needs from the source text.

  - If you need to #include this in more than one translation units, then
    #define REXPAND_DEDUP for all but the first one.

 *****************************************************************************/

//=============================================================================
//---------------------------------------------------------------------------
// The usual "ground-levelling" layer...
//---------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <stdexcept>
#include <format>
#include <string>
#include <string_view>
#include <iostream>
	using std::cerr, std::endl;

#define CONST constexpr static auto
#define OUT

//! For variadic macros, e.g. for calling std::format(...):
//!
//! The old MSVC preproc. suppresses the extra ',' when no more args, but it
//! doesn't understand __VA_OPT__, so the two can't be unified...
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _Sz_CONFORMANT_PREPROCESSOR 1
#elif defined(_MSC_VER) && defined(_MSVC_TRADITIONAL) && _MSVC_TRADITIONAL // Old MS prep.
#  define _Sz_OLD_MSVC_PREPROCESSOR 1
#endif

#ifndef NDEBUG
#  if defined(_Sz_CONFORMANT_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
     // Same as DBG(), but with no trailing \n (for continuation lines)
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__))
     // Continuation lines -- same as DBG(), but without the DBG prefix
#    define _DBG(msg, ...) std::cerr << std::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
     // Line fragment -- neither DBG prefix, no trailing \n
#    define _DBG_(msg, ...) std::cerr << std::format(msg __VA_OPT__(,) __VA_ARGS__)
#  elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__)) << std::endl
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__))
#    define _DBG(msg, ...) std::cerr << std::format(msg, __VA_ARGS__) << std::endl
#    define _DBG_(msg, ...) std::cerr << std::format(msg, __VA_ARGS__)
#  else
#    error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#  endif

#  define DBG_DEFAULT_TRIM_LEN 30
   // Trim length is ignored as yet, just using the default:
   #define DBG_TRIM(str, ...) (std::string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
		(std::string(std::string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3))) + "..." : \
		std::string(str))
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#  define _DBG_(msg, ...)
#  define DBG_TRIM(str, ...) std::string(str)
#endif

// Note: ERROR() below is _not_ a debug feature!
// Type is one of the exception classes below, `where` is a Where{...}.
#if defined(_Sz_CONFORMANT_PREPROCESSOR)
#  define ERROR(Type, where, msg, ...) throw Type((where), std::format(msg __VA_OPT__(,) __VA_ARGS__))
#elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#  define ERROR(Type, where, msg, ...) throw Type((where), std::format(msg, __VA_ARGS__))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

// Tame MSVC -Wall just a little
#ifdef _MSC_VER
#  pragma warning(disable:5045) // Compiler will insert Spectre mitigation for memory load if /Qspectre switch specified
#  pragma warning(disable:4514) // unreferenced inline function has been removed
#endif
//---------------------------------------------------------------------------
//=============================================================================


//---------------------------------------------------------------------------
#include <regex>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <memory>
#include <mutex>
#include <future>
#include <tuple>
#include <utility> // move


//---------------------------------------------------------------------------
namespace Rexpand {

	using std::string;
	using std::string_view;
	using REGEX = std::regex;

	CONST npos = string_view::npos;

	CONST INTERNAL_MARKER = '!'; // $(!name)=... defines an internal macro
	CONST MAX_IDENTIFIER_LENGTH = 255;

	using MacroId = size_t; // == position in the MacroTable


//---------------------------------------------------------------------------
// Errors...
//---------------------------------------------------------------------------
struct Where
{
	size_t line = 0; // 1-based grammar line, or 0 if n/a
	string macro;    // macro being processed, if any

	string str() const {
		if (line && !macro.empty()) return std::format("line {}, '{}': ", line, macro);
		if (line)                   return std::format("line {}: ", line);
		if (!macro.empty())         return std::format("'{}': ", macro);
		return "";
	}
};

struct Error : std::runtime_error
{
	Error(const Where& where, const string& msg):
		std::runtime_error(std::format("- ERROR: {}{}", where.str(), msg)),
		where(where), detail(msg) {}

	Where  where;
	string detail; // what() without the "- ERROR: <where>" prefix
};

	// Input errors of compile()...
	struct GrammarError : Error { using Error::Error; };

	struct ParseError                 : GrammarError { using GrammarError::GrammarError; };
	struct InvalidIdentifierError     : GrammarError { using GrammarError::GrammarError; };
	struct DuplicateNameError         : GrammarError { using GrammarError::GrammarError; };
	struct ResourceLimitExceededError : GrammarError { using GrammarError::GrammarError; };

	// Substitutions that, put side by side, spell a new $(name) token,
	// e.g. $(!end)=$ and then $(X)=$(end)(b)
	struct AmbiguousExpansionError    : GrammarError { using GrammarError::GrammarError; };

	struct UndefinedReferenceError : GrammarError
	{
		UndefinedReferenceError(const Where& where, string missing, const string& msg):
			GrammarError(where, msg), missing(std::move(missing)) {}

		string missing; // the name that couldn't be resolved
	};

	// Errors of adapting one macro to one dialect; the grammar stays usable.
	struct DialectError : Error { using Error::Error; };

	struct UnsupportedConstructError : DialectError { using DialectError::DialectError; };

	struct DuplicateGroupNameError : DialectError
	{
		DuplicateGroupNameError(const Where& where, string group, std::vector<size_t> positions);

		string              group;
		std::vector<size_t> positions; // offsets of each '(' in the adapted text
	};

	// A bug, not an input error: some guarantee of the pipeline was broken.
	struct InternalExpansionInvariantError : std::logic_error
	{
		InternalExpansionInvariantError(const Where& where, const string& msg):
			std::logic_error(std::format("- INTERNAL ERROR: {}{}", where.str(), msg)),
			where(where) {}

		Where where;
	};

	// Bad DialectProfile text
	struct ConfigError : std::invalid_argument
	{
		ConfigError(const Where&, const string& msg):
			std::invalid_argument(std::format("- ERROR: {}", msg)) {}
	};


//---------------------------------------------------------------------------
// Configuration...
//---------------------------------------------------------------------------
// Ceilings against pathological grammars (e.g. A=xx, B=$(A)$(A), C=$(B)$(B)...
// doubles at each step).
struct Limits
{
	size_t max_macros         = 10'000;
	size_t max_grammar_bytes  = 4 << 20;
	size_t max_body_bytes     = 64 << 10;
	size_t max_expanded_bytes = 16 << 20; // all expansions together
};

// What the target regex engine can do
struct DialectProfile
{
	bool named_capture_support             = true;
	bool duplicate_named_groups_allowed    = false;
	bool variable_length_lookbehind_support = false;
	bool explicit_capture_only             = false;

	// Comma-separated list of preset names and key=value items, applied
	// left to right, e.g. "pcre2,explicitCaptureOnly=1". The keys are
	//   namedCaptureSupport, duplicateNamedGroupsAllowed,
	//   variableLengthLookbehindSupport, explicitCaptureOnly
	// and the values 1/0, true/false, yes/no, on/off.
	// Anything else is a ConfigError.
	static DialectProfile parse(string_view text);

	// pcre2, oniguruma, re2, ecmascript (std::regex), dotnet
	static DialectProfile preset(string_view name);

	string to_string() const; // in parse() format

	unsigned bits() const {
		return unsigned(named_capture_support)
		     | unsigned(duplicate_named_groups_allowed)     << 1
		     | unsigned(variable_length_lookbehind_support) << 2
		     | unsigned(explicit_capture_only)              << 3;
	}

	bool operator==(const DialectProfile&) const = default;
};

// Caller preferences for pattern(), beyond what the engine can do
struct AdaptOptions
{
	bool named_as_noncapturing   = false; // w/o named capture support: (?<n>...) -> (?:...), instead of (...)
	bool disambiguate_duplicates = false; // w/o duplicate names: rename the 2nd, 3rd... G to G_2, G_3...
	                                      // instead of failing with DuplicateGroupNameError

	unsigned bits() const { return unsigned(named_as_noncapturing) | unsigned(disambiguate_duplicates) << 1; }
};


//---------------------------------------------------------------------------
// Grammar data...
//---------------------------------------------------------------------------
enum class Visibility { Internal, Public };

struct MacroDefinition
{
	string     name;
	Visibility visibility = Visibility::Public;
	string     raw_body;  // still with the $(...) references in it
	size_t     line = 0;
};

// Definitions in file order; names unique
class MacroTable
{
public:
	MacroId add(MacroDefinition&& def); // Throws DuplicateNameError

	const MacroDefinition& operator[](MacroId id) const { return defs.at(id); }
	std::optional<MacroId> find(const string& name) const;

	size_t size() const { return defs.size(); }
	bool empty() const { return defs.empty(); }

	auto begin() const { return defs.cbegin(); }
	auto end()   const { return defs.cend(); }

private:
	std::vector<MacroDefinition>        defs;
	std::unordered_map<string, MacroId> index;
};

// A $(name) token inside a raw body
struct Reference
{
	size_t offset = 0; // of the '$'
	size_t length = 0; // of the whole token
	string name;
	bool   marked = false; // $(!name): the marker means nothing here (lint)
};

struct Dependency
{
	MacroId   target;
	Reference ref;
};

// For each macro: its references, in body order
using DependencyGraph = std::vector<std::vector<Dependency>>;

struct Warning
{
	Where  where;
	string message;
};

// Stripped grammar line
struct SourceLine
{
	size_t line;
	string text;
};

class Expansions;
Expansions expand(const MacroTable& table, const DependencyGraph& graph, const Limits& limits);

// The expanded text of every macro, all in one arena, indexed by MacroId
class Expansions
{
public:
	string_view operator[](MacroId id) const {
		auto [offset, length] = spans.at(id);
		return string_view(arena).substr(offset, length);
	}
	size_t size()  const { return spans.size(); }
	size_t bytes() const { return arena.size(); }

private:
	friend Expansions expand(const MacroTable&, const DependencyGraph&, const Limits&);

	string arena;
	std::vector<std::pair<size_t, size_t>> spans; // (offset, length) in arena
};


//---------------------------------------------------------------------------
// Adapted output...
//---------------------------------------------------------------------------
struct CaptureGroup
{
	size_t index;    // 1-based, left to right among the capturing groups
	string name;     // empty if unnamed
	size_t position; // offset of its '(' in the text
};

struct ValidationReport
{
	size_t capture_count = 0;
	std::vector<string> capture_names; // "" for unnamed ones
};

struct CompiledPattern
{
	string name; // of the macro
	string text; // ready for the engine

	std::map<string, size_t>  group_index; // name -> index (of the first, if the name repeats)
	std::vector<CaptureGroup> captures;

	ValidationReport validation; // filled in by CompiledGrammar::pattern()

	size_t index_of(const string& group) const {
		if (auto it = group_index.find(group); it != group_index.end()) return it->second;
		throw std::out_of_range(std::format("- ERROR: no capture group '{}' in '{}'", group, name));
	}
};



//---------------------------------------------------------------------------
// Pipeline stages (compile() and pattern() run these in this order)
//---------------------------------------------------------------------------
	// [A-Za-z_][A-Za-z0-9_]*, at most MAX_IDENTIFIER_LENGTH long
	bool is_identifier(string_view s);

	// Throws ParseError for an unterminated block comment
	std::vector<SourceLine> strip_comments(string_view text);

	// Throws ParseError, InvalidIdentifierError, DuplicateNameError, ResourceLimitExceededError
	MacroTable parse_definitions(const std::vector<SourceLine>& lines, const Limits& limits = {});

	// The unescaped $(name) / $(!name) tokens of a body
	std::vector<Reference> scan_references(string_view body);

	// Throws UndefinedReferenceError; collects lint into `warnings`
	DependencyGraph resolve_dependencies(const MacroTable& table, OUT std::vector<Warning>& warnings);

	// expand() is declared above, with Expansions.
	// Throws ResourceLimitExceededError, AmbiguousExpansionError

	// Throws UnsupportedConstructError, DuplicateGroupNameError
	CompiledPattern adapt(const Where& where, string_view expanded,
	                      const DialectProfile& profile, const AdaptOptions& options = {});

	// Throws InternalExpansionInvariantError only
	ValidationReport validate(const CompiledPattern& pattern);


//---------------------------------------------------------------------------
// Regex syntax scanning
//---------------------------------------------------------------------------
namespace Syntax {

	// True if text[pos] is preceded by an odd number of backslashes
	bool escaped(string_view text, size_t pos);

	// Length of the character class opening at text[pos] (a '['), including
	// the closing ']'; npos if it's not closed within `text`.
	// Handles [^...], a leading literal ']', escapes and [:posix:] names.
	size_t class_length(string_view text, size_t pos);

	struct Group
	{
		enum Kind {
			PLAIN,      // (
			NAMED,      // (?<name>  (?P<name>  (?'name'
			LOOKBEHIND, // (?<=  (?<!
			OTHER,      // (?:  (?=  (?!  (?>  (?i)  (*VERB) ...
		} kind = PLAIN;

		size_t open    = 0;    // offset of the '('
		size_t header  = 1;    // length of the opening syntax
		size_t close   = npos; // offset of the matching ')'
		string name;           // NAMED only
		size_t name_at = 0;    // NAMED only: offset of the name in the header
	};

	struct Backref // \k<n>  \k'n'  \k{n}  (?P=n), and numeric: \1 ... \99...
	{
		size_t pos = 0;
		size_t len = 0;
		string name;            // the digits, if numeric
		bool   numeric = false;
	};

	struct Structure
	{
		std::vector<Group>   groups; // in the order of their '('
		std::vector<Backref> backrefs;
	};

	// Throws UnsupportedConstructError for unbalanced parens, unterminated
	// classes and malformed group names
	Structure scan(string_view pattern, const Where& where);

	// The first sign of variable-length content in a lookbehind body, or ""
	string variable_length_evidence(string_view body);

} // namespace Syntax


//---------------------------------------------------------------------------
class CompiledGrammar
//---------------------------------------------------------------------------
{
	struct PatternCache
	{
		using Key = std::tuple<MacroId, unsigned, unsigned>; // macro, profile bits, option bits

		std::mutex lock;
		std::map<Key, std::shared_future<CompiledPattern>> entries;
	};

public:
	// Normally made by compile()
	CompiledGrammar(MacroTable&& table, DependencyGraph&& graph, Expansions&& expansions,
	                std::vector<Warning>&& warnings);

	CompiledGrammar(CompiledGrammar&&) = default;
	CompiledGrammar& operator=(CompiledGrammar&&) = default;

	// Adapted, validated and cached; safe to call from multiple threads.
	// Unknown names throw std::out_of_range, adaptation failures DialectError.
	const CompiledPattern& pattern(const string& name, const DialectProfile& profile = {},
	                               const AdaptOptions& options = {}) const;

	string_view expansion(const string& name) const { return expansions[_id(name)]; }
	const MacroDefinition& definition(const string& name) const { return table[_id(name)]; }
	const std::vector<Dependency>& dependencies(const string& name) const { return graph[_id(name)]; }

	bool contains(const string& name) const { return table.find(name).has_value(); }

	std::vector<string> names() const;
	std::vector<string> names(Visibility visibility) const;

	const MacroTable& macros() const { return table; }
	const std::vector<Warning>& warnings() const { return lint; }

#ifndef NDEBUG
	void DUMP() const { _dump(); }
#else
	void DUMP() const {}
#endif

private:
	MacroId _id(const string& name) const;
	void _dump() const;

	MacroTable           table;
	DependencyGraph      graph;
	Expansions           expansions;
	std::vector<Warning> lint;

	std::unique_ptr<PatternCache> cache; //! A pointer only to keep the grammar movable
};

	// Throws GrammarError (see the stages above)
	CompiledGrammar compile(string_view grammar_text, const Limits& limits = {});

} // namespace Rexpand


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//


#ifndef REXPAND_DEDUP
//===========================================================================
#include <algorithm>
#include <charconv>
#include <set>

namespace Rexpand {

//---------------------------------------------------------------------------
DuplicateGroupNameError::DuplicateGroupNameError(const Where& where, string group, std::vector<size_t> positions):
	DialectError(where, [&] {
		string at;
		for (auto p : positions) at += (at.empty() ? "" : ", ") + std::to_string(p);
		return std::format("capture group name '{}' is used {} times (at offsets {})", group, positions.size(), at);
	}()),
	group(std::move(group)), positions(std::move(positions))
{
}


//===========================================================================
// DialectProfile
//===========================================================================
namespace {
	struct Preset { string_view name; DialectProfile profile; };

	const Preset PRESETS[] = {
		// named, duplicates, var. lookbehind, explicit only
		{ "pcre2",      {true,  false, false, false} },
		{ "oniguruma",  {true,  true,  false, false} }, // TextMate grammars
		{ "re2",        {true,  false, false, false} }, // No lookbehind at all, actually
		{ "ecmascript", {false, false, false, false} }, // std::regex::ECMAScript
		{ "dotnet",     {true,  true,  true,  false} },
	};

	string_view trim(string_view s)
	{
		while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
		while (!s.empty() && (s.back()  == ' ' || s.back()  == '\t')) s.remove_suffix(1);
		return s;
	}
}

DialectProfile DialectProfile::preset(string_view name)
{
	for (auto& p : PRESETS) if (p.name == name) return p.profile;
	ERROR(ConfigError, Where{}, "unknown dialect preset '{}'", name);
}

DialectProfile DialectProfile::parse(string_view text)
{
	DialectProfile profile;

	while (!text.empty())
	{
		auto comma = text.find(',');
		auto item = trim(text.substr(0, comma));
		text = comma == npos ? string_view{} : text.substr(comma + 1);
		if (item.empty()) continue;

		auto eq = item.find('=');
		if (eq == npos) {
			profile = preset(item);
			continue;
		}

		auto key = trim(item.substr(0, eq));
		auto val = trim(item.substr(eq + 1));

		bool flag;
		if      (val == "1" || val == "true"  || val == "yes" || val == "on")  flag = true;
		else if (val == "0" || val == "false" || val == "no"  || val == "off") flag = false;
		else ERROR(ConfigError, Where{}, "invalid value '{}' for dialect option '{}'", val, key);

		if      (key == "namedCaptureSupport")             profile.named_capture_support = flag;
		else if (key == "duplicateNamedGroupsAllowed")     profile.duplicate_named_groups_allowed = flag;
		else if (key == "variableLengthLookbehindSupport") profile.variable_length_lookbehind_support = flag;
		else if (key == "explicitCaptureOnly")             profile.explicit_capture_only = flag;
		else ERROR(ConfigError, Where{}, "unknown dialect option '{}'", key);
	}
	return profile;
}

string DialectProfile::to_string() const
{
	return std::format("namedCaptureSupport={},duplicateNamedGroupsAllowed={},"
	                   "variableLengthLookbehindSupport={},explicitCaptureOnly={}",
		int(named_capture_support), int(duplicate_named_groups_allowed),
		int(variable_length_lookbehind_support), int(explicit_capture_only));
}


//===========================================================================
// Syntax scanning
//===========================================================================
bool is_identifier(string_view s)
{
	static const REGEX IDENTIFIER("[A-Za-z_][A-Za-z0-9_]*");
	//! std::regex_match recurses per char., so the length must be checked first
	return s.size() <= MAX_IDENTIFIER_LENGTH && std::regex_match(s.begin(), s.end(), IDENTIFIER);
}

bool Syntax::escaped(string_view text, size_t pos)
{
	size_t n = 0;
	while (pos > n && text[pos - n - 1] == '\\') ++n;
	return n % 2;
}

size_t Syntax::class_length(string_view p, size_t pos)
{
	assert(pos < p.size() && p[pos] == '[');

	auto i = pos + 1;
	if (i < p.size() && p[i] == '^') ++i;
	if (i < p.size() && p[i] == ']') ++i; // leading ']' is a literal

	for (; i < p.size(); ++i)
	{
		if (p[i] == '\\') { ++i; continue; }
		if (p[i] == ']') return i - pos + 1;
		if (p[i] == '[' && i + 1 < p.size() && (p[i+1] == ':' || p[i+1] == '.' || p[i+1] == '=')) {
			const char term[] = {p[i+1], ']', 0}; // [:alpha:], [.ch.], [=e=]
			if (auto end = p.find(term, i + 2); end != npos) i = end + 1;
		}
	}
	return npos;
}

Syntax::Structure Syntax::scan(string_view p, const Where& where)
{
	Structure s;
	std::vector<size_t> open; // indexes of the yet unclosed groups

	for (size_t i = 0; i < p.size(); ++i)
	{
		auto rest = p.substr(i);

		if (p[i] == '\\') {
			if (rest.starts_with("\\k<") || rest.starts_with("\\k'") || rest.starts_with("\\k{")) {
				char closer = rest[2] == '<' ? '>' : rest[2] == '{' ? '}' : '\'';
				if (auto end = rest.find(closer, 3); end != npos) {
					s.backrefs.push_back({i, end + 1, string(rest.substr(3, end - 3))});
					i += end;
					continue;
				}
			}
			if (rest.size() > 1 && rest[1] >= '1' && rest[1] <= '9') {
				auto digits = rest.substr(1, rest.find_first_not_of("0123456789", 1) - 1);
				s.backrefs.push_back({i, digits.size() + 1, string(digits), true});
				i += digits.size();
				continue;
			}
			++i; // skip the escaped char
			continue;
		}

		if (p[i] == '[') {
			auto len = class_length(p, i);
			if (len == npos)
				ERROR(UnsupportedConstructError, where, "unterminated character class at offset {}", i);
			i += len - 1;
			continue;
		}

		if (p[i] == ')') {
			if (open.empty())
				ERROR(UnsupportedConstructError, where, "unbalanced ')' at offset {}", i);
			s.groups[open.back()].close = i;
			open.pop_back();
			continue;
		}

		if (p[i] != '(') continue;

		if (rest.starts_with("(?P=")) {
			auto end = rest.find(')');
			if (end == npos)
				ERROR(UnsupportedConstructError, where, "unterminated backreference at offset {}", i);
			s.backrefs.push_back({i, end + 1, string(rest.substr(4, end - 4))});
			i += end;
			continue;
		}

		Group g;
		g.open = i;
		if (rest.starts_with("(?<=") || rest.starts_with("(?<!")) {
			g.kind = Group::LOOKBEHIND;
			g.header = 4;
		} else if (rest.starts_with("(?<") || rest.starts_with("(?P<") || rest.starts_with("(?'")) {
			g.kind = Group::NAMED;
			g.name_at = rest[2] == 'P' ? 4 : 3;
			char closer = rest[g.name_at - 1] == '\'' ? '\'' : '>';
			auto end = rest.find(closer, g.name_at);
			if (end == npos)
				ERROR(UnsupportedConstructError, where, "unterminated group name at offset {}", i);
			g.name = rest.substr(g.name_at, end - g.name_at);
			if (!is_identifier(g.name))
				ERROR(UnsupportedConstructError, where, "invalid capture group name '{}' at offset {}", g.name, i);
			g.header = end + 1;
		} else if (rest.starts_with("(?") || rest.starts_with("(*")) {
			g.kind = Group::OTHER;
			g.header = 2;
		}

		i += g.header - 1;
		open.push_back(s.groups.size());
		s.groups.push_back(std::move(g));
	}

	if (!open.empty())
		ERROR(UnsupportedConstructError, where, "unbalanced '(' at offset {}", s.groups[open.back()].open);

	return s;
}

string Syntax::variable_length_evidence(string_view body)
{
	auto number = [](string_view digits, OUT unsigned long& n) {
		return !digits.empty()
			&& std::from_chars(digits.data(), digits.data() + digits.size(), n).ptr == digits.data() + digits.size();
	};

	bool counted = false; // the previous token was a fixed {n} (or {n,n})

	for (size_t i = 0; i < body.size(); ++i)
	{
		bool after_count = counted;
		counted = false;

		switch (auto c = body[i]; c)
		{
		case '\\':
			++i;
			break;

		case '[':
			if (auto len = class_length(body, i); len != npos) i += len - 1;
			break;

		case '(': // "(?" and "(*" are not quantifiers
			if (i + 1 < body.size() && (body[i+1] == '?' || body[i+1] == '*')) ++i;
			break;

		case '+':
			if (after_count) break; // possessive {n}+, still fixed
			[[fallthrough]];
		case '*':
			return std::format("'{}' quantifier at offset {}", c, i);

		case '?':
			if (after_count) break; // lazy {n}?, still fixed
			return std::format("'?' quantifier at offset {}", i);

		case '{': {
			auto close = body.find('}', i);
			if (close == npos) break;
			auto inner = body.substr(i + 1, close - i - 1);
			auto comma = inner.find(',');
			unsigned long lo, hi;
			if (!number(inner.substr(0, comma), lo)) break; // not a quantifier, just a '{'
			if (comma != npos && (inner.size() == comma + 1 || !number(inner.substr(comma + 1), hi) || lo != hi))
				return std::format("'{{{}}}' quantifier at offset {}", inner, i);
			i = close;
			counted = true;
			break;
		}
		default:
			break;
		}
	}
	return "";
}


//===========================================================================
// CommentStripper
//===========================================================================
std::vector<SourceLine> strip_comments(string_view text)
{
	std::vector<SourceLine> lines;
	string current;
	size_t line = 1;
	size_t comment_line = 0; // where the open /* started, if any
	bool   cut = false;      // current line lost a comment

	auto flush = [&] {
		if (!current.empty() && current.back() == '\r') current.pop_back();
		if (cut) while (!current.empty() && (current.back() == ' ' || current.back() == '\t')) current.pop_back();
		if (current.find_first_not_of(" \t\r") != string::npos) lines.push_back({line, std::move(current)});
		current.clear();
		cut = false;
	};

	for (size_t i = 0; i < text.size(); ++i)
	{
		auto c = text[i];

		if (c == '\n') {
			flush();
			++line;
			continue;
		}

		if (comment_line) {
			if (c == '*' && i + 1 < text.size() && text[i+1] == '/') {
				comment_line = 0;
				++i;
			}
			continue;
		}

		if (c == '\\' && i + 1 < text.size() && text[i+1] != '\n') {
			current += c;
			current += text[++i];
			continue;
		}

		// Classes are copied verbatim; one still open at the end of the line
		// takes the rest of the line with it.
		if (c == '[') {
			auto eol  = text.find('\n', i);
			auto rest = text.substr(i, eol == npos ? npos : eol - i);
			auto len  = Syntax::class_length(rest, 0);
			if (len == npos) len = rest.size();
			current += rest.substr(0, len);
			i += len - 1;
			continue;
		}

		if (c == '/' && i + 1 < text.size()) {
			if (text[i+1] == '/') {
				auto eol = text.find('\n', i);
				i = (eol == npos ? text.size() : eol) - 1; // the \n itself still flushes
				cut = true;
				continue;
			}
			if (text[i+1] == '*') {
				comment_line = line;
				cut = true;
				++i;
				continue;
			}
		}

		current += c;
	}

	if (comment_line)
		ERROR(ParseError, Where{comment_line}, "unterminated block comment");

	flush();
DBG("strip_comments: {} line(s) kept of {}", lines.size(), line);
	return lines;
}


//===========================================================================
// DefinitionParser
//===========================================================================
MacroId MacroTable::add(MacroDefinition&& def)
{
	if (auto it = index.find(def.name); it != index.end())
		ERROR(DuplicateNameError, (Where{def.line, def.name}), "'{}' is already defined on line {}",
			def.name, defs[it->second].line);

	auto id = defs.size();
	index.emplace(def.name, id);
	defs.push_back(std::move(def));
	return id;
}

std::optional<MacroId> MacroTable::find(const string& name) const
{
	if (auto it = index.find(name); it != index.end()) return it->second;
	return std::nullopt;
}

MacroTable parse_definitions(const std::vector<SourceLine>& lines, const Limits& limits)
{
	MacroTable table;

	for (auto& [line, text] : lines)
	{
		// $(name)=body, $(!name)=body; the body is the rest of the line
		string_view t = text;
		auto open  = t.find_first_not_of(" \t");
		auto close = t.find(')');
		if (open == npos || !t.substr(open).starts_with("$(") || close == npos || close < open
		    || close + 1 >= t.size() || t[close + 1] != '=')
			ERROR(ParseError, Where{line}, "expected `$(name)=body`, got \"{}\"", DBG_TRIM(text));

		auto head = t.substr(open + 2, close - open - 2);
		bool internal = !head.empty() && head.front() == INTERNAL_MARKER;
		if (internal) head.remove_prefix(1);
		string name(head);
		auto body = t.substr(close + 2);

		if (body.size() > limits.max_body_bytes)
			ERROR(ResourceLimitExceededError, (Where{line, DBG_TRIM(name)}), "body longer than {} bytes", limits.max_body_bytes);
		if (!is_identifier(name))
			ERROR(InvalidIdentifierError, (Where{line, DBG_TRIM(name)}), "'{}' is not a valid macro name", DBG_TRIM(name));
		if (table.size() >= limits.max_macros)
			ERROR(ResourceLimitExceededError, (Where{line, name}), "more than {} macros", limits.max_macros);

		table.add({
			std::move(name),
			internal ? Visibility::Internal : Visibility::Public,
			string(body),
			line,
		});
	}

DBG("parse_definitions: {} macro(s)", table.size());
	return table;
}


//===========================================================================
// DependencyResolver
//===========================================================================
std::vector<Reference> scan_references(string_view body)
{
	auto word = [](char c) {
		return c == '_' || (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
	};

	std::vector<Reference> refs;
	for (size_t i = 0; (i = body.find("$(", i)) != npos; ++i)
	{
		if (Syntax::escaped(body, i)) continue; // \$(x) is a literal "$(x)"

		auto at = i + 2;
		bool marked = at < body.size() && body[at] == INTERNAL_MARKER;
		if (marked) ++at;

		auto end = at;
		while (end < body.size() && word(body[end])) ++end;
		if (end == at || end == body.size() || body[end] != ')' || (body[at] >= '0' && body[at] <= '9'))
			continue; // not a reference, e.g. $(?=...)

		refs.push_back({i, end + 1 - i, string(body.substr(at, end - at)), marked});
		i = end;
	}
	return refs;
}

DependencyGraph resolve_dependencies(const MacroTable& table, OUT std::vector<Warning>& warnings)
{
	DependencyGraph graph(table.size());

	for (MacroId id = 0; id < table.size(); ++id)
	{
		auto& def = table[id];
		for (auto& ref : scan_references(def.raw_body))
		{
			auto target = table.find(ref.name);
			if (!target)
				throw UndefinedReferenceError(Where{def.line, def.name}, ref.name,
					std::format("reference to undefined macro '{}'", ref.name));
			if (*target >= id)
				throw UndefinedReferenceError(Where{def.line, def.name}, ref.name,
					std::format("'{}' is referenced before its definition (on line {})", ref.name, table[*target].line));

			if (ref.marked)
				warnings.push_back({Where{def.line, def.name},
					std::format("visibility marker ignored in the reference to '{}'", ref.name)});

			graph[id].push_back({*target, std::move(ref)});
		}
	}

	// Only backward edges can exist now, so it's acyclic; but check anyway.
	for (MacroId id = 0; id < graph.size(); ++id)
		for (auto& dep : graph[id])
			if (dep.target >= id)
				ERROR(InternalExpansionInvariantError, (Where{table[id].line, table[id].name}),
					"forward edge to '{}' in the dependency graph", dep.ref.name);

	return graph;
}


//===========================================================================
// Expander
//===========================================================================
Expansions expand(const MacroTable& table, const DependencyGraph& graph, const Limits& limits)
{
	assert(graph.size() == table.size());

	Expansions x;
	x.spans.reserve(table.size());

	for (MacroId id = 0; id < table.size(); ++id)
	{
		auto& def = table[id];

		// Size it first, so that the arena won't reallocate while copying from itself
		size_t length = def.raw_body.size();
		for (auto& dep : graph[id]) length = length - dep.ref.length + x.spans[dep.target].second;

		if (x.arena.size() + length > limits.max_expanded_bytes)
			ERROR(ResourceLimitExceededError, (Where{def.line, def.name}),
				"expansions would exceed {} bytes", limits.max_expanded_bytes);

		x.arena.reserve(x.arena.size() + length);
		auto offset = x.arena.size();

		std::vector<size_t> seams; // where substituted text begins or ends (relative to offset)
		size_t pos = 0;
		for (auto& dep : graph[id]) {
			x.arena.append(def.raw_body, pos, dep.ref.offset - pos);
			seams.push_back(x.arena.size() - offset);
			auto [from, len] = x.spans[dep.target];
			x.arena.append(x.arena.data() + from, len);
			seams.push_back(x.arena.size() - offset);
			pos = dep.ref.offset + dep.ref.length;
		}
		x.arena.append(def.raw_body, pos);
		x.spans.emplace_back(offset, x.arena.size() - offset);

		if (x.spans.back().second != length)
			ERROR(InternalExpansionInvariantError, (Where{def.line, def.name}),
				"expanded to {} bytes instead of {}", x.spans.back().second, length);
		if (auto left = scan_references(x[id]); !left.empty())
		{
			// A token (with the backslashes before it) spanning a seam was put
			// together by the substitutions; any other one was missed by them.
			auto& tok = left.front();
			auto text = x[id];
			auto start = tok.offset;
			while (start && text[start - 1] == '\\') --start;
			for (auto seam : seams)
				if (start < seam && seam < tok.offset + tok.length)
					ERROR(AmbiguousExpansionError, (Where{def.line, def.name}),
						"substitutions form a new reference \"{}\" at offset {}",
						text.substr(tok.offset, tok.length), tok.offset);
			ERROR(InternalExpansionInvariantError, (Where{def.line, def.name}),
				"reference to '{}' survived the expansion", tok.name);
		}

DBG("expand: #{} '{}' -> \"{}\"", id, def.name, DBG_TRIM(x[id]));
	}

	return x;
}


//===========================================================================
// DialectAdapter
//===========================================================================
CompiledPattern adapt(const Where& where, string_view expanded,
                      const DialectProfile& profile, const AdaptOptions& options)
{
DBG("adapt: '{}' for {}", where.macro, profile.to_string());
	using Syntax::Group;

	auto s = Syntax::scan(expanded, where);

	if (!profile.variable_length_lookbehind_support) {
		for (auto& g : s.groups) {
			if (g.kind != Group::LOOKBEHIND) continue;
			auto body = expanded.substr(g.open + g.header, g.close - g.open - g.header);
			if (auto why = Syntax::variable_length_evidence(body); !why.empty())
				ERROR(UnsupportedConstructError, where, "variable-length lookbehind \"{}\" at offset {}: {}",
					expanded.substr(g.open, g.close - g.open + 1), g.open, why);
		}
	}

	// Backreferences pin down their groups: those were captured on purpose.
	// Numeric ones count groups as written (named ones included); the longest
	// digit prefix naming an existing group is the reference, as in PCRE.
	std::vector<size_t> written; // written ordinal -> group
	for (size_t k = 0; k < s.groups.size(); ++k)
		if (s.groups[k].kind == Group::PLAIN || s.groups[k].kind == Group::NAMED) written.push_back(k);

	std::vector<size_t> target(s.backrefs.size(), npos); // backref -> group
	std::vector<bool> referenced(s.groups.size());
	for (size_t r = 0; r < s.backrefs.size(); ++r)
	{
		auto& b = s.backrefs[r];
		if (b.numeric) {
			for (auto n = b.name.size(); n && target[r] == npos; --n) {
				size_t ordinal = 0;
				std::from_chars(b.name.data(), b.name.data() + n, ordinal);
				if (ordinal && ordinal <= written.size()) {
					target[r] = written[ordinal - 1];
					b.len = n + 1;
				}
			}
			if (target[r] == npos)
				ERROR(UnsupportedConstructError, where, "backreference \\{} to a nonexistent group at offset {}",
					b.name, b.pos);
		} else {
			for (size_t k = 0; k < s.groups.size(); ++k)
				if (s.groups[k].kind == Group::NAMED && s.groups[k].name == b.name) { target[r] = k; break; }
		}
		if (target[r] != npos) referenced[target[r]] = true;
	}

	// What each group turns into
	struct Output
	{
		string header;
		string name;
		bool   capturing = false;
		size_t index     = 0;
		size_t position  = 0;
	};
	std::vector<Output> out(s.groups.size());

	for (size_t k = 0; k < s.groups.size(); ++k)
	{
		auto& g = s.groups[k];
		auto& o = out[k];
		o.header = expanded.substr(g.open, g.header);

		if (g.kind == Group::PLAIN) {
			o.capturing = !profile.explicit_capture_only;
			if (!o.capturing) o.header = "(?:";
			if (!o.capturing && referenced[k])
				ERROR(UnsupportedConstructError, where,
					"unnamed group at offset {} is backreferenced, but only named groups capture here", g.open);
		} else if (g.kind == Group::NAMED) {
			if (profile.named_capture_support) {
				o.capturing = true;
				o.name = g.name;
			} else if (options.named_as_noncapturing && !referenced[k]) {
				o.header = "(?:";
			} else {
				o.header = "(";
				o.capturing = true;
				o.name = g.name;
			}
		}
	}

	// Duplicate names...
	string collision;
	std::map<string, std::vector<size_t>> uses; // name -> groups
	if (!profile.duplicate_named_groups_allowed)
	{
		std::vector<string> order; // of first appearance
		for (size_t k = 0; k < out.size(); ++k) {
			if (!out[k].capturing || out[k].name.empty()) continue;
			auto& u = uses[out[k].name];
			if (u.empty()) order.push_back(out[k].name);
			u.push_back(k);
		}

		std::set<string> taken;
		for (auto& [name, groups] : uses) taken.insert(name);

		for (auto& name : order)
		{
			auto& groups = uses[name];
			if (groups.size() < 2) continue;
			if (!options.disambiguate_duplicates) {
				collision = name;
				break;
			}
			size_t suffix = 2;
			for (size_t j = 1; j < groups.size(); ++j) {
				auto& g = s.groups[groups[j]];
				auto& o = out[groups[j]];
				do o.name = std::format("{}_{}", name, suffix++); while (taken.count(o.name));
				taken.insert(o.name);
				if (profile.named_capture_support) // keep the author's syntax, just swap the name
					o.header = std::format("{}{}{}", expanded.substr(g.open, g.name_at), o.name,
					                                 expanded[g.open + g.header - 1]);
DBG("adapt: '{}' group #{} renamed to '{}'", where.macro, j + 1, o.name);
			}
		}
	}

	CompiledPattern cp;
	cp.name = where.macro;

	size_t ordinal = 0;
	for (auto& o : out) {
		if (!o.capturing) continue;
		o.index = ++ordinal;
		if (!o.name.empty()) cp.group_index.emplace(o.name, o.index); //! emplace: the first one wins
	}

	// Text edits: every group header (even if unchanged, to track positions),
	// and the backrefs that lost their names or their numbers
	struct Edit
	{
		size_t pos, len;
		string text;
		size_t group = npos;
	};
	std::vector<Edit> edits;
	for (size_t k = 0; k < s.groups.size(); ++k)
		edits.push_back({s.groups[k].open, s.groups[k].header, out[k].header, k});

	for (size_t r = 0; r < s.backrefs.size(); ++r)
	{
		auto& b = s.backrefs[r];
		if (!b.numeric && profile.named_capture_support) continue; // names are fine as they are
		if (target[r] == npos)
			ERROR(UnsupportedConstructError, where, "backreference to unknown capture group '{}' at offset {}",
				b.name, b.pos);

		auto index = out[target[r]].index;
		if (b.numeric && std::to_string(index) == string_view(b.name).substr(0, b.len - 1)) continue; // unchanged

		auto next = b.pos + b.len;
		bool digit_follows = next < expanded.size() && expanded[next] >= '0' && expanded[next] <= '9';
		edits.push_back({b.pos, b.len, digit_follows ? std::format("(?:\\{})", index)
		                                             : std::format("\\{}", index)});
	}
	std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.pos < b.pos; });

	cp.text.reserve(expanded.size());
	size_t pos = 0;
	for (auto& e : edits) {
		cp.text.append(expanded.substr(pos, e.pos - pos));
		if (e.group != npos) out[e.group].position = cp.text.size();
		cp.text += e.text;
		pos = e.pos + e.len;
	}
	cp.text.append(expanded.substr(pos));

	for (auto& o : out)
		if (o.capturing) cp.captures.push_back({o.index, o.name, o.position});

	if (!collision.empty()) {
		std::vector<size_t> positions;
		for (auto k : uses[collision]) positions.push_back(out[k].position);
		throw DuplicateGroupNameError(where, collision, std::move(positions));
	}

DBG("adapt: '{}' -> \"{}\" ({} capture(s))", where.macro, DBG_TRIM(cp.text), cp.captures.size());
	return cp;
}


//===========================================================================
// Validator
//===========================================================================
ValidationReport validate(const CompiledPattern& cp)
{
	const Where where{0, cp.name};
	const string_view t = cp.text;

	ValidationReport report;
	int depth = 0;

	for (size_t i = 0; i < t.size(); ++i)
	{
		switch (t[i])
		{
		case '\\':
			++i;
			break;

		case '[': {
			auto len = Syntax::class_length(t, i);
			if (len == npos)
				ERROR(InternalExpansionInvariantError, where, "unbalanced '[' at offset {} in \"{}\"", i, t);
			i += len - 1;
			break;
		}

		case ')':
			if (--depth < 0)
				ERROR(InternalExpansionInvariantError, where, "unbalanced ')' at offset {} in \"{}\"", i, t);
			break;

		case '(': {
			++depth;
			auto rest = t.substr(i);
			if (rest.size() < 2 || (rest[1] != '?' && rest[1] != '*')) {
				report.capture_names.emplace_back();
			} else if (rest.starts_with("(?P<") || rest.starts_with("(?'")
			       || (rest.starts_with("(?<") && !rest.starts_with("(?<=") && !rest.starts_with("(?<!"))) {
				auto at = rest[2] == 'P' ? 4 : 3;
				auto end = rest.find(rest[at - 1] == '\'' ? '\'' : '>', at);
				if (end == npos)
					ERROR(InternalExpansionInvariantError, where, "unterminated group name at offset {}", i);
				report.capture_names.emplace_back(rest.substr(at, end - at));
			}
			break;
		}
		default:
			break;
		}
	}

	if (depth)
		ERROR(InternalExpansionInvariantError, where, "{} unclosed '(' in \"{}\"", depth, t);

	if (auto left = scan_references(t); !left.empty())
		ERROR(InternalExpansionInvariantError, where, "residual reference to '{}' at offset {}",
			left.front().name, left.front().offset);

	report.capture_count = report.capture_names.size();

	// Must agree with what adapt() counted
	if (report.capture_count != cp.captures.size())
		ERROR(InternalExpansionInvariantError, where, "{} capturing group(s) in the text, {} recorded",
			report.capture_count, cp.captures.size());
	for (size_t k = 0; k < report.capture_count; ++k) {
		auto& found = report.capture_names[k];
		if (!found.empty() && found != cp.captures[k].name)
			ERROR(InternalExpansionInvariantError, where, "capture #{} is '{}' in the text, '{}' recorded",
				k + 1, found, cp.captures[k].name);
	}

	return report;
}


//===========================================================================
// CompiledGrammar
//===========================================================================
CompiledGrammar::CompiledGrammar(MacroTable&& table, DependencyGraph&& graph, Expansions&& expansions,
                                 std::vector<Warning>&& warnings):
	table(std::move(table)),
	graph(std::move(graph)),
	expansions(std::move(expansions)),
	lint(std::move(warnings)),
	cache(std::make_unique<PatternCache>())
{
	assert(this->table.size() == this->graph.size());
	assert(this->table.size() == this->expansions.size());
}

MacroId CompiledGrammar::_id(const string& name) const
{
	if (auto id = table.find(name); id) return *id;
	throw std::out_of_range(std::format("- ERROR: unknown macro '{}'", name));
}

const CompiledPattern& CompiledGrammar::pattern(const string& name, const DialectProfile& profile,
                                                const AdaptOptions& options) const
{
	auto id = _id(name);
	PatternCache::Key key{id, profile.bits(), options.bits()};

	std::shared_future<CompiledPattern> result;
	std::promise<CompiledPattern> job;
	bool mine = false;
	{
		std::lock_guard guard(cache->lock);
		if (auto it = cache->entries.find(key); it != cache->entries.end()) {
			result = it->second;
		} else {
			result = job.get_future().share();
			cache->entries.emplace(key, result);
			mine = true;
		}
	}

	// Only the first caller for a key does the work; the others wait for it.
	// Failures are stored (and rethrown) just like results.
	if (mine) {
		auto& def = table[id];
		try {
			auto cp = adapt(Where{def.line, def.name}, expansions[id], profile, options);
			cp.validation = validate(cp);
			job.set_value(std::move(cp));
		} catch (...) {
			job.set_exception(std::current_exception());
		}
	}

	return result.get();
}

std::vector<string> CompiledGrammar::names() const
{
	std::vector<string> result;
	for (auto& def : table) result.push_back(def.name);
	return result;
}

std::vector<string> CompiledGrammar::names(Visibility visibility) const
{
	std::vector<string> result;
	for (auto& def : table) if (def.visibility == visibility) result.push_back(def.name);
	return result;
}

void CompiledGrammar::_dump() const
{
	auto p = [](const string& x) { cerr << "     " << x << endl; };

	p("/------------------------------------------------------------------\\");
	for (MacroId id = 0; id < table.size(); ++id) {
		auto& def = table[id];
		p(std::format("#{} {}{} (line {}, {} ref.): \"{}\"", id,
			def.visibility == Visibility::Internal ? string(1, INTERNAL_MARKER) : "", def.name,
			def.line, graph[id].size(), expansions[id]));
	}
	for (auto& w : lint) p(std::format("warning: {}{}", w.where.str(), w.message));
	p(std::format("{} macro(s), {} bytes expanded", table.size(), expansions.bytes()));
	p("\\------------------------------------------------------------------/\n");
}


//===========================================================================
CompiledGrammar compile(string_view text, const Limits& limits)
{
	if (text.size() > limits.max_grammar_bytes)
		ERROR(ResourceLimitExceededError, Where{}, "grammar text longer than {} bytes", limits.max_grammar_bytes);

	auto lines = strip_comments(text);
	auto table = parse_definitions(lines, limits);

	std::vector<Warning> warnings;
	auto graph = resolve_dependencies(table, warnings);
	auto expansions = expand(table, graph, limits);

DBG("+++ compile: {} macro(s), {} warning(s) +++", table.size(), warnings.size());
	return CompiledGrammar(std::move(table), std::move(graph), std::move(expansions), std::move(warnings));
}

} // namespace Rexpand

#endif // REXPAND_DEDUP

#undef CONST
#undef OUT
#undef ERROR
#endif // _REXPAND_HPP_
