#include "../rexpand.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"
#include "./fw/cpp-grammar.hpp"

#include <thread>
#include <atomic>

using namespace Rexpand;

const auto ECMASCRIPT = DialectProfile::preset("ecmascript");

CASE("introspection") {
	auto g = compile(CPP_GRAMMAR);

	CHECK(g.names() == std::vector<string>{"ws", "ws1", "id", "scope", "type", "ClassHead", "FunctionSig", "LineComment"});
	CHECK(g.names(Visibility::Internal).size() == 5);
	CHECK(g.contains("scope"));
	CHECK(!g.contains("Scope"));
	CHECK(g.macros().size() == 8);

	auto& type = g.definition("type");
	CHECK(type.visibility == Visibility::Internal);
	CHECK(type.line == 11);
	CHECK(type.raw_body == "$(scope)$(id)(?:<[^>]*>)?");

	auto& deps = g.dependencies("type");
	REQUIRE(deps.size() == 2);
	CHECK(deps[0].ref.name == "scope");
	CHECK(deps[1].target == *g.macros().find("id"));
}

CASE("unknown names") {
	auto g = compile("$(A)=a");
	CHECK_THROWS_AS(g.pattern("B"), std::out_of_range);
	CHECK_THROWS_AS(g.expansion("B"), std::out_of_range);
	CHECK_THROWS_AS(g.definition("B"), std::out_of_range);
}

CASE("empty grammar") {
	auto g = compile("// nothing here\n\n");
	CHECK(g.names().empty());
	CHECK(g.warnings().empty());
}

CASE("internal macros can be adapted too") {
	auto g = compile(CPP_GRAMMAR);
	CHECK(g.pattern("id").text == "[A-Za-z_][A-Za-z0-9_]*");
}

CASE("patterns carry their validation report") {
	auto g = compile(CPP_GRAMMAR);

	auto& named = g.pattern("ClassHead");
	CHECK(named.validation.capture_count == 2);
	CHECK(named.validation.capture_names == std::vector<string>{"name", "base"});

	// No names left in the text, but the captures still know them
	auto& plain = g.pattern("ClassHead", ECMASCRIPT);
	CHECK(plain.validation.capture_count == 2);
	CHECK(plain.validation.capture_names == std::vector<string>{"", ""});
	CHECK(plain.captures[1].name == "base");
}

//---------------------------------------------------------------------------
// Caching
//---------------------------------------------------------------------------
CASE("patterns are cached per macro, profile and options") {
	auto g = compile(CPP_GRAMMAR);

	auto& p1 = g.pattern("ClassHead");
	auto& p2 = g.pattern("ClassHead", DialectProfile::parse("pcre2"));
	CHECK(&p1 == &p2);

	auto& p3 = g.pattern("ClassHead", ECMASCRIPT);
	CHECK(&p1 != &p3);
	CHECK(p1.text != p3.text);

	auto& p4 = g.pattern("ClassHead", ECMASCRIPT, {.named_as_noncapturing = true});
	CHECK(&p3 != &p4);
	CHECK(p4.captures.empty());

	// Same abilities, same entry, whatever the preset was called
	CHECK(&g.pattern("ClassHead", DialectProfile::preset("re2")) == &p1);
}

CASE("failures are cached too") {
	auto g = compile("$(!G)=(?<n>x)\n$(Twice)=$(G)$(G)\n$(Once)=$(G)");
	CHECK_THROWS_AS(g.pattern("Twice"), DuplicateGroupNameError);
	CHECK_THROWS_AS(g.pattern("Twice"), DuplicateGroupNameError);

	// ...and don't affect anything else
	CHECK(g.pattern("Once").index_of("n") == 1);
	CHECK(g.pattern("Twice", DialectProfile::preset("oniguruma")).captures.size() == 2);
}

CASE("concurrent requests: computed once") {
	auto g = compile(CPP_GRAMMAR);

	constexpr int THREADS = 8;
	std::vector<const CompiledPattern*> results(THREADS);
	std::atomic<bool> go = false;
	std::vector<std::thread> threads;

	for (int t = 0; t < THREADS; ++t)
		threads.emplace_back([&, t] {
			while (!go) std::this_thread::yield();
			results[t] = &g.pattern("FunctionSig", ECMASCRIPT);
		});
	go = true;
	for (auto& t : threads) t.join();

	for (auto r : results) CHECK(r == results[0]);
}

CASE("concurrent requests: different keys") {
	auto g = compile(CPP_GRAMMAR);
	auto names = g.names(Visibility::Public);

	std::vector<std::thread> threads;
	std::atomic<int> failures = 0;
	for (auto dialect : {"pcre2", "ecmascript", "dotnet"})
		for (auto& name : names)
			threads.emplace_back([&, dialect, name] {
				auto& cp = g.pattern(name, DialectProfile::preset(dialect));
				if (cp.name != name) ++failures;
			});
	for (auto& t : threads) t.join();

	CHECK(failures.load() == 0);
}

CASE("moved grammars keep working") {
	auto g1 = compile(CPP_GRAMMAR);
	auto& before = g1.pattern("ClassHead");
	auto text = before.text;

	auto g2 = std::move(g1);
	CHECK(&g2.pattern("ClassHead") == &before); // same cache
	CHECK(g2.pattern("ClassHead").text == text);
	CHECK(g2.expansion("id") == "[A-Za-z_][A-Za-z0-9_]*");
}

//---------------------------------------------------------------------------
// The adapted patterns actually work (std::regex is an ECMAScript engine)
//---------------------------------------------------------------------------
CASE("std::regex: function signature") {
	auto g = compile(CPP_GRAMMAR);
	auto& sig = g.pattern("FunctionSig", ECMASCRIPT);
____
	cerr << sig.text << "\n";

	std::regex re(sig.text);
	std::smatch m;
	string line = "  int main(int argc)";
	REQUIRE(std::regex_search(line, m, re));
	CHECK(m[sig.index_of("ret")]  == "int");
	CHECK(m[sig.index_of("func")] == "main");
	CHECK(m[sig.index_of("args")] == "int argc");

	line = "std::vector<int> ns::Foo::bar()";
	REQUIRE(std::regex_search(line, m, re));
	CHECK(m[sig.index_of("ret")]  == "std::vector<int>");
	CHECK(m[sig.index_of("func")] == "ns::Foo::bar");
	CHECK(m[sig.index_of("args")] == "");
}

CASE("std::regex: class head") {
	auto g = compile(CPP_GRAMMAR);
	auto& head = g.pattern("ClassHead", ECMASCRIPT);

	std::regex re(head.text);
	std::smatch m;
	string line = "class Foo : public Bar<int>";
	REQUIRE(std::regex_search(line, m, re));
	CHECK(m[head.index_of("name")] == "Foo");
	CHECK(m[head.index_of("base")] == "Bar<int>");

	line = "struct Plain {";
	REQUIRE(std::regex_search(line, m, re));
	CHECK(m[head.index_of("name")] == "Plain");
	CHECK(!m[head.index_of("base")].matched);
}

CASE("DUMP") {
	auto g = compile("$(!A)=a\n$(B)=$(!A)b");
	g.DUMP();
	CHECK(g.warnings().size() == 1);
}
