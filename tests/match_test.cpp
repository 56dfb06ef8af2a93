#include "test.hpp"
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

struct match_fixture {
    cligram::config config;
    cligram::matcher ctx;
    std::optional<cligram::syntax_tree> tree;
    std::string call;
    std::vector<cligram::token> tokens;
    std::optional<cligram::call_match> m;

    /// Rebuilds the matcher after `config` changed.
    void reconfigure() {
        ctx = cligram::matcher{config};
    }
    cligram::match_result match(std::string_view grammar, std::string_view call_str) {
        auto compiled = cligram::compile(grammar, config, &ctx);
        BOOST_REQUIRE_MESSAGE(compiled.has_value(), (compiled ? std::string{} : compiled.error().what));
        tree.emplace(std::move(*compiled));
        call = call_str;
        tokens = cligram::call_lexer{config}.tokenize(call);
        m.emplace(call, tokens);
        return cligram::match_call(*tree, *m, ctx);
    }
};

BOOST_FIXTURE_TEST_SUITE(match_scenario_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    auto res = match("set [loud] alarm at <time: int> (am|pm)", "set loud alarm at 7 am");
    BOOST_REQUIRE(res.has_value());
    BOOST_CHECK(m->optional(0));
    BOOST_CHECK_EQUAL(m->get<long long>("time"), 7);
    BOOST_CHECK_EQUAL(m->variant(0), 0);
    BOOST_CHECK_CLOSE(m->score(), 5.5, 1e-9);
    BOOST_CHECK(m->empty());
}
BOOST_ANON_TEST_CASE() {
    auto res = match("i [don't] like bread", "i like bread");
    BOOST_REQUIRE(res.has_value());
    BOOST_CHECK(!m->optional(0));
    BOOST_CHECK_CLOSE(m->score(), 3.0, 1e-9);
}
BOOST_ANON_TEST_CASE() {
    auto res = match("<n: int> times say <what>", "3 times say hi");
    BOOST_REQUIRE(res.has_value());
    BOOST_CHECK_EQUAL(m->get<long long>("n"), 3);
    BOOST_CHECK_EQUAL(m->get<std::string>("what"), "hi");
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("(exit|quit)", "exit").has_value());
    BOOST_CHECK_EQUAL(m->variant(0), 0);
    BOOST_REQUIRE(match("(exit|quit)", "quit").has_value());
    BOOST_CHECK_EQUAL(m->variant(0), 1);
}
BOOST_ANON_TEST_CASE() {
    auto res = match("(exit|quit)", "ex");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::suggested_literal);
    BOOST_CHECK_EQUAL(res.error().suggestion, "exit");
    BOOST_CHECK_EQUAL(res.error().what, "Did you mean 'exit'?");
    BOOST_REQUIRE(res.error().actual.has_value());
    BOOST_CHECK_EQUAL(res.error().actual->value, "ex");
    BOOST_CHECK_CLOSE(res.error().score, 0.25 * 5.2 / 6, 1e-6);
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("<expr...>", "1 + 2").has_value());
    BOOST_CHECK(m->get<std::vector<std::string>>("expr") == (std::vector<std::string>{"1", "+", "2"}));
    BOOST_CHECK(m->terminated());
    BOOST_REQUIRE(match("<expr...*>", "1  +  2").has_value());
    BOOST_CHECK_EQUAL(m->get<std::string>("expr"), "1  +  2");
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("say <what...*>", R"(say "a b" c)").has_value());
    BOOST_CHECK_EQUAL(m->get<std::string>("what"), R"("a b" c)");
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("{tell time}", "time tell").has_value());
    const double score = m->score();
    BOOST_REQUIRE(match("{tell time}", "tell time").has_value());
    BOOST_CHECK_CLOSE(m->score(), score, 1e-9);
    BOOST_CHECK_CLOSE(score, 2.0, 1e-9);
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_optional_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    // an absent optional sequence consumes nothing
    const cligram::node n = cligram::optional_sequence{{cligram::literal{"a"}, cligram::literal{"b"}}};
    const std::string str = "c d";
    const auto toks = cligram::call_lexer{}.tokenize(str);
    cligram::call_match cm{str, toks};
    BOOST_REQUIRE(cligram::match(n, cm, ctx).has_value());
    BOOST_CHECK_EQUAL(cm.tokens().size(), 2);
    BOOST_CHECK_EQUAL(cm.front().value, "c");
    BOOST_CHECK(!cm.optional(0));
    BOOST_CHECK_EQUAL(cm.score(), 0);
}
BOOST_ANON_TEST_CASE() {
    // a partially matched optional sequence is an error, not an absence
    auto res = match("a [b c] d", "a b x d");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::mismatched_literal);
    BOOST_REQUIRE(res.error().actual.has_value());
    BOOST_CHECK_EQUAL(res.error().actual->value, "x");
    BOOST_CHECK_EQUAL(res.error().what, "Expected literal 'c', got 'x'");
    BOOST_CHECK_CLOSE(res.error().score, 2.0, 1e-9);
}
BOOST_ANON_TEST_CASE() {
    // positional records are in pre-order
    BOOST_REQUIRE(match("[a [b]] [c]", "a c").has_value());
    BOOST_CHECK(m->optionals() == (std::vector<bool>{true, false, true}));
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("[loud]:volume alarm (am|pm):half", "alarm pm").has_value());
    BOOST_CHECK(!m->optional("volume"));
    BOOST_CHECK_EQUAL(m->variant("half"), 1);
    BOOST_CHECK(m->optionals().empty());
    BOOST_CHECK(m->variants().empty());
    BOOST_CHECK_THROW((void)m->optional("half"), std::out_of_range);
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("[a|b]:choice c", "b c").has_value());
    BOOST_CHECK(m->optional(0));
    BOOST_CHECK_EQUAL(m->variant("choice"), 1);
    BOOST_REQUIRE(match("[a|b]:choice c", "c").has_value());
    BOOST_CHECK(!m->optional(0));
    BOOST_CHECK_THROW((void)m->variant("choice"), std::out_of_range);
}
BOOST_ANON_TEST_CASE() {
    // [(a|b)]:id names the optional sequence, and keeps doing so once rendered
    BOOST_REQUIRE(match("[(a|b)]:id c", "b c").has_value());
    BOOST_CHECK(m->optional("id"));
    BOOST_CHECK_EQUAL(m->variant(0), 1);
    BOOST_CHECK_THROW((void)m->variant("id"), std::out_of_range);
    const std::string rendered = tree->render();
    BOOST_CHECK_EQUAL(rendered, "[(a|b)]:id c");
    BOOST_REQUIRE(match(rendered, "b c").has_value());
    BOOST_CHECK(m->optional("id"));
    BOOST_CHECK_THROW((void)m->variant("id"), std::out_of_range);
    BOOST_REQUIRE(match(rendered, "c").has_value());
    BOOST_CHECK(!m->optional("id"));
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_variant_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    // equal scores: the earlier variant wins
    BOOST_REQUIRE(match("(<x>|<y>)", "v").has_value());
    BOOST_CHECK_EQUAL(m->variant(0), 0);
    BOOST_CHECK(m->contains("x"));
    BOOST_CHECK(!m->contains("y"));
}
BOOST_ANON_TEST_CASE() {
    // the better scoring variant wins regardless of order
    BOOST_REQUIRE(match("(<x> b|a b)", "a b").has_value());
    BOOST_CHECK_EQUAL(m->variant(0), 1);
    BOOST_CHECK(!m->contains("x"));
}
BOOST_ANON_TEST_CASE() {
    auto res = match("go (north|south)", "go");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::missing_variant);
    BOOST_CHECK_EQUAL(res.error().expected, "'north' or 'south'");
    res = match("go (north|south)", "go up");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::no_matched_variant);
    BOOST_CHECK_EQUAL(res.error().what, "Expected 'north' or 'south', got 'up'");
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_literal_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    // exact > tolerated > suggested
    BOOST_REQUIRE(match("exit", "exit").has_value());
    const double exact = m->score();
    BOOST_REQUIRE(match("exit~", "exot").has_value());
    const double tolerated = m->score();
    auto res = match("exit", "exot");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::suggested_literal);
    const double suggested = res.error().score;
    BOOST_CHECK_GT(exact, tolerated);
    BOOST_CHECK_GT(tolerated, suggested);
    BOOST_CHECK_GT(suggested, 0);
}
BOOST_ANON_TEST_CASE() {
    // a suggestion scores the fuzzy score scaled by the similarity
    config.matching.fuzzy_score = 0.4;
    reconfigure();
    BOOST_REQUIRE(match("exit~", "exot").has_value());
    BOOST_CHECK_CLOSE(m->score(), 0.4, 1e-9);
    auto res = match("exit", "exot");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::suggested_literal);
    BOOST_CHECK_CLOSE(res.error().score, 0.4 * 5.2 / 6, 1e-6);
}
BOOST_ANON_TEST_CASE() {
    BOOST_CHECK(match("show^ alarm", "SHOW alarm").has_value());
    auto res = match("show alarm", "SHOW alarm");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::mismatched_literal);
    config.matching.case_sensitive = false;
    reconfigure();
    BOOST_CHECK(match("show alarm", "SHOW ALARM").has_value());
}
BOOST_ANON_TEST_CASE() {
    config.case_sensitive = false;
    BOOST_CHECK(match("show alarm", "Show Alarm").has_value());
}
BOOST_ANON_TEST_CASE() {
    auto res = match("exit", "");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::missing_literal);
    BOOST_CHECK(!res.error().actual.has_value());
    BOOST_CHECK_EQUAL(res.error().what, "Expected literal 'exit'");
}
BOOST_ANON_TEST_CASE() {
    auto res = match("exit", "exit now");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::too_many_arguments);
    BOOST_REQUIRE(res.error().actual.has_value());
    BOOST_CHECK_EQUAL(res.error().actual->value, "now");
    BOOST_CHECK_CLOSE(res.error().score, 1.0, 1e-9);
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_parameter_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("<f: float> <b: bool> <s: str>", "2.5 yes word").has_value());
    BOOST_CHECK_CLOSE(m->get<double>("f"), 2.5, 1e-9);
    BOOST_CHECK(m->get<bool>("b"));
    BOOST_CHECK_EQUAL(m->get<std::string>("s"), "word");
    BOOST_CHECK_EQUAL(m->params().size(), 3);
    BOOST_CHECK_EQUAL(tree->grammar(), "<f: float> <b: bool> <s: str>");
    BOOST_CHECK(std::holds_alternative<bool>((*m)["b"]));
    BOOST_CHECK_THROW((void)(*m)["missing"], std::out_of_range);
    BOOST_CHECK_THROW((void)m->get<long long>("s"), std::bad_variant_access);
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("<b: bool>", "0").has_value());
    BOOST_CHECK(!m->get<bool>("b"));
    auto res = match("<b: bool>", "nope");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::mismatched_parameter_type);
    BOOST_CHECK(res.error().what.find("cannot be read as a boolean") != std::string::npos);
}
BOOST_ANON_TEST_CASE() {
    auto res = match("<n: int>", "seven");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::mismatched_parameter_type);
    BOOST_CHECK_EQUAL(res.error().what,
        "Argument does not match type of parameter <n: int>, got 'seven': 'seven' is not a number");
    res = match("<n: int>", "");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::missing_parameter);
}
BOOST_ANON_TEST_CASE() {
    ctx.register_type("even", [](std::string_view str) -> std::expected<cligram::value, std::string> {
        auto n = cligram::parse_number<long long>(str);
        if (!n) return std::unexpected(std::move(n.error()));
        if (*n % 2) return std::unexpected("odd");
        return *n;
    });
    BOOST_REQUIRE(match("<n: even>", "4").has_value());
    BOOST_CHECK_EQUAL(m->get<long long>("n"), 4);
    auto res = match("<n: even>", "3");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().what.ends_with(": odd"));
}
BOOST_ANON_TEST_CASE() {
    BOOST_CHECK_EQUAL(*cligram::parse_number<long long>(" +42 "), 42);
    BOOST_CHECK_EQUAL(*cligram::parse_number<long long>("-7"), -7);
    BOOST_CHECK_EQUAL(cligram::parse_number<long long>("12abc").error(), "'12abc' is not a number");
    BOOST_CHECK_EQUAL(cligram::parse_number<long long>("").error(), "'' is not a number");
    BOOST_CHECK_EQUAL(cligram::parse_number<long long>("99999999999999999999").error(),
        "'99999999999999999999' is out of range");
}
BOOST_ANON_TEST_CASE() {
    BOOST_CHECK(*cligram::loose_bool("Sure"));
    BOOST_CHECK(*cligram::loose_bool("2"));
    BOOST_CHECK(!*cligram::loose_bool("dont"));
    BOOST_CHECK(!*cligram::loose_bool("0.0"));
    BOOST_CHECK(!*cligram::loose_bool(" F "));
    BOOST_CHECK(!cligram::loose_bool("maybe").has_value());
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_tail_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    auto res = match("say <what...>", "say");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::missing_tail);
}
BOOST_ANON_TEST_CASE() {
    // nothing can match once a tail consumed the call
    auto res = match("[<rest...>] end", "x y end");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::terminated);
    BOOST_CHECK(!res.error().actual.has_value());
    BOOST_CHECK_CLOSE(res.error().score, 0.5, 1e-9);
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_unordered_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    // a greedy first round forecloses the only complete assignment
    auto res = match("{(a <x>) a}", "a a z");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::unmatched_unordered_group);
    BOOST_CHECK_EQUAL(res.error().expected, "'a'");
}
BOOST_ANON_TEST_CASE() {
    config.matching.unordered = cligram::unordered_strategy::permutation;
    reconfigure();
    BOOST_REQUIRE(match("{(a <x>) a}", "a a z").has_value());
    BOOST_CHECK_EQUAL(m->get<std::string>("x"), "z");
    BOOST_CHECK_CLOSE(m->score(), 2.5, 1e-9);
}
BOOST_ANON_TEST_CASE() {
    auto res = match("go {a b}", "go");
    BOOST_REQUIRE(!res.has_value());
    BOOST_CHECK(res.error().type == cligram::match_error_type::missing_unordered_group);
    BOOST_CHECK_EQUAL(res.error().expected, "'a' or 'b'");
}
BOOST_ANON_TEST_CASE() {
    BOOST_REQUIRE(match("{<n: int> [loud]} beep", "loud 3 beep").has_value());
    BOOST_CHECK_EQUAL(m->get<long long>("n"), 3);
    BOOST_CHECK(m->optional(0));
}
BOOST_ANON_TEST_CASE() {
    // an identified unordered group records the order its children matched in
    BOOST_REQUIRE(match("{tell time}:order", "time tell").has_value());
    BOOST_CHECK(m->unordered("order") == (std::vector<std::size_t>{1, 0}));
    BOOST_REQUIRE(match("{tell time}:order", "tell time").has_value());
    BOOST_CHECK(m->unordered("order") == (std::vector<std::size_t>{0, 1}));
    BOOST_CHECK_THROW((void)m->unordered("other"), std::out_of_range);
}
BOOST_ANON_TEST_CASE() {
    config.matching.unordered = cligram::unordered_strategy::permutation;
    reconfigure();
    BOOST_REQUIRE(match("{tell time}:order", "time tell").has_value());
    BOOST_CHECK(m->unordered("order") == (std::vector<std::size_t>{1, 0}));
    BOOST_REQUIRE(match("{(a <x>) a}:order", "a a z").has_value());
    BOOST_CHECK(m->unordered("order") == (std::vector<std::size_t>{1, 0}));
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(match_flatten_tests, match_fixture)
BOOST_ANON_TEST_CASE() {
    // flattening does not change what a tree matches
    const std::pair<std::string_view, std::string_view> cases[] = {
        {"set ((loud)) alarm [at <t: int>]", "set loud alarm at 3"},
        {"(a|(b|(c d)))", "c d"},
        {"{x (y)} [[z]]", "y x z"},
        {"(a|(b|c))", "d"}
    };
    for (const auto& [grammar, call_str] : cases) {
        config.simplify = cligram::simplify_mode::no;
        auto raw = match(grammar, call_str);
        const double raw_score = raw ? m->score() : raw.error().score;
        config.simplify = cligram::simplify_mode::silently;
        auto flat = match(grammar, call_str);
        const double flat_score = flat ? m->score() : flat.error().score;
        BOOST_CHECK_MESSAGE(raw.has_value() == flat.has_value(), grammar);
        BOOST_CHECK_CLOSE(raw_score, flat_score, 1e-9);
    }
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(similarity_tests)
BOOST_ANON_TEST_CASE() {
    BOOST_CHECK_CLOSE(cligram::similarity("exit", "exit"), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(cligram::similarity("", ""), 1.0, 1e-9);
    BOOST_CHECK_EQUAL(cligram::similarity("abc", ""), 0);
    BOOST_CHECK_EQUAL(cligram::similarity("quit", "ex"), 0);
    BOOST_CHECK_CLOSE(cligram::similarity("ex", "exit"), 5.2 / 6, 1e-6);
    BOOST_CHECK_CLOSE(cligram::similarity("exit", "exot"), 5.2 / 6, 1e-6);
    BOOST_CHECK_CLOSE(cligram::similarity("pm", "am"), 2.0 / 3, 1e-6);
}
BOOST_ANON_TEST_CASE() {
    cligram::matcher ctx;
    BOOST_CHECK(ctx.equals("Exit", "Exit", true));
    BOOST_CHECK(!ctx.equals("Exit", "exit", true));
    BOOST_CHECK(ctx.equals("Exit", "eXIT", false));
    BOOST_CHECK_CLOSE(ctx.similarity("EXIT", "exot", false), 5.2 / 6, 1e-6);
}
BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(call_match_tests)
BOOST_ANON_TEST_CASE() {
    const std::string str = "a b c";
    const auto toks = cligram::call_lexer{}.tokenize(str);
    cligram::call_match cm{str, toks};
    cligram::call_match forked = cm.fork();
    forked.consume();
    forked.bind("x", std::string{"a"});
    forked.add_score(1);
    forked.record_optional(std::nullopt, true);
    forked.record_variant("v", 2);
    BOOST_CHECK_EQUAL(cm.tokens().size(), 3);
    BOOST_CHECK(!cm.contains("x"));
    cm.join(std::move(forked));
    BOOST_CHECK_EQUAL(cm.tokens().size(), 2);
    BOOST_CHECK_EQUAL(cm.front().value, "b");
    BOOST_CHECK_CLOSE(cm.score(), 1.0, 1e-9);
    BOOST_CHECK_EQUAL(cm.get<std::string>("x"), "a");
    BOOST_CHECK(cm.optional(0));
    BOOST_CHECK_EQUAL(cm.variant("v"), 2);
    BOOST_CHECK_THROW((void)cm.optional(1), std::out_of_range);
}
BOOST_ANON_TEST_CASE() {
    const std::string str = "a b";
    const auto toks = cligram::call_lexer{}.tokenize(str);
    cligram::call_match cm{str, toks};
    cm.bind("x", 1LL);
    cligram::call_match forked = cm.fork();
    BOOST_CHECK(!forked.contains("x"));
    forked.bind("x", 2LL);
    forked.terminate();
    cm.join(std::move(forked));
    BOOST_CHECK_EQUAL(cm.get<long long>("x"), 2);
    BOOST_CHECK(cm.terminated());
    BOOST_CHECK(cm.empty());
}
BOOST_AUTO_TEST_SUITE_END()
