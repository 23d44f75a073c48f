#include <catch2/catch_all.hpp>

#include "stanza/reader.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace Catch;

namespace {

    std::string data_path(std::string_view name) {
        return std::string{ STANZA_TEST_DATA_DIR } + "/" + std::string{ name };
    }

    Stanza::ParseOptions multiline_options() {
        Stanza::ParseOptions opts;
        opts.allow_multiline = true;
        return opts;
    }

    constexpr std::string_view types_ini =
        "[types]\n"
        "int = 42\n"
        "negative = -17\n"
        "plus = +5\n"
        "hex = 0x1A\n"
        "upper_hex = 0XFF\n"
        "big = 1000000000000\n"
        "real = 3.14159\n"
        "sci = 1e3\n"
        "bad = 12abc\n"
        "empty =\n";
}


TEST_CASE("Reader Basic Parsing") {
    Stanza::Reader r{ "[section1]\nkey1=value1\nkey2 = value2\n\n[section2]\nkey3=value3\n" };

    REQUIRE_FALSE(r.parse_error());
    REQUIRE(r.get("section1", "key1", "") == "value1");
    REQUIRE(r.get("section1", "key2", "") == "value2");
    REQUIRE(r.get("section2", "key3", "") == "value3");
    REQUIRE(r.get("section2", "key1", "fallback") == "fallback");
}

TEST_CASE("Reader Ignores Comments") {
    Stanza::Reader r{ "; top comment\n[s]\n# hash comment\nkey = value ; trailing\n" };

    REQUIRE(r.get("s", "key", "") == "value");
    REQUIRE(r.keys("s") == std::vector<std::string>{ "key" });
}

TEST_CASE("Reader Lookup Is Case-Insensitive") {
    Stanza::Reader r{ "[Section]\nKey=Value\n" };

    REQUIRE(r.get("SECTION", "KEY", "") == "Value");
    REQUIRE(r.get("section", "key", "") == "Value");
    REQUIRE(r.has_section("sEcTiOn"));
    REQUIRE(r.has_value("SeCtIoN", "kEy"));
    REQUIRE(r.sections() == std::vector<std::string>{ "section" });
    REQUIRE(r.keys("SECTION") == std::vector<std::string>{ "key" });
}

TEST_CASE("Reader Keys Outside Any Section") {
    Stanza::Reader r{ "global = yes\n[s]\nlocal = no\n" };

    REQUIRE(r.get("", "global", "") == "yes");
    REQUIRE(r.get_boolean("", "global", false));
    REQUIRE(r.sections() == std::vector<std::string>{ "s" });
    REQUIRE_FALSE(r.has_section(""));
    REQUIRE(r.keys("") == std::vector<std::string>{ "global" });
}

TEST_CASE("Reader Lists Empty Sections") {
    Stanza::Reader r{ "[empty]\n[full]\nk = v\n" };

    REQUIRE(r.has_section("empty"));
    REQUIRE(r.keys("empty").empty());
    REQUIRE(r.sections() == std::vector<std::string>{ "empty", "full" });
    REQUIRE(r.keys("missing").empty());
}

TEST_CASE("Reader Repeated Keys Concatenate") {
    Stanza::Reader r{ "[s]\na=1\na=2\n[S]\nA=3\n" };

    REQUIRE(r.get("s", "a", "") == "1\n2\n3");
    REQUIRE(r.sections() == std::vector<std::string>{ "s" });
}

TEST_CASE("Reader Duplicate Sections Merge") {
    Stanza::Reader r{ "[a]\nx=1\n[b]\ny=2\n[a]\nz=3\n" };

    REQUIRE(r.keys("a") == std::vector<std::string>{ "x", "z" });
    REQUIRE(r.get("b", "y", "") == "2");
}

TEST_CASE("Reader Multi-line Values") {
    Stanza::Reader r{ "[s]\nkey = first\n  second\n  third\n", multiline_options() };

    REQUIRE_FALSE(r.parse_error());
    REQUIRE(r.get("s", "key", "") == "first\n  second\n  third");
}

TEST_CASE("Reader get And get_string Treat Empty Values Differently") {
    Stanza::Reader r{ "[s]\nempty =\nfull = x\n" };

    REQUIRE(r.get("s", "empty", "default").empty());
    REQUIRE(r.get_string("s", "empty", "default") == "default");
    REQUIRE(r.get_string("s", "full", "default") == "x");
    REQUIRE(r.get_string("s", "missing", "default") == "default");
    REQUIRE(r.has_value("s", "empty"));
}

TEST_CASE("Reader Integer Getters") {
    Stanza::Reader r{ types_ini };

    REQUIRE(r.get_integer("types", "int", 0) == 42);
    REQUIRE(r.get_integer("types", "negative", 0) == -17);
    REQUIRE(r.get_integer("types", "plus", 0) == 5);
    REQUIRE(r.get_integer("types", "hex", 0) == 26);
    REQUIRE(r.get_integer("types", "upper_hex", 0) == 255);
    REQUIRE(r.get_integer("types", "bad", 99) == 99);
    REQUIRE(r.get_integer("types", "empty", 7) == 7);
    REQUIRE(r.get_integer("types", "missing", -1) == -1);
    REQUIRE(r.get_integer("types", "real", -1) == -1);

    REQUIRE(r.get_integer64("types", "big", 0) == INT64_C(1000000000000));
    REQUIRE(r.get_integer64("types", "hex", 0) == 26);
    REQUIRE(r.get_integer64("types", "bad", -5) == -5);
}

TEST_CASE("Reader Unsigned Getters") {
    Stanza::Reader r{ "[u]\nvalue = 123\nneg = -1\nplus = +8\nhuge = 18446744073709551615\nhex = 0x10\n" };

    REQUIRE(r.get_unsigned("u", "value", 0) == 123u);
    REQUIRE(r.get_unsigned("u", "neg", 77) == 77u);
    REQUIRE(r.get_unsigned("u", "plus", 0) == 8u);
    REQUIRE(r.get_unsigned("u", "hex", 3) == 3u);
    REQUIRE(r.get_unsigned64("u", "huge", 0) == std::numeric_limits<uint64_t>::max());
    REQUIRE(r.get_unsigned64("u", "neg", 1) == 1u);
}

TEST_CASE("Reader Overflow Yields Default") {
    Stanza::Reader r{ "[n]\ntoo_big = 99999999999999999999999\n" };

    REQUIRE(r.get_integer64("n", "too_big", 4) == 4);
    REQUIRE(r.get_unsigned64("n", "too_big", 4) == 4u);
}

TEST_CASE("Reader Real Getter") {
    Stanza::Reader r{ types_ini };

    REQUIRE(r.get_real("types", "real", 0.0) == Approx(3.14159));
    REQUIRE(r.get_real("types", "sci", 0.0) == Approx(1000.0));
    REQUIRE(r.get_real("types", "int", 0.0) == Approx(42.0));
    REQUIRE(r.get_real("types", "plus", 0.0) == Approx(5.0));
    REQUIRE(r.get_real("types", "bad", 2.5) == Approx(2.5));
    REQUIRE(r.get_real("types", "empty", -1.0) == Approx(-1.0));
}

TEST_CASE("Reader Boolean Getter") {
    Stanza::Reader r{
        "[b]\n"
        "t1 = true\nt2 = YES\nt3 = On\nt4 = 1\n"
        "f1 = FALSE\nf2 = no\nf3 = off\nf4 = 0\n"
        "other = maybe\nnum = 2\n"
    };

    for (const char* name : { "t1", "t2", "t3", "t4" })
        REQUIRE(r.get_boolean("b", name, false));
    for (const char* name : { "f1", "f2", "f3", "f4" })
        REQUIRE_FALSE(r.get_boolean("b", name, true));

    REQUIRE(r.get_boolean("b", "other", true));
    REQUIRE_FALSE(r.get_boolean("b", "other", false));
    REQUIRE(r.get_boolean("b", "num", true));
    REQUIRE(r.get_boolean("b", "missing", true));
}

TEST_CASE("Reader Keeps Values From Before A Parse Error") {
    Stanza::Reader r{ "\n[section1]\nkey1=value1\n[unclosed_section\nkey2=value2\n" };

    REQUIRE(r.parse_error());
    REQUIRE(r.parse_error()->errc == Stanza::ParseError::code::syntax_error);
    REQUIRE(r.parse_error()->line == 4);
    REQUIRE(r.get("section1", "key1", "") == "value1");
    REQUIRE(r.get("section1", "key2", "") == "value2");
}

TEST_CASE("Reader Load Reports Errors") {
    auto ok = Stanza::Reader::load("[s]\nk=v\n");
    REQUIRE(ok);
    REQUIRE(ok->get("s", "k", "") == "v");

    auto bad = Stanza::Reader::load("[s]\n[oops\n");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().line == 2);
    REQUIRE(bad.error().msg == "missing closing bracket");
}

TEST_CASE("Reader From Missing File") {
    auto r = Stanza::Reader::from_file(data_path("no_such_file.ini"));

    REQUIRE(r.parse_error());
    REQUIRE(r.parse_error()->errc == Stanza::ParseError::code::file_open);
    REQUIRE(r.sections().empty());

    auto loaded = Stanza::Reader::load_file(data_path("no_such_file.ini"));
    REQUIRE_FALSE(loaded);
    REQUIRE(loaded.error().errc == Stanza::ParseError::code::file_open);
}

TEST_CASE("Reader From Stream") {
    std::istringstream is{ "[Stream]\nName = Value\n" };
    Stanza::Reader r{ is };

    REQUIRE_FALSE(r.parse_error());
    REQUIRE(r.get("stream", "name", "") == "Value");
}

TEST_CASE("Reader Normal File") {
    auto r = Stanza::Reader::from_file(data_path("normal.ini"));
    REQUIRE_FALSE(r.parse_error());

    REQUIRE(r.sections() == std::vector<std::string>{ " section 2 ", "colon_tests", "comment_test", "empty", "section1" });

    REQUIRE(r.get("section1", "one", "") == "This is a test");
    REQUIRE(r.get_integer("section1", "two", 0) == 1234);
    REQUIRE_FALSE(r.has_value("section1", "x"));

    REQUIRE(r.get_integer(" section 2 ", "happy", 0) == 4);
    REQUIRE(r.get(" section 2 ", "sad", "default").empty());
    REQUIRE_FALSE(r.has_section("section 2"));

    REQUIRE(r.keys("empty").empty());

    REQUIRE(r.get("comment_test", "test1", "") == "1;2;3");
    REQUIRE(r.get("comment_test", "test2", "") == "2;3;4;this won't be a comment, needs whitespace before ';'");
    REQUIRE(r.get("comment_test", "test;3", "") == "345");
    REQUIRE(r.get("comment_test", "test4", "") == "4#5#6");
    REQUIRE_FALSE(r.has_value("comment_test", "test5"));
    REQUIRE_FALSE(r.has_value("comment_test", "#test5"));
    REQUIRE_FALSE(r.has_value("comment_test", "test6"));
    REQUIRE(r.get("comment_test", "test7", "default").empty());
    REQUIRE(r.get("comment_test", "test8", "") == "; not a comment, needs whitespace before ';'");

    REQUIRE(r.get("colon_tests", "content-type", "") == "text/html");
    REQUIRE(r.get("colon_tests", "foo", "") == "bar");
    REQUIRE(r.get_integer("colon_tests", "adams", 0) == 42);
    REQUIRE(r.get("colon_tests", "funny1", "") == "with = equals");
    REQUIRE(r.get("colon_tests", "funny2", "") == "with : colons");
    REQUIRE(r.get("colon_tests", "funny3", "") == "two = equals");
    REQUIRE(r.get("colon_tests", "funny4", "") == "two : colons");
}

TEST_CASE("Reader Normal File Without Inline Comments") {
    Stanza::ParseOptions opts;
    opts.allow_inline_comments = false;

    auto r = Stanza::Reader::from_file(data_path("normal.ini"), opts);
    REQUIRE_FALSE(r.parse_error());

    REQUIRE(r.has_section("section1"));
    REQUIRE(r.get("section1", "one", "") == "This is a test  ; name=value comment");
    REQUIRE(r.get("comment_test", "test7", "") == "; blank value, except if inline comments disabled");
}

TEST_CASE("Reader Multi-line File") {
    auto r = Stanza::Reader::from_file(data_path("multi_line.ini"), multiline_options());
    REQUIRE_FALSE(r.parse_error());

    REQUIRE(r.get("section1", "single1", "") == "abc");
    REQUIRE(r.get("section1", "multi", "") == "this is a\n        multi-line value");
    REQUIRE(r.get("section1", "single2", "") == "xyz");
    REQUIRE(r.get("section2", "multi", "") == "a\n        b\n        c");
    REQUIRE(r.get("section3", "single", "") == "ghi");
    REQUIRE(r.get("section3", "multi", "") == "the quick\n       brown fox");
    REQUIRE(r.get("section3", "name", "") == "bob smith");
}

TEST_CASE("Reader Bad Section File") {
    auto lenient = Stanza::Reader::from_file(data_path("bad_section.ini"));
    REQUIRE(lenient.parse_error());
    REQUIRE(lenient.parse_error()->line == 3);
    REQUIRE(lenient.sections() == std::vector<std::string>{ "section1" });
    REQUIRE(lenient.get("section1", "name2", "") == "value2");

    Stanza::ParseOptions strict;
    strict.stop_on_first_error = true;

    auto stopped = Stanza::Reader::from_file(data_path("bad_section.ini"), strict);
    REQUIRE(stopped.parse_error());
    REQUIRE(stopped.parse_error()->line == 3);
    REQUIRE(stopped.get("section1", "name1", "") == "value1");
    REQUIRE_FALSE(stopped.has_value("section1", "name2"));
}

TEST_CASE("Reader CRLF File") {
    auto r = Stanza::Reader::from_file(data_path("crlf.ini"));
    REQUIRE_FALSE(r.parse_error());
    REQUIRE(r.get("section1", "name1", "") == "value1");
    REQUIRE(r.get("section1", "name2", "") == "value2");
}

TEST_CASE("Reader BOM File") {
    auto r = Stanza::Reader::from_file(data_path("bom.ini"));
    REQUIRE_FALSE(r.parse_error());
    REQUIRE(r.sections() == std::vector<std::string>{ "section\xC2\xA3" });
    REQUIRE(r.get("section\xC2\xA3", "key\xC2\xA3", "") == "value\xC2\xA3");

    Stanza::ParseOptions opts;
    opts.allow_bom = false;

    auto kept = Stanza::Reader::from_file(data_path("bom.ini"), opts);
    REQUIRE_FALSE(kept.parse_error());
    REQUIRE(kept.sections().empty());
    REQUIRE(kept.get("", "key\xC2\xA3", "") == "value\xC2\xA3");
}

TEST_CASE("Reader Is Deterministic") {
    std::string_view text = "[B]\nz = 1\n[a]\ny = 2\nY = 3\n";
    Stanza::Reader first{ text };
    Stanza::Reader second{ text };

    REQUIRE(first.sections() == second.sections());
    REQUIRE(first.keys("a") == second.keys("a"));
    REQUIRE(first.get("a", "y", "") == second.get("a", "y", ""));
    REQUIRE(first.get("a", "y", "") == "2\n3");
}
