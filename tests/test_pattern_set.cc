#include "secern/match/pattern_set.h"
#include "secern/utils/error.h"
#include "secern/utils/utf8.h"
#include <cassert>
#include <iostream>

using secern::match::PatternSet;

void test_any_pattern_matches() {
    std::cout << "Testing PatternSet::matches()..." << std::endl;

    auto set = PatternSet::compile({"^[0-9]+$", "error", "\\.azurewebsites\\.net"});
    assert(set.pattern_count() == 3);

    assert(set.matches("12345"));
    assert(set.matches("an error occurred"));
    assert(set.matches("{\"value\":\"app.azurewebsites.net\"}"));
    assert(!set.matches("12a45"));
    assert(!set.matches("all good"));
    std::cout << "  ✓ Any-of matching passed" << std::endl;

    // Search semantics: unanchored patterns match anywhere in the line
    auto unanchored = PatternSet::compile({"b"});
    assert(unanchored.matches("abc"));
    std::cout << "  ✓ Unanchored search passed" << std::endl;
}

void test_empty_line() {
    std::cout << "Testing empty line handling..." << std::endl;

    auto empty_only = PatternSet::compile({"^$"});
    assert(empty_only.matches(""));
    assert(!empty_only.matches("x"));
    assert(!empty_only.matches(" "));

    // Patterns that accept the empty string match every line
    auto star = PatternSet::compile({"z*"});
    assert(star.matches(""));
    assert(star.matches("abc"));

    std::cout << "  ✓ Empty line handling passed" << std::endl;
}

void test_unicode_patterns() {
    std::cout << "Testing UTF-8 patterns..." << std::endl;

    auto emoji = PatternSet::compile({"😎+"});
    assert(emoji.matches("so cool 😎"));
    assert(!emoji.matches("so cool"));

    // No case folding beyond what the pattern asks for
    auto exact = PatternSet::compile({"Ärger"});
    assert(exact.matches("viel Ärger"));
    assert(!exact.matches("viel ärger"));
    auto folded = PatternSet::compile({"(?i)error"});
    assert(folded.matches("ERROR: disk full"));

    std::cout << "  ✓ UTF-8 patterns passed" << std::endl;
}

void test_common_constructs() {
    std::cout << "Testing common regex constructs..." << std::endl;

    auto boundary = PatternSet::compile({"\\bERROR\\b"});
    assert(boundary.matches("2026-10-19 ERROR disk full"));
    assert(boundary.matches("ERROR"));
    assert(!boundary.matches("NOERRORS here"));
    assert(!boundary.matches("error"));

    auto not_boundary = PatternSet::compile({"\\Bcat\\B"});
    assert(not_boundary.matches("concatenate"));
    assert(!not_boundary.matches("a cat here"));
    std::cout << "  ✓ Word boundaries" << std::endl;

    auto classes = PatternSet::compile({"^\\d{3}-\\d{4}$", "^\\s+\\w+:"});
    assert(classes.matches("555-0100"));
    assert(classes.matches("  key: value"));
    assert(!classes.matches("55-0100"));
    assert(!classes.matches("key: value"));
    std::cout << "  ✓ Shorthand classes" << std::endl;

    auto lazy = PatternSet::compile({"<[a-z]+?>", "^[A-Fa-f0-9]{8}(-[A-Fa-f0-9]{4}){3}-[A-Fa-f0-9]{12}$"});
    assert(lazy.matches("see <tag> here"));
    assert(lazy.matches("123e4567-e89b-12d3-a456-426614174000"));
    assert(!lazy.matches("<> empty"));
    assert(!lazy.matches("123e4567-e89b-12d3-a456"));
    std::cout << "  ✓ Character classes, lazy and counted repeats" << std::endl;

    auto alternation = PatternSet::compile({"\\b(FATAL|PANIC)\\b", "Traceback \\(most recent call last\\)"});
    assert(alternation.matches("PANIC: out of memory"));
    assert(alternation.matches("Traceback (most recent call last):"));
    assert(!alternation.matches("PANICKED"));
    std::cout << "  ✓ Alternation and escaped groups" << std::endl;
}

void test_compile_errors() {
    std::cout << "Testing pattern compile errors..." << std::endl;

    bool threw = false;
    try {
        PatternSet::compile({"ok", "(unclosed"});
    } catch (const secern::PatternError& e) {
        threw = true;
        assert(e.pattern_index() == 1);
        assert(e.pattern() == "(unclosed");
        assert(std::string(e.what()).find("pattern #2") != std::string::npos);
    }
    assert(threw);
    std::cout << "  ✓ Invalid pattern reported with its index" << std::endl;

    threw = false;
    try {
        PatternSet::compile({});
    } catch (const secern::PatternError& e) {
        threw = true;
        assert(e.pattern_index() == -1);
    }
    assert(threw);
    std::cout << "  ✓ Empty pattern list rejected" << std::endl;
}

void test_move() {
    std::cout << "Testing PatternSet move..." << std::endl;

    auto first = PatternSet::compile({"abc"});
    PatternSet second = std::move(first);
    assert(second.matches("xabcx"));
    assert(second.patterns().size() == 1);

    auto third = PatternSet::compile({"def"});
    third = std::move(second);
    assert(third.matches("abc"));
    assert(!third.matches("def"));

    std::cout << "  ✓ PatternSet move passed" << std::endl;
}

void test_utf8_validation() {
    std::cout << "Testing UTF-8 validation..." << std::endl;

    assert(secern::utils::is_valid_utf8(""));
    assert(secern::utils::is_valid_utf8("plain ascii"));
    assert(secern::utils::is_valid_utf8("caf\xc3\xa9 \xf0\x9f\x98\x8e"));
    assert(!secern::utils::is_valid_utf8("\xff"));
    assert(!secern::utils::is_valid_utf8("\xc3"));             // truncated
    assert(!secern::utils::is_valid_utf8("\xc0\xaf"));         // overlong
    assert(!secern::utils::is_valid_utf8("\xed\xa0\x80"));     // surrogate
    assert(!secern::utils::is_valid_utf8("\xf4\x90\x80\x80")); // > U+10FFFF

    std::cout << "  ✓ UTF-8 validation passed" << std::endl;
}

int main() {
    std::cout << "Running PatternSet tests..." << std::endl;
    test_any_pattern_matches();
    test_empty_line();
    test_unicode_patterns();
    test_common_constructs();
    test_compile_errors();
    test_move();
    test_utf8_validation();
    std::cout << "\nAll PatternSet tests passed!" << std::endl;
    return 0;
}
