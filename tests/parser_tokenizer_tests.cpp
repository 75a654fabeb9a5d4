#include "schemer/parser/tokenizer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace schemer::parser;

namespace {

std::vector<Token> lex(std::string_view input)
{
    auto result = tokenize(input);
    REQUIRE(result.success());
    const auto tokens = result.tokens->tokens();
    return {tokens.begin(), tokens.end()};
}

std::vector<std::string> raw_texts(const std::vector<Token>& tokens)
{
    std::vector<std::string> texts;
    for (const auto& token : tokens) {
        texts.push_back(token.raw_text);
    }
    return texts;
}

}  // namespace

TEST_CASE("tokenize classifies keywords identifiers and punctuation")
{
    const auto tokens = lex("CREATE TABLE customer (id int);");
    REQUIRE(tokens.size() == 8U);

    CHECK(tokens[0].kind == TokenKind::Keyword);
    CHECK(tokens[0].normalized_text == "CREATE");
    CHECK(tokens[1].offset == 7U);
    CHECK(tokens[1].end_offset == 12U);
    CHECK(tokens[2].kind == TokenKind::Identifier);
    CHECK(tokens[2].raw_text == "customer");
    CHECK(tokens[2].normalized_text == "CUSTOMER");
    CHECK(tokens[3].is_punctuation('('));
    CHECK(tokens[5].kind == TokenKind::Keyword);
    CHECK(tokens[5].raw_text == "int");
    CHECK(tokens[5].normalized_text == "INT");
    CHECK(tokens[7].is_punctuation(';'));
}

TEST_CASE("tokenize drops all three comment styles")
{
    const auto tokens = lex("-- leading\nCREATE /* inline */ TABLE t # hash\n(a INT) -- trailing");
    CHECK(raw_texts(tokens) == std::vector<std::string>{"CREATE", "TABLE", "t", "(", "a", "INT", ")"});
}

TEST_CASE("tokenize keeps comment markers inside quotes")
{
    const auto tokens = lex(R"(CREATE TABLE "table--name" (note TEXT DEFAULT 'a -- b /* c */'))");
    REQUIRE(tokens.size() == 9U);
    CHECK(tokens[2].kind == TokenKind::QuotedIdentifier);
    CHECK(tokens[2].raw_text == "table--name");
    CHECK(tokens[7].kind == TokenKind::StringLiteral);
    CHECK(tokens[7].raw_text == "a -- b /* c */");
}

TEST_CASE("tokenize keeps comment markers glued inside words")
{
    const auto tokens = lex("CREATE TABLE table--name (a INT)");
    CHECK(tokens[2].raw_text == "table--name");
}

TEST_CASE("tokenize understands every quoting style")
{
    const auto tokens = lex("`ticks` [brackets] \"doubled\"\"quote\" 'it''s'");
    REQUIRE(tokens.size() == 4U);
    CHECK(tokens[0].kind == TokenKind::QuotedIdentifier);
    CHECK(tokens[0].raw_text == "ticks");
    CHECK(tokens[1].kind == TokenKind::QuotedIdentifier);
    CHECK(tokens[1].raw_text == "brackets");
    CHECK(tokens[2].raw_text == "doubled\"quote");
    CHECK(tokens[3].kind == TokenKind::StringLiteral);
    CHECK(tokens[3].raw_text == "it's");
}

TEST_CASE("tokenize splits array dimensions from bracketed names")
{
    const auto tokens = lex("TEXT[] INT[3]");
    CHECK(raw_texts(tokens) == std::vector<std::string>{"TEXT", "[", "]", "INT", "[", "3", "]"});
    CHECK(tokens[5].kind == TokenKind::NumberLiteral);
}

TEST_CASE("tokenize reads signed numbers and operators")
{
    const auto tokens = lex("DEFAULT -1 CHECK (a >= 2.5)");
    REQUIRE(tokens.size() == 8U);
    CHECK(tokens[1].kind == TokenKind::NumberLiteral);
    CHECK(tokens[1].raw_text == "-1");
    CHECK(tokens[5].kind == TokenKind::Operator);
    CHECK(tokens[5].raw_text == ">=");
    CHECK(tokens[6].raw_text == "2.5");
}

TEST_CASE("tokenize treats a sign after an operand as an operator")
{
    const auto tokens = lex("(a-1 > 0) AND (b) +2 AND x * -3");
    CHECK(raw_texts(tokens)
          == std::vector<std::string>{"(", "a", "-", "1", ">", "0", ")", "AND", "(", "b", ")", "+", "2", "AND", "x",
                                      "*", "-3"});
    CHECK(tokens[2].kind == TokenKind::Operator);
    CHECK(tokens[2].offset == 2U);
    CHECK(tokens[3].kind == TokenKind::NumberLiteral);
    CHECK(tokens[3].offset == 3U);
    CHECK(tokens[3].end_offset == 4U);
    CHECK(tokens[11].kind == TokenKind::Operator);
    CHECK(tokens[16].kind == TokenKind::NumberLiteral);
}

TEST_CASE("tokenize reports an unterminated string at its opening quote")
{
    const auto result = tokenize("CREATE TABLE t (a TEXT DEFAULT 'abc");
    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    const auto& diagnostic = result.diagnostics.front();
    CHECK(diagnostic.severity == ParserSeverity::Error);
    CHECK(diagnostic.code == ParseErrc::UnterminatedString);
    CHECK(diagnostic.offset == 31U);
    CHECK(diagnostic.line == 1U);
    CHECK(diagnostic.column == 32U);
    CHECK_FALSE(diagnostic.remediation_hints.empty());
}

TEST_CASE("tokenize reports unterminated comments and identifiers")
{
    const auto comment = tokenize("CREATE TABLE t (a INT); /* open");
    REQUIRE_FALSE(comment.success());
    CHECK(comment.diagnostics.front().code == ParseErrc::UnterminatedComment);
    CHECK(comment.diagnostics.front().offset == 24U);

    const auto identifier = tokenize("CREATE TABLE \"abc (a INT)");
    REQUIRE_FALSE(identifier.success());
    CHECK(identifier.diagnostics.front().code == ParseErrc::UnterminatedIdentifier);
    CHECK(identifier.diagnostics.front().offset == 13U);
}

TEST_CASE("tokenize rejects characters outside the lexical grammar")
{
    const auto result = tokenize("CREATE TABLE t (a INT) \\");
    REQUIRE_FALSE(result.success());
    CHECK(result.diagnostics.front().code == ParseErrc::UnexpectedCharacter);
    CHECK(result.diagnostics.front().offset == 23U);
}

TEST_CASE("TokenStream walks tokens in order")
{
    auto result = tokenize("a b");
    REQUIRE(result.success());
    auto& stream = *result.tokens;
    CHECK(stream.size() == 2U);
    REQUIRE(stream.peek() != nullptr);
    CHECK(stream.next()->raw_text == "a");
    CHECK(stream.next()->raw_text == "b");
    CHECK(stream.at_end());
    CHECK(stream.next() == nullptr);
    stream.reset();
    CHECK(stream.position() == 0U);
}
