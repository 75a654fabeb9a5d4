#include "schemer/parser/grammar.hpp"

#include "schemer/parser/parse_context.hpp"
#include "schemer/parser/statement_reducers.hpp"
#include "schemer/parser/tokenizer.hpp"

#include <type_traits>
#include <utility>

namespace schemer::parser {

namespace {

std::vector<std::string> remediation_hints_for(std::error_code code)
{
    switch (static_cast<ParseErrc>(code.value())) {
    case ParseErrc::UnknownStatement:
        return {"Only CREATE TABLE, ALTER TABLE, CREATE INDEX and CREATE SEQUENCE statements are parsed."};
    case ParseErrc::MissingColumnList:
        return {"Add a parenthesized column list or a LIKE <table> clause."};
    case ParseErrc::UnexpectedEnd:
        return {"Complete the statement or check for a missing closing parenthesis."};
    case ParseErrc::InvalidNumber:
        return {"Use an integer literal that fits in 64 bits."};
    default:
        return {"Review the SQL syntax near the reported token."};
    }
}

std::vector<std::span<const Token>> split_statements(std::span<const Token> tokens)
{
    std::vector<std::span<const Token>> statements{};
    int depth = 0;
    std::size_t start = 0U;
    for (std::size_t index = 0U; index < tokens.size(); ++index) {
        const auto& token = tokens[index];
        if (token.is_punctuation('(')) {
            ++depth;
        } else if (token.is_punctuation(')')) {
            depth = depth > 0 ? depth - 1 : 0;
        } else if (depth == 0 && token.is_punctuation(';')) {
            if (index > start) {
                statements.push_back(tokens.subspan(start, index - start));
            }
            start = index + 1U;
        }
    }
    if (start < tokens.size()) {
        statements.push_back(tokens.subspan(start));
    }
    return statements;
}

StatementType classify_statement(std::span<const Token> tokens)
{
    TokenCursor cursor{tokens};
    if (cursor.accept_keywords({"ALTER", "TABLE"})) {
        return StatementType::AlterTable;
    }
    if (!cursor.accept_keyword("CREATE")) {
        return StatementType::Unknown;
    }

    cursor.accept_keywords({"OR", "REPLACE"});
    while (cursor.accept_keyword("GLOBAL") || cursor.accept_keyword("LOCAL") || cursor.accept_keyword("TEMPORARY")
           || cursor.accept_keyword("TEMP") || cursor.accept_keyword("EXTERNAL") || cursor.accept_keyword("UNIQUE")
           || cursor.accept_keyword("CLUSTERED") || cursor.accept_keyword("NONCLUSTERED")) {
    }

    if (cursor.peek_keyword("TABLE")) {
        return StatementType::CreateTable;
    }
    if (cursor.peek_keyword("INDEX")) {
        return StatementType::CreateIndex;
    }
    if (cursor.peek_keyword("SEQUENCE")) {
        return StatementType::CreateSequence;
    }
    return StatementType::Unknown;
}

ParserDiagnostic make_statement_error(const StatementError& error, const ParseContext& context)
{
    return context.make_diagnostic(ParserSeverity::Error,
                                   static_cast<ParseErrc>(error.code().value()),
                                   error.what(),
                                   error.offset(),
                                   remediation_hints_for(error.code()));
}

template <typename Reducer>
auto run_reducer(std::span<const Token> tokens, ParseContext& context, Reducer reducer)
    -> ParseResult<std::decay_t<decltype(reducer(std::declval<TokenCursor&>(), context))>>
{
    using Ast = std::decay_t<decltype(reducer(std::declval<TokenCursor&>(), context))>;
    ParseResult<Ast> result{};
    TokenCursor cursor{tokens};
    try {
        result.ast = reducer(cursor, context);
        result.diagnostics = context.take_diagnostics();
    } catch (const StatementError& error) {
        result.diagnostics = context.take_diagnostics();
        result.diagnostics.push_back(make_statement_error(error, context));
    }
    return result;
}

void annotate(std::vector<ParserDiagnostic>& diagnostics, std::size_t index, const std::string& text)
{
    for (auto& diagnostic : diagnostics) {
        diagnostic.statement_index = index;
        diagnostic.statement = text;
    }
}

ScriptStatement parse_script_statement(std::string_view input, std::span<const Token> tokens, std::size_t index)
{
    ScriptStatement statement{};
    statement.index = index;
    statement.offset = tokens.front().offset;
    statement.text = std::string{input.substr(statement.offset, tokens.back().end_offset - statement.offset)};
    statement.type = classify_statement(tokens);

    ParseContext context{input};
    auto propagate = [&statement](auto&& parse_result) {
        statement.diagnostics = std::move(parse_result.diagnostics);
        if (parse_result.ast) {
            statement.success = true;
            using AstType = std::decay_t<decltype(*parse_result.ast)>;
            statement.ast.emplace<AstType>(std::move(*parse_result.ast));
        }
    };

    switch (statement.type) {
    case StatementType::CreateTable:
        propagate(run_reducer(tokens, context, reduce_create_table));
        break;
    case StatementType::AlterTable:
        propagate(run_reducer(tokens, context, reduce_alter_table));
        break;
    case StatementType::CreateIndex:
        propagate(run_reducer(tokens, context, reduce_create_index));
        break;
    case StatementType::CreateSequence:
        propagate(run_reducer(tokens, context, reduce_create_sequence));
        break;
    case StatementType::Unknown:
    default: {
        auto diagnostic = context.make_diagnostic(ParserSeverity::Error,
                                                  ParseErrc::UnknownStatement,
                                                  "Unsupported statement starting with '" + tokens.front().raw_text + "'",
                                                  statement.offset,
                                                  remediation_hints_for(make_error_code(ParseErrc::UnknownStatement)));
        statement.diagnostics.push_back(std::move(diagnostic));
        break;
    }
    }

    annotate(statement.diagnostics, statement.index, statement.text);
    return statement;
}

template <typename Reducer>
auto parse_single(std::string_view input, Reducer reducer)
    -> ParseResult<std::decay_t<decltype(reducer(std::declval<TokenCursor&>(), std::declval<ParseContext&>()))>>
{
    using Ast = std::decay_t<decltype(reducer(std::declval<TokenCursor&>(), std::declval<ParseContext&>()))>;
    auto lexed = tokenize(input);
    if (!lexed.success()) {
        ParseResult<Ast> failed{};
        failed.diagnostics = std::move(lexed.diagnostics);
        return failed;
    }

    auto tokens = lexed.tokens->tokens();
    while (!tokens.empty() && tokens.back().is_punctuation(';')) {
        tokens = tokens.first(tokens.size() - 1U);
    }

    ParseContext context{input};
    if (tokens.empty()) {
        ParseResult<Ast> empty{};
        empty.diagnostics.push_back(context.make_diagnostic(ParserSeverity::Error,
                                                            ParseErrc::UnexpectedEnd,
                                                            "Statement is empty",
                                                            0U,
                                                            remediation_hints_for(make_error_code(ParseErrc::UnexpectedEnd))));
        return empty;
    }
    return run_reducer(tokens, context, reducer);
}

}  // namespace

std::string_view statement_type_name(StatementType type) noexcept
{
    switch (type) {
    case StatementType::CreateTable:
        return "create_table";
    case StatementType::AlterTable:
        return "alter_table";
    case StatementType::CreateIndex:
        return "create_index";
    case StatementType::CreateSequence:
        return "create_sequence";
    case StatementType::Unknown:
    default:
        return "unknown";
    }
}

ParseResult<CreateTableStatement> parse_create_table(std::string_view input)
{
    return parse_single(input, reduce_create_table);
}

ParseResult<AlterTableStatement> parse_alter_table(std::string_view input)
{
    return parse_single(input, reduce_alter_table);
}

ParseResult<CreateIndexStatement> parse_create_index(std::string_view input)
{
    return parse_single(input, reduce_create_index);
}

ParseResult<CreateSequenceStatement> parse_create_sequence(std::string_view input)
{
    return parse_single(input, reduce_create_sequence);
}

ScriptParseResult parse_ddl_script(std::string_view input)
{
    ScriptParseResult result{};
    auto lexed = tokenize(input);
    if (!lexed.success()) {
        result.lex_failed = true;
        result.diagnostics = std::move(lexed.diagnostics);
        return result;
    }

    std::size_t index = 0U;
    for (const auto statement_tokens : split_statements(lexed.tokens->tokens())) {
        result.statements.push_back(parse_script_statement(input, statement_tokens, index++));
    }
    return result;
}

}  // namespace schemer::parser
