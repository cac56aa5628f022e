//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical analysis for schema expressions.
///
/// The lexer converts expression characters into parser tokens and records the column of every
/// token so diagnostics can point inside the expression string.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Frontend/Lexer.h"

#include <cctype>
#include <utility>

namespace llvmbinfmt
{

Lexer::Lexer(std::string path, std::string text)
    : path_(std::move(path))
    , text_(std::move(text))
{
}

bool Lexer::isAtEnd() const
{
    return index_ >= text_.size();
}

char Lexer::peek(std::size_t lookahead) const
{
    const std::size_t i = index_ + lookahead;
    return i < text_.size() ? text_[i] : '\0';
}

char Lexer::advance()
{
    if (isAtEnd())
    {
        return '\0';
    }
    return text_[index_++];
}

void Lexer::emit(TokenKind kind, std::string text, std::uint32_t column)
{
    tokens_.push_back(Token{kind, std::move(text), SourceLocation{path_, column}});
}

void Lexer::lexIdentifierOrKeyword(std::uint32_t column)
{
    std::string text;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        text.push_back(advance());
    }

    if (text == "true")
    {
        emit(TokenKind::True, text, column);
        return;
    }
    if (text == "false")
    {
        emit(TokenKind::False, text, column);
        return;
    }
    emit(TokenKind::Identifier, text, column);
}

void Lexer::lexNumber(std::uint32_t column)
{
    std::string text;
    bool        hasDot = false;
    bool        hasExp = false;

    if (peek() == '0' &&
        (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'b' || peek(1) == 'B' || peek(1) == 'o' || peek(1) == 'O'))
    {
        text.push_back(advance());
        text.push_back(advance());
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            text.push_back(advance());
        }
        emit(TokenKind::Integer, text, column);
        return;
    }

    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        text.push_back(advance());
    }

    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))
    {
        hasDot = true;
        text.push_back(advance());
        while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
        {
            text.push_back(advance());
        }
    }

    if ((peek() == 'e' || peek() == 'E') &&
        (std::isdigit(static_cast<unsigned char>(peek(1))) ||
         ((peek(1) == '+' || peek(1) == '-') && std::isdigit(static_cast<unsigned char>(peek(2))))))
    {
        hasExp = true;
        text.push_back(advance());
        if (peek() == '+' || peek() == '-')
        {
            text.push_back(advance());
        }
        while (std::isdigit(static_cast<unsigned char>(peek())))
        {
            text.push_back(advance());
        }
    }

    emit((hasDot || hasExp) ? TokenKind::Real : TokenKind::Integer, text, column);
}

void Lexer::lexString(std::uint32_t column, char quote)
{
    std::string value;
    (void) advance();
    while (!isAtEnd() && peek() != quote)
    {
        char c = advance();
        if (c == '\\' && !isAtEnd())
        {
            const char esc = advance();
            switch (esc)
            {
            case 'n':
                value.push_back('\n');
                break;
            case 'r':
                value.push_back('\r');
                break;
            case 't':
                value.push_back('\t');
                break;
            case '0':
                value.push_back('\0');
                break;
            default:
                value.push_back(esc);
                break;
            }
        }
        else
        {
            value.push_back(c);
        }
    }
    if (peek() != quote)
    {
        emit(TokenKind::Invalid, "unterminated string literal", column);
        return;
    }
    (void) advance();
    emit(TokenKind::String, value, column);
}

std::vector<Token> Lexer::lex()
{
    while (!isAtEnd())
    {
        const auto tokCol = static_cast<std::uint32_t>(index_ + 1);
        const char c      = peek();

        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        {
            (void) advance();
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            lexIdentifierOrKeyword(tokCol);
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            lexNumber(tokCol);
            continue;
        }

        if (c == '\'' || c == '"')
        {
            lexString(tokCol, c);
            continue;
        }

        const char n = peek(1);
        if (c == '<' && n == '=')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::LessEqual, "<=", tokCol);
            continue;
        }
        if (c == '>' && n == '=')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::GreaterEqual, ">=", tokCol);
            continue;
        }
        if (c == '=' && n == '=')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::EqualEqual, "==", tokCol);
            continue;
        }
        if (c == '!' && n == '=')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::BangEqual, "!=", tokCol);
            continue;
        }
        if (c == '|' && n == '|')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::PipePipe, "||", tokCol);
            continue;
        }
        if (c == '&' && n == '&')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::AmpAmp, "&&", tokCol);
            continue;
        }

        const TokenKind kind = [&]() {
            switch (c)
            {
            case '(':
                return TokenKind::LParen;
            case ')':
                return TokenKind::RParen;
            case '[':
                return TokenKind::LBracket;
            case ']':
                return TokenKind::RBracket;
            case '.':
                return TokenKind::Dot;
            case '+':
                return TokenKind::Plus;
            case '-':
                return TokenKind::Minus;
            case '*':
                return TokenKind::Star;
            case '/':
                return TokenKind::Slash;
            case '%':
                return TokenKind::Percent;
            case '!':
                return TokenKind::Bang;
            case '<':
                return TokenKind::Less;
            case '>':
                return TokenKind::Greater;
            default:
                return TokenKind::Invalid;
            }
        }();

        (void) advance();
        emit(kind, std::string(1, c), tokCol);
    }

    emit(TokenKind::Eof, "", static_cast<std::uint32_t>(index_ + 1));
    return tokens_;
}

}  // namespace llvmbinfmt
