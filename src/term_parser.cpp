
#include <cctype>
#include <stdexcept>
#include <vector>
#include "term.h"

namespace semchart {

namespace {

enum TokenType { IDENT, META_ORDINARY, META_PLACEHOLDER, SYMBOL, END };

struct Token
{
    Token(TokenType type, const std::string& value, unsigned position)
        : type(type), value(value), position(position) {}

    TokenType type;
    std::string value;
    unsigned position;
};

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\'';
}

std::vector<Token> Lex(const std::string& in) {
    // longest symbols first
    static const char* symbols[] = {
        "<->", "->", "!=", "\\", ".", "(", ")", ",", "-", "&", "|", "="
    };
    std::vector<Token> res;
    unsigned i = 0;
    while (i < in.size()) {
        if (std::isspace(static_cast<unsigned char>(in[i]))) {
            i++;
            continue;
        }
        if (in[i] == '?' || in[i] == '@') {
            unsigned j = i + 1;
            while (j < in.size() && IsNameChar(in[j])) j++;
            if (j == i + 1)
                throw std::runtime_error(
                        "variable name expected at column " + std::to_string(i) + ": " + in);
            res.emplace_back(in[i] == '?' ? META_ORDINARY : META_PLACEHOLDER,
                             in.substr(i + 1, j - i - 1), i);
            i = j;
            continue;
        }
        if (IsNameChar(in[i])) {
            unsigned j = i;
            while (j < in.size() && IsNameChar(in[j])) j++;
            res.emplace_back(IDENT, in.substr(i, j - i), i);
            i = j;
            continue;
        }
        bool found = false;
        for (const char* symbol: symbols) {
            std::string s(symbol);
            if (in.compare(i, s.size(), s) == 0) {
                res.emplace_back(SYMBOL, s, i);
                i += s.size();
                found = true;
                break;
            }
        }
        if (! found)
            throw std::runtime_error(
                    "unexpected character '" + std::string(1, in[i]) +
                    "' at column " + std::to_string(i) + ": " + in);
    }
    res.emplace_back(END, "", in.size());
    return res;
}

// a single letter followed by digits names a variable even when unbound:
// x, y1, P, Q2. anything else free is a constant.
bool LooksLikeVariable(const std::string& name) {
    if (name.empty() || ! std::isalpha(static_cast<unsigned char>(name[0])))
        return false;
    for (unsigned i = 1; i < name.size(); i++) {
        if (! std::isdigit(static_cast<unsigned char>(name[i])))
            return false;
    }
    return true;
}

class TermParser
{
public:
    TermParser(const std::string& input): input_(input), tokens_(Lex(input)), pos_(0) {}

    TermType Parse() {
        TermType res = ParseExpression();
        if (Peek().type != END)
            Fail("trailing input");
        return res;
    }

private:
    const Token& Peek() const { return tokens_[pos_]; }

    bool IsSymbol(const std::string& symbol) const {
        return Peek().type == SYMBOL && Peek().value == symbol;
    }

    bool IsKeyword() const {
        return Peek().type == IDENT &&
            (Peek().value == "exists" || Peek().value == "all");
    }

    void Expect(const std::string& symbol) {
        if (! IsSymbol(symbol))
            Fail("'" + symbol + "' expected");
        pos_++;
    }

    void Fail(const std::string& message) const {
        throw std::runtime_error("failed to parse term at column " +
                std::to_string(Peek().position) + " (" + message + "): " + input_);
    }

    bool IsBound(const std::string& name) const {
        for (auto&& bound: scope_) {
            if (bound == name) return true;
        }
        return false;
    }

    TermType ParseExpression() {
        TermType left = ParseImplication();
        while (IsSymbol("<->")) {
            pos_++;
            left = Term::Bin(IFF, left, ParseImplication());
        }
        return left;
    }

    TermType ParseImplication() {
        TermType left = ParseDisjunction();
        if (IsSymbol("->")) {
            pos_++;
            return Term::Bin(IMP, left, ParseImplication());
        }
        return left;
    }

    TermType ParseDisjunction() {
        TermType left = ParseConjunction();
        while (IsSymbol("|")) {
            pos_++;
            left = Term::Bin(OR, left, ParseConjunction());
        }
        return left;
    }

    TermType ParseConjunction() {
        TermType left = ParseEquality();
        while (IsSymbol("&")) {
            pos_++;
            left = Term::Bin(AND, left, ParseEquality());
        }
        return left;
    }

    TermType ParseEquality() {
        TermType left = ParseUnary();
        if (IsSymbol("=") || IsSymbol("!=")) {
            Connective op = Peek().value == "=" ? EQ : NEQ;
            pos_++;
            return Term::Bin(op, left, ParseUnary());
        }
        return left;
    }

    TermType ParseUnary() {
        if (IsSymbol("-")) {
            pos_++;
            return Term::Not(ParseUnary());
        }
        if (IsSymbol("\\") || IsKeyword())
            return ParseBinder();
        return ParseApplication();
    }

    // \x y.body, exists x.body, all x y.body
    TermType ParseBinder() {
        bool is_lambda = IsSymbol("\\");
        Quantifier quantifier = (! is_lambda && Peek().value == "all") ? ALL : EXISTS;
        pos_++;
        std::vector<std::string> variables;
        while (Peek().type == IDENT && ! IsKeyword())
            variables.push_back(tokens_[pos_++].value);
        if (variables.empty())
            Fail("bound variable expected");
        Expect(".");
        for (auto&& variable: variables)
            scope_.push_back(variable);
        TermType body = ParseExpression();
        scope_.resize(scope_.size() - variables.size());
        for (int i = variables.size() - 1; i >= 0; i--) {
            body = is_lambda ? Term::Lam(variables[i], body)
                             : Term::Quant(quantifier, variables[i], body);
        }
        return body;
    }

    TermType ParseApplication() {
        TermType res = ParsePrimary();
        while (IsSymbol("(")) {
            pos_++;
            res = Term::App(res, ParseExpression());
            while (IsSymbol(",")) {
                pos_++;
                res = Term::App(res, ParseExpression());
            }
            Expect(")");
        }
        return res;
    }

    TermType ParsePrimary() {
        const Token& token = Peek();
        switch (token.type) {
            case META_ORDINARY:
                pos_++;
                return Term::Meta(ORDINARY, token.value);
            case META_PLACEHOLDER:
                pos_++;
                return Term::Meta(PLACEHOLDER, token.value);
            case IDENT:
                pos_++;
                if (IsBound(token.value) || LooksLikeVariable(token.value))
                    return Term::Var(token.value);
                return Term::Const(token.value);
            case SYMBOL:
                if (token.value == "(") {
                    pos_++;
                    TermType res = ParseExpression();
                    Expect(")");
                    return res;
                }
                break;
            case END:
                break;
        }
        Fail("term expected");
        return nullptr;
    }

    std::string input_;
    std::vector<Token> tokens_;
    unsigned pos_;
    std::vector<std::string> scope_;
};

} // namespace

TermType Term::Parse(const std::string& string) {
    return TermParser(string).Parse();
}

} // namespace semchart
