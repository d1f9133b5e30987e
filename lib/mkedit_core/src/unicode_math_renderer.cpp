#include "mk/edit/unicode_math_renderer.hpp"

#include "mk/edit/markdown_syntax.hpp"

#include <cctype>

namespace mk::edit
{
namespace
{
const std::unordered_map<std::string_view, std::string_view> &commandSymbols()
{
    static const std::unordered_map<std::string_view, std::string_view> symbols = {
        {"alpha", "\xCE\xB1"},      {"beta", "\xCE\xB2"},       {"gamma", "\xCE\xB3"},
        {"delta", "\xCE\xB4"},      {"epsilon", "\xCE\xB5"},    {"varepsilon", "\xCE\xB5"},
        {"zeta", "\xCE\xB6"},       {"eta", "\xCE\xB7"},        {"theta", "\xCE\xB8"},
        {"iota", "\xCE\xB9"},       {"kappa", "\xCE\xBA"},      {"lambda", "\xCE\xBB"},
        {"mu", "\xCE\xBC"},         {"nu", "\xCE\xBD"},         {"xi", "\xCE\xBE"},
        {"pi", "\xCF\x80"},         {"rho", "\xCF\x81"},        {"sigma", "\xCF\x83"},
        {"tau", "\xCF\x84"},        {"upsilon", "\xCF\x85"},    {"phi", "\xCF\x86"},
        {"varphi", "\xCF\x95"},     {"chi", "\xCF\x87"},        {"psi", "\xCF\x88"},
        {"omega", "\xCF\x89"},      {"Gamma", "\xCE\x93"},      {"Delta", "\xCE\x94"},
        {"Theta", "\xCE\x98"},      {"Lambda", "\xCE\x9B"},     {"Xi", "\xCE\x9E"},
        {"Pi", "\xCE\xA0"},         {"Sigma", "\xCE\xA3"},      {"Phi", "\xCE\xA6"},
        {"Psi", "\xCE\xA8"},        {"Omega", "\xCE\xA9"},

        {"times", "\xC3\x97"},      {"div", "\xC3\xB7"},        {"cdot", "\xC2\xB7"},
        {"pm", "\xC2\xB1"},         {"mp", "\xE2\x88\x93"},     {"le", "\xE2\x89\xA4"},
        {"leq", "\xE2\x89\xA4"},    {"ge", "\xE2\x89\xA5"},     {"geq", "\xE2\x89\xA5"},
        {"ne", "\xE2\x89\xA0"},     {"neq", "\xE2\x89\xA0"},    {"approx", "\xE2\x89\x88"},
        {"equiv", "\xE2\x89\xA1"},  {"sim", "\xE2\x88\xBC"},    {"propto", "\xE2\x88\x9D"},
        {"infty", "\xE2\x88\x9E"},  {"partial", "\xE2\x88\x82"}, {"nabla", "\xE2\x88\x87"},
        {"forall", "\xE2\x88\x80"}, {"exists", "\xE2\x88\x83"}, {"in", "\xE2\x88\x88"},
        {"notin", "\xE2\x88\x89"},  {"subset", "\xE2\x8A\x82"}, {"supset", "\xE2\x8A\x83"},
        {"subseteq", "\xE2\x8A\x86"}, {"cup", "\xE2\x88\xAA"},  {"cap", "\xE2\x88\xA9"},
        {"emptyset", "\xE2\x88\x85"}, {"land", "\xE2\x88\xA7"}, {"lor", "\xE2\x88\xA8"},
        {"neg", "\xC2\xAC"},        {"to", "\xE2\x86\x92"},     {"rightarrow", "\xE2\x86\x92"},
        {"leftarrow", "\xE2\x86\x90"}, {"Rightarrow", "\xE2\x87\x92"}, {"Leftarrow", "\xE2\x87\x90"},
        {"sum", "\xE2\x88\x91"},    {"prod", "\xE2\x88\x8F"},   {"int", "\xE2\x88\xAB"},
        {"ldots", "\xE2\x80\xA6"},  {"cdots", "\xE2\x8B\xAF"},  {"circ", "\xC2\xB0"},
        {"quad", "  "},             {"qquad", "    "},

        {"sin", "sin"},             {"cos", "cos"},             {"tan", "tan"},
        {"log", "log"},             {"ln", "ln"},               {"exp", "exp"},
        {"lim", "lim"},             {"max", "max"},             {"min", "min"},

        {"left", ""},               {"right", ""},
    };
    return symbols;
}

std::string_view superscriptOf(char ch)
{
    switch (ch)
    {
    case '0': return "\xE2\x81\xB0";
    case '1': return "\xC2\xB9";
    case '2': return "\xC2\xB2";
    case '3': return "\xC2\xB3";
    case '4': return "\xE2\x81\xB4";
    case '5': return "\xE2\x81\xB5";
    case '6': return "\xE2\x81\xB6";
    case '7': return "\xE2\x81\xB7";
    case '8': return "\xE2\x81\xB8";
    case '9': return "\xE2\x81\xB9";
    case '+': return "\xE2\x81\xBA";
    case '-': return "\xE2\x81\xBB";
    case '=': return "\xE2\x81\xBC";
    case '(': return "\xE2\x81\xBD";
    case ')': return "\xE2\x81\xBE";
    case 'i': return "\xE2\x81\xB1";
    case 'n': return "\xE2\x81\xBF";
    default: return {};
    }
}

std::string_view subscriptOf(char ch)
{
    switch (ch)
    {
    case '0': return "\xE2\x82\x80";
    case '1': return "\xE2\x82\x81";
    case '2': return "\xE2\x82\x82";
    case '3': return "\xE2\x82\x83";
    case '4': return "\xE2\x82\x84";
    case '5': return "\xE2\x82\x85";
    case '6': return "\xE2\x82\x86";
    case '7': return "\xE2\x82\x87";
    case '8': return "\xE2\x82\x88";
    case '9': return "\xE2\x82\x89";
    case '+': return "\xE2\x82\x8A";
    case '-': return "\xE2\x82\x8B";
    case '=': return "\xE2\x82\x8C";
    case '(': return "\xE2\x82\x8D";
    case ')': return "\xE2\x82\x8E";
    case 'a': return "\xE2\x82\x90";
    case 'e': return "\xE2\x82\x91";
    case 'i': return "\xE1\xB5\xA2";
    case 'j': return "\xE2\xB1\xBC";
    case 'n': return "\xE2\x82\x99";
    case 'x': return "\xE2\x82\x93";
    default: return {};
    }
}

// Falls back to ^(...) or _(...) when a character has no script form.
std::string toScript(const std::string &text, bool superscript)
{
    std::string result;
    for (char ch : text)
    {
        std::string_view mapped = superscript ? superscriptOf(ch) : subscriptOf(ch);
        if (mapped.empty())
            return std::string(superscript ? "^" : "_") + (text.size() == 1 ? text : "(" + text + ")");
        result += mapped;
    }
    return result;
}

// A {group} or a single character starting at pos.
std::string_view takeArgument(std::string_view text, std::size_t &pos)
{
    while (pos < text.size() && isSpaceChar(text[pos]))
        ++pos;
    if (pos >= text.size())
        return {};
    if (text[pos] != '{')
        return text.substr(pos++, 1);

    int depth = 0;
    std::size_t start = pos + 1;
    for (std::size_t i = pos; i < text.size(); ++i)
    {
        if (text[i] == '{')
        {
            ++depth;
        }
        else if (text[i] == '}' && --depth == 0)
        {
            pos = i + 1;
            return text.substr(start, i - start);
        }
    }
    pos = text.size();
    return text.substr(start);
}

bool isShortOperand(const std::string &text)
{
    return text.size() <= 3 && text.find(' ') == std::string::npos;
}

} // namespace

std::string UnicodeMathRenderer::render(std::string_view formula)
{
    std::string key(formula);
    auto it = cache.find(key);
    if (it != cache.end())
        return it->second;
    std::string rendered = toUnicode(formula);
    cache.emplace(std::move(key), rendered);
    return rendered;
}

std::string UnicodeMathRenderer::toUnicode(std::string_view formula)
{
    std::string result;
    std::size_t pos = 0;
    while (pos < formula.size())
    {
        char ch = formula[pos];
        if (ch == '\\')
        {
            std::size_t nameStart = pos + 1;
            std::size_t nameEnd = nameStart;
            while (nameEnd < formula.size() && std::isalpha(static_cast<unsigned char>(formula[nameEnd])))
                ++nameEnd;
            if (nameEnd == nameStart)
            {
                // \, \; \{ and friends
                if (nameStart < formula.size())
                {
                    char escaped = formula[nameStart];
                    if (escaped == '{' || escaped == '}' || escaped == '$' || escaped == '%' || escaped == '_')
                        result.push_back(escaped);
                    else if (escaped == ',' || escaped == ';' || escaped == ':')
                        result.push_back(' ');
                }
                pos = nameStart + 1;
                continue;
            }

            std::string_view name = formula.substr(nameStart, nameEnd - nameStart);
            pos = nameEnd;
            if (name == "frac" || name == "dfrac" || name == "tfrac")
            {
                std::string numerator = toUnicode(takeArgument(formula, pos));
                std::string denominator = toUnicode(takeArgument(formula, pos));
                if (isShortOperand(numerator) && isShortOperand(denominator))
                    result += numerator + "/" + denominator;
                else
                    result += "(" + numerator + ")/(" + denominator + ")";
                continue;
            }
            if (name == "sqrt")
            {
                result += "\xE2\x88\x9A(" + toUnicode(takeArgument(formula, pos)) + ")";
                continue;
            }
            if (name == "text" || name == "mathrm" || name == "mathbf" || name == "mathit" || name == "operatorname")
            {
                result += takeArgument(formula, pos);
                continue;
            }
            auto symbol = commandSymbols().find(name);
            if (symbol != commandSymbols().end())
                result += symbol->second;
            continue;
        }

        if (ch == '^' || ch == '_')
        {
            ++pos;
            result += toScript(toUnicode(takeArgument(formula, pos)), ch == '^');
            continue;
        }
        if (ch == '{')
        {
            result += toUnicode(takeArgument(formula, pos));
            continue;
        }
        if (ch == '}')
        {
            ++pos;
            continue;
        }
        result.push_back(ch);
        ++pos;
    }
    return result;
}

} // namespace mk::edit
