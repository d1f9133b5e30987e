#include <gtest/gtest.h>

#include "mk/edit/unicode_math_renderer.hpp"

using mk::edit::UnicodeMathRenderer;

TEST(UnicodeMathRenderer, MapsCommandsToSymbols)
{
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\alpha"), "\xCE\xB1");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("a \\le b"), "a \xE2\x89\xA4 b");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\sin x"), "sin x");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\unknown x"), " x");
}

TEST(UnicodeMathRenderer, WritesScriptsWithUnicodeDigits)
{
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("x^2"), "x\xC2\xB2");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("x_{10}"), "x\xE2\x82\x81\xE2\x82\x80");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("e^{ab}"), "e^(ab)");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("y_k"), "y_k");
}

TEST(UnicodeMathRenderer, FormatsFractionsAndRoots)
{
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\frac{1}{2}"), "1/2");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\frac{x + 1}{2}"), "(x + 1)/(2)");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\sqrt{x}"), "\xE2\x88\x9A(x)");
}

TEST(UnicodeMathRenderer, KeepsTextAndEscapedCharacters)
{
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\text{if} x"), "if x");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("\\{a\\}"), "{a}");
    EXPECT_EQ(UnicodeMathRenderer::toUnicode("a\\,b"), "a b");
}

TEST(UnicodeMathRenderer, CachesRenderedFormulas)
{
    UnicodeMathRenderer renderer;
    std::string first = renderer.render("\\pi r^2");
    EXPECT_EQ(first, "\xCF\x80 r\xC2\xB2");
    EXPECT_EQ(renderer.render("\\pi r^2"), first);
}
