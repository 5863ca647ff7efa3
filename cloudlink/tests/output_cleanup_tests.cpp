#include <string>

#include <gtest/gtest.h>

#include "io/output_cleanup.hpp"

using namespace cloudlink::io;

TEST(OutputCleanup, PlainOutputIsTrimmed)
{
    EXPECT_EQ(cleanCommandOutput("  hello\r\n"), "hello");
    EXPECT_EQ(cleanCommandErrors("\nboom \n"), "boom");
}

TEST(OutputCleanup, ClixmlOutputKeepsFirstString)
{
    const std::string raw =
        "#< CLIXML\n"
        "<Objs Version=\"1.1.0.1\"><S S=\"Output\">C:\\Data_x000D__x000A_</S><S>second</S></Objs>";
    EXPECT_EQ(cleanCommandOutput(raw), "C:\\Data");
}

TEST(OutputCleanup, ClixmlOutputWithErrorIsDropped)
{
    const std::string raw = "#< CLIXML\n<Objs><S S=\"Error\">bad thing</S></Objs>";
    EXPECT_EQ(cleanCommandOutput(raw), "");
}

TEST(OutputCleanup, ClixmlErrorsDropPositionLines)
{
    const std::string raw =
        "#< CLIXML\n"
        "<Objs Version=\"1.1.0.1\">"
        "<S S=\"Error\">Access is denied._x000D__x000A_</S>"
        "<S S=\"Error\">At line:1 char:1_x000D__x000A_</S>"
        "<S S=\"Error\">+ Move-Item a b_x000D__x000A_</S>"
        "<S S=\"Error\">Second problem_x000D__x000A_</S>"
        "<S S=\"Progress\">ignored</S>"
        "</Objs>";
    EXPECT_EQ(cleanCommandErrors(raw), "Access is denied.\nSecond problem");
}

TEST(OutputCleanup, DecodesOnlyAsciiEscapes)
{
    EXPECT_EQ(decodeClixmlEscapes("a_x0041_b"), "aAb");
    EXPECT_EQ(decodeClixmlEscapes("_x00E9_"), "_x00E9_");
    EXPECT_EQ(decodeClixmlEscapes("line_x000D__x000A_"), "line\n");
    EXPECT_EQ(decodeClixmlEscapes("_xZZZZ_"), "_xZZZZ_");
}
