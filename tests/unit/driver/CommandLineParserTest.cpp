#include <gtest/gtest.h>

#include <iterator>

#include "command_line.hpp"

namespace
{
    TEST(CommandLineParserTest, ParsesParameterEqualsForm)
    {
        const char* argv[] = {
            "vetter-check",
            "--param=present_name:non-empty-string",
            "present_name=Teddy Bear"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->parameters.size(), 1u);
        EXPECT_EQ(options->parameters.front().name, "present_name");
        EXPECT_EQ(options->parameters.front().typeName, "non-empty-string");
        EXPECT_FALSE(options->parameters.front().optional);
        EXPECT_FALSE(options->parameters.front().defaultLiteral.has_value());
        ASSERT_EQ(options->arguments.size(), 1u);
        EXPECT_EQ(options->arguments.front(), "present_name=Teddy Bear");
    }

    TEST(CommandLineParserTest, ParsesParameterSeparateArgument)
    {
        const char* argv[] = {
            "vetter-check",
            "--param",
            "qty:positive-integer:default=1"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->parameters.size(), 1u);
        EXPECT_EQ(options->parameters.front().name, "qty");
        EXPECT_TRUE(options->parameters.front().optional);
        ASSERT_TRUE(options->parameters.front().defaultLiteral.has_value());
        EXPECT_EQ(*options->parameters.front().defaultLiteral, "1");
    }

    TEST(CommandLineParserTest, DefaultLiteralMayContainColons)
    {
        const char* argv[] = {
            "vetter-check",
            "--param=start:string:optional:default=12:30"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->parameters.size(), 1u);
        EXPECT_TRUE(options->parameters.front().optional);
        EXPECT_EQ(*options->parameters.front().defaultLiteral, "12:30");
    }

    TEST(CommandLineParserTest, ExplicitRequiredKeepsDefaultOnRequiredParameter)
    {
        const char* argv[] = {
            "vetter-check",
            "--param=qty:integer:required:default=1"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_FALSE(options->parameters.front().optional);
        EXPECT_TRUE(options->parameters.front().defaultLiteral.has_value());
    }

    TEST(CommandLineParserTest, MissingParameterValueFails)
    {
        const char* argv[] = {
            "vetter-check",
            "--param"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, MalformedParameterFails)
    {
        const char* missingType[] = {"vetter-check", "--param=qty"};
        const char* emptyType[] = {"vetter-check", "--param=qty:"};
        const char* unknownFlag[] = {"vetter-check", "--param=qty:integer:sometimes"};

        vetter::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(missingType)), const_cast<char**>(missingType)).has_value());
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(emptyType)), const_cast<char**>(emptyType)).has_value());
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(unknownFlag)), const_cast<char**>(unknownFlag)).has_value());
    }

    TEST(CommandLineParserTest, ParsesModesAndFlags)
    {
        const char* argv[] = {
            "vetter-check",
            "--mode=positional",
            "--output=list",
            "--no-strict",
            "--extra-type=integer",
            "--name=gift",
            "--dump-plan",
            "--show-descriptor-hash",
            "Kite"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->sourceMode, "positional");
        EXPECT_EQ(options->outputMode, "list");
        EXPECT_FALSE(options->strict);
        ASSERT_TRUE(options->extraType.has_value());
        EXPECT_EQ(*options->extraType, "integer");
        EXPECT_EQ(options->validatorName, "gift");
        EXPECT_TRUE(options->dumpPlan);
        EXPECT_TRUE(options->showDescriptorHash);
        ASSERT_EQ(options->arguments.size(), 1u);
        EXPECT_EQ(options->arguments.front(), "Kite");
    }

    TEST(CommandLineParserTest, UnknownModeFails)
    {
        const char* badMode[] = {"vetter-check", "--mode=keyword"};
        const char* badOutput[] = {"vetter-check", "--output=tuple"};

        vetter::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(badMode)), const_cast<char**>(badMode)).has_value());
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(badOutput)), const_cast<char**>(badOutput)).has_value());
    }

    TEST(CommandLineParserTest, UnknownOptionFails)
    {
        const char* argv[] = {
            "vetter-check",
            "--colour"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, NegativeNumbersAreArguments)
    {
        const char* argv[] = {
            "vetter-check",
            "--mode=positional",
            "-4",
            "-0.5"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->arguments.size(), 2u);
        EXPECT_EQ(options->arguments[0], "-4");
        EXPECT_EQ(options->arguments[1], "-0.5");
    }

    TEST(CommandLineParserTest, DoubleDashEndsOptions)
    {
        const char* argv[] = {
            "vetter-check",
            "--",
            "--dump-plan",
            "x=1"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_FALSE(options->dumpPlan);
        ASSERT_EQ(options->arguments.size(), 2u);
        EXPECT_EQ(options->arguments[0], "--dump-plan");
    }

    TEST(CommandLineParserTest, ParsesHelpFlag)
    {
        const char* argv[] = {
            "vetter-check",
            "--help"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->showHelp);
    }

    TEST(CommandLineParserTest, ParsesVersionFlag)
    {
        const char* argv[] = {
            "vetter-check",
            "--version"
        };

        vetter::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->showVersion);
    }
} // namespace
