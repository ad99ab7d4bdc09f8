#include <array>

#include <gtest/gtest.h>

#include "spanwire/cli/options.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const std::array<spanwire::cli::OptionSpec, 4> specs = {{
        {spanwire::cli::OptionId::TraceId, spanwire::cli::OptionType::String, "trace-id", 't'},
        {spanwire::cli::OptionId::Output, spanwire::cli::OptionType::String, "output", 'o'},
        {spanwire::cli::OptionId::Duration, spanwire::cli::OptionType::U64, "duration", 'd'},
        {spanwire::cli::OptionId::Verbose, spanwire::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"--verbose", "--trace-id", "86154a4ba6e91385", "-o", "out.json", "extra", "-d"};
    const spanwire::cli::CliArgs args{argv, 7};

    spanwire::cli::ParsedOption buf[8]{};
    spanwire::cli::ParsedOptions out{buf, 0, 8};
    spanwire::cli::u32 consumed = 0;
    const spanwire::core::Status s = spanwire::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, spanwire::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, spanwire::cli::OptionId::Verbose);
    EXPECT_EQ(out.data[0].type, spanwire::cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, spanwire::cli::OptionId::TraceId);
    EXPECT_STREQ(out.data[1].value.str, "86154a4ba6e91385");

    EXPECT_EQ(out.data[2].id, spanwire::cli::OptionId::Output);
    EXPECT_STREQ(out.data[2].value.str, "out.json");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<spanwire::cli::OptionSpec, 2> specs = {{
        {spanwire::cli::OptionId::Name, spanwire::cli::OptionType::String, "name", 'n'},
        {spanwire::cli::OptionId::Duration, spanwire::cli::OptionType::U64, "duration", 'd'},
    }};

    const char* argv[] = {"--name=get /api", "-d207000", "--duration=0"};
    const spanwire::cli::CliArgs args{argv, 3};

    spanwire::cli::ParsedOption buf[8]{};
    spanwire::cli::ParsedOptions out{buf, 0, 8};
    spanwire::cli::u32 consumed = 0;
    const spanwire::core::Status s = spanwire::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, spanwire::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 3u);
    EXPECT_STREQ(out.data[0].value.str, "get /api");
    EXPECT_EQ(out.data[1].value.u64v, 207000u);
    EXPECT_EQ(out.data[2].value.u64v, 0u);
}

TEST(CliOptions, RepeatedOptionsKeepCommandLineOrder) {
    const std::array<spanwire::cli::OptionSpec, 1> specs = {{
        {spanwire::cli::OptionId::Tag, spanwire::cli::OptionType::String, "tag", 'g'},
    }};

    const char* argv[] = {"-g", "a=1", "--tag", "b=2", "-gc=3"};
    spanwire::cli::ParsedOption buf[4]{};
    spanwire::cli::ParsedOptions out{buf, 0, 4};
    spanwire::cli::u32 consumed = 0;
    const spanwire::core::Status s = spanwire::cli::parse_options({argv, 5}, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, spanwire::core::StatusCode::Ok);
    ASSERT_EQ(out.len, 3u);
    EXPECT_STREQ(out.data[0].value.str, "a=1");
    EXPECT_STREQ(out.data[1].value.str, "b=2");
    EXPECT_STREQ(out.data[2].value.str, "c=3");
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<spanwire::cli::OptionSpec, 2> specs = {{
        {spanwire::cli::OptionId::Name, spanwire::cli::OptionType::String, "name", 'n'},
        {spanwire::cli::OptionId::Verbose, spanwire::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"--name", "1", "--", "--verbose"};
    const spanwire::cli::CliArgs args{argv, 4};

    spanwire::cli::ParsedOption buf[8]{};
    spanwire::cli::ParsedOptions out{buf, 0, 8};
    spanwire::cli::u32 consumed = 0;
    const spanwire::core::Status s = spanwire::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, spanwire::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "1");
}

TEST(CliOptions, InvalidInputs) {
    const std::array<spanwire::cli::OptionSpec, 3> specs = {{
        {spanwire::cli::OptionId::Name, spanwire::cli::OptionType::String, "name", 'n'},
        {spanwire::cli::OptionId::Timestamp, spanwire::cli::OptionType::U64, "timestamp", '\0'},
        {spanwire::cli::OptionId::Debug, spanwire::cli::OptionType::Flag, "debug", '\0'},
    }};

    const auto parse = [&](const char* const* argv, spanwire::cli::u32 argc) {
        spanwire::cli::ParsedOption buf[2]{};
        spanwire::cli::ParsedOptions out{buf, 0, 2};
        spanwire::cli::u32 consumed = 0;
        return spanwire::cli::parse_options({argv, argc}, specs.data(), specs.size(), &out, &consumed);
    };

    {
        const char* argv[] = {"--nope"};
        EXPECT_EQ(parse(argv, 1).code, spanwire::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--name"};
        EXPECT_EQ(parse(argv, 1).code, spanwire::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--timestamp", "-5"};
        EXPECT_EQ(parse(argv, 2).code, spanwire::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--timestamp=12x"};
        EXPECT_EQ(parse(argv, 1).code, spanwire::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--timestamp", "18446744073709551616"};
        EXPECT_EQ(parse(argv, 2).code, spanwire::core::StatusCode::Invalid);
    }
    {
        const char* argv[] = {"--debug=yes"};
        const spanwire::core::Status s = parse(argv, 1);
        EXPECT_EQ(s.code, spanwire::core::StatusCode::Invalid);
        EXPECT_EQ(s.domain, spanwire::core::StatusDomain::Cli);
    }
    {
        const char* argv[] = {"--name", "a", "--name", "b", "--name", "c"};
        EXPECT_EQ(parse(argv, 6).code, spanwire::core::StatusCode::Invalid);
    }
}
