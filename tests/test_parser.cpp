#include <gtest/gtest.h>
#include "savename/parser.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace savename;

// ============================================================================
// Successful parses
// ============================================================================

TEST(ParserTest, FormatOfParseIsIdentity) {
    const char* names[] = {
        "user1.dat",
        "user2_1.0.28891.dat",
        "user2.dat.bak123",
        "user2.dat.bak",
        "user1.dat.dat",
        "__pin__useraaa_bbb-ccc.ddd_1.0.28891.dat.bak123",
        "__aa-bb_cc.dd__useraaa_bbb-ccc.ddd_1.2.3.28891.dat.bak123",
    };

    for (const char* name : names) {
        auto result = parse(name);
        ASSERT_TRUE(result.ok()) << name << ": " << result.failure().describe();
        EXPECT_EQ(format(result.value()), name);
    }
}

TEST(ParserTest, AllFields) {
    auto result = parse("__pin__user4_1.0.28650.dat.bak13");
    ASSERT_TRUE(result);

    const auto& name = result.value();
    EXPECT_EQ(name.internalTag(), "pin");
    EXPECT_EQ(name.tag(), "4");
    EXPECT_EQ(name.version(), "1.0.28650");
    EXPECT_EQ(name.backupId(), "13");
}

TEST(ParserTest, TagAbsorbsEarlierSuffix) {
    auto result = parse("user1.dat.dat");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().tag(), "1.dat");
    EXPECT_FALSE(result.value().hasVersion());
    EXPECT_FALSE(result.value().isBackup());
}

TEST(ParserTest, BackupStatesStayDistinct) {
    auto backup = parse("user2.dat.bak");
    auto plain = parse("user2.dat");
    ASSERT_TRUE(backup);
    ASSERT_TRUE(plain);

    EXPECT_EQ(backup.value().backupId(), std::optional<std::string>(""));
    EXPECT_FALSE(plain.value().backupId().has_value());
    EXPECT_NE(backup.value(), plain.value());
}

TEST(ParserTest, VersionSchemes) {
    auto current = parse("user1_1.0.28891.dat");
    ASSERT_TRUE(current);
    EXPECT_EQ(current.value().version(), "1.0.28891");
    EXPECT_FALSE(current.value().isLegacyVersion());

    auto legacy = parse("user1_1.2.3.28891.dat");
    ASSERT_TRUE(legacy);
    EXPECT_EQ(legacy.value().version(), "1.2.3.28891");
    EXPECT_TRUE(legacy.value().isLegacyVersion());
}

TEST(ParserTest, FirstSplitWins) {
    auto result = parse("user2_1.dat");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().tag(), "2");
    EXPECT_EQ(result.value().version(), "1");
}

TEST(ParserTest, UnderscoreWithoutVersionBelongsToTag) {
    auto result = parse("user1_.dat");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().tag(), "1_");
    EXPECT_FALSE(result.value().hasVersion());
}

TEST(ParserTest, ParseOfFormatIsIdentity) {
    const SaveName names[] = {
        SaveName("1"),
        SaveName("4", "1.0.28650", "13", "pin"),
        SaveName("2", std::nullopt, ""),
        SaveName("a-b_c__d.e", "1.2.3.28891", "7"),
        SaveName("Test", std::nullopt, std::nullopt, "_"),
    };

    for (const auto& name : names) {
        auto result = parse(format(name));
        ASSERT_TRUE(result) << name;
        EXPECT_EQ(result.value(), name);
    }
}

TEST(ParserTest, ToOptional) {
    EXPECT_TRUE(parse("user1.dat").toOptional().has_value());
    EXPECT_FALSE(parse("user1.txt").toOptional().has_value());
}

// ============================================================================
// Failures
// ============================================================================

TEST(ParserFailureTest, MissingSuffix) {
    auto result = parse("usersomething");
    ASSERT_FALSE(result);

    const auto& failure = result.failure();
    EXPECT_EQ(failure.expected, GrammarElement::Suffix);
    EXPECT_EQ(failure.remainder, "something");
    EXPECT_EQ(failure.position, 4u);
}

TEST(ParserFailureTest, MissingUserPrefix) {
    auto result = parse("save1.dat");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.failure().expected, GrammarElement::UserPrefix);
    EXPECT_EQ(result.failure().remainder, "save1.dat");
    EXPECT_EQ(result.failure().position, 0u);
}

TEST(ParserFailureTest, MissingUserPrefixAfterInternalTag) {
    auto result = parse("__pin__save.dat");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.failure().expected, GrammarElement::UserPrefix);
    EXPECT_EQ(result.failure().remainder, "save.dat");
    EXPECT_EQ(result.failure().position, 7u);
}

TEST(ParserFailureTest, UnclosedInternalTag) {
    auto result = parse("__pinuser1.dat");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.failure().expected, GrammarElement::InternalTagClose);
    EXPECT_EQ(result.failure().remainder, "pinuser1.dat");
    EXPECT_EQ(result.failure().position, 2u);
}

TEST(ParserFailureTest, TrailingCharactersAreRejected) {
    for (const char* name : {"user1.dat ", "user1.datx", "user1.dat.bak1x", "user1.dat.bak.bak"}) {
        auto result = parse(name);
        ASSERT_FALSE(result) << name;
        EXPECT_EQ(result.failure().expected, GrammarElement::Suffix) << name;
    }
}

TEST(ParserFailureTest, EmptyInputs) {
    EXPECT_FALSE(parse(""));
    EXPECT_FALSE(parse("user"));
    EXPECT_FALSE(parse("user.dat"));
    EXPECT_FALSE(parse(".dat"));
}

TEST(ParserFailureTest, Describe) {
    auto result = parse("usersomething");
    ASSERT_FALSE(result);
    auto text = result.failure().describe();
    EXPECT_NE(text.find("'.dat' suffix"), std::string::npos) << text;
    EXPECT_NE(text.find("offset 4"), std::string::npos) << text;
    EXPECT_NE(text.find("'something'"), std::string::npos) << text;
}

TEST(ParserFailureTest, ValueOnFailureThrows) {
    auto result = parse("nope");
    EXPECT_THROW((void)result.value(), std::bad_variant_access);
    EXPECT_THROW((void)parse("user1.dat").failure(), std::bad_variant_access);
}

// ============================================================================
// SaveNameParser
// ============================================================================

TEST(SaveNameParserTest, OptionsDoNotChangeResults) {
    ParserOptions options;
    options.logFailures = true;
    SaveNameParser parser(options);
    EXPECT_TRUE(parser.options().logFailures);

    auto good = parser.parse("user3_1.0.1.dat.bak2");
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), parse("user3_1.0.1.dat.bak2").value());

    auto bad = parser.parse("user3.sav");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.failure(), parse("user3.sav").failure());
}

TEST(SaveNameParserTest, ConcurrentParses) {
    constexpr int kThreads = 8;
    constexpr int kIterations = 500;
    std::vector<std::thread> threads;
    std::vector<int> mismatches(kThreads, 0);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &mismatches] {
            SaveNameParser parser;
            for (int i = 0; i < kIterations; ++i) {
                SaveName expected(std::to_string(t) + "-" + std::to_string(i),
                                  "1.0." + std::to_string(i),
                                  std::to_string(t));
                auto result = parser.parse(format(expected));
                if (!result || result.value() != expected) {
                    ++mismatches[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(mismatches[t], 0) << "thread " << t;
    }
}
