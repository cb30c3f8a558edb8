#include <gtest/gtest.h>
#include "uuid.hpp"

namespace
{

const char *kCanonical = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

} // namespace

TEST(UuidTest, ParsesCanonicalForm)
{
    Uuid id;
    ASSERT_TRUE(Uuid::parse(kCanonical, id));
    EXPECT_EQ(id.data()[0], 0x6b);
    EXPECT_EQ(id.data()[6], 0x11);
    EXPECT_EQ(id.data()[15], 0xc8);
    EXPECT_EQ(id.to_string(), kCanonical);
}

TEST(UuidTest, AcceptsAlternateSpellings)
{
    Uuid canonical;
    ASSERT_TRUE(Uuid::parse(kCanonical, canonical));

    const char *spellings[] = {
        "6BA7B810-9DAD-11D1-80B4-00C04FD430C8",
        "{6ba7b810-9dad-11d1-80b4-00c04fd430c8}",
        "urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        "6ba7b8109dad11d180b400c04fd430c8",
    };
    for (const char *text : spellings)
    {
        Uuid id;
        ASSERT_TRUE(Uuid::parse(text, id)) << text;
        EXPECT_EQ(id, canonical) << text;
    }
}

TEST(UuidTest, RejectsMalformedText)
{
    const char *invalid[] = {
        "",
        "not-a-uuid",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c8a",
        "6ba7b810x9dad-11d1-80b4-00c04fd430c8",
        "6ba7b810-9dad-11d1-80b4-00c04fd430cg",
        "(6ba7b810-9dad-11d1-80b4-00c04fd430c8)",
        "urn:uid:6ba7b810-9dad-11d1-80b4-00c04fd430c8",
    };
    for (const char *text : invalid)
    {
        Uuid id;
        EXPECT_FALSE(Uuid::parse(text, id)) << text;
    }
}

TEST(UuidTest, DefaultIsNil)
{
    EXPECT_EQ(Uuid().to_string(), "00000000-0000-0000-0000-000000000000");
}
