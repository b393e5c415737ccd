#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/types.hpp>
#include <set>

TEST(Base64, EncodeKnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(Base64, DecodeKnownVectors) {
    EXPECT_EQ(base64_decode("Zg=="), std::optional<std::string>("f"));
    EXPECT_EQ(base64_decode("Zm9vYmFy"), std::optional<std::string>("foobar"));
    EXPECT_EQ(base64_decode(""), std::optional<std::string>(""));
}

TEST(Base64, BinarySafe) {
    std::string bytes;
    for (int i = 0; i < 256; ++i) bytes.push_back(static_cast<char>(i));
    EXPECT_EQ(base64_decode(base64_encode(bytes)), std::optional<std::string>(bytes));
}

TEST(Base64, SkipsWhitespace) {
    EXPECT_EQ(base64_decode("Zm9v\nYmFy\r\n"), std::optional<std::string>("foobar"));
}

TEST(Base64, RejectsGarbage) {
    EXPECT_FALSE(base64_decode("Zm9v!").has_value());
    EXPECT_FALSE(base64_decode("Zg=").has_value());
    EXPECT_FALSE(base64_decode("Z===").has_value());
    EXPECT_FALSE(base64_decode("Zg==Zg==").has_value());
    EXPECT_FALSE(base64_decode("Zm9-").has_value());
    EXPECT_FALSE(base64_decode("Z=g=").has_value());
}

TEST(Base64, PaddingIsNotDecodedAsData) {
    EXPECT_EQ(base64_decode("Zm8="), std::optional<std::string>("fo"));
    EXPECT_EQ(base64_decode("Zm8=")->size(), 2u);
}

TEST(Utils, RandomIdsAreHexAndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = random_hex_id();
        EXPECT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("2222"), 2222);
    EXPECT_EQ(safe_stoi("abc", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}

TEST(ErrorKind, WireNamesAreDistinct) {
    std::set<std::string> names;
    for (ErrorKind kind : {ErrorKind::SessionNotFound, ErrorKind::SessionClosed,
                           ErrorKind::ResourceExhausted, ErrorKind::ConnectTimeout,
                           ErrorKind::PoolExhausted, ErrorKind::CircuitOpen,
                           ErrorKind::AuthenticationFailed, ErrorKind::ProtocolError,
                           ErrorKind::IOError, ErrorKind::ConfigError}) {
        names.insert(error_kind_name(kind));
    }
    EXPECT_EQ(names.size(), 10u);
    EXPECT_STREQ(error_kind_name(ErrorKind::CircuitOpen), "CircuitOpen");
}

TEST(Target, IdentityAndHash) {
    Target a{"build", 22, "ci"};
    Target b{"build", 22, "ci"};
    Target c{"build", 2222, "ci"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(TargetHash()(a), TargetHash()(b));
    EXPECT_EQ(a.to_string(), "ci@build:22");
}

TEST(Geometry, Validity) {
    EXPECT_TRUE((Geometry{24, 80}).valid());
    EXPECT_FALSE((Geometry{0, 80}).valid());
    EXPECT_FALSE((Geometry{24, -1}).valid());
    EXPECT_FALSE((Geometry{5000, 80}).valid());
}
