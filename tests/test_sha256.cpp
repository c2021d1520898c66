#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace centy {

TEST(Sha256Test, KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";
    EXPECT_EQ(Sha256Hex(testutil::ToBytes("abc")), expected);
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex({}), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const auto bytes = testutil::ToBytes("The quick brown fox jumps over the lazy dog");
    Sha256Hasher hasher;
    const std::span<const std::uint8_t> all(bytes);
    hasher.Update(all.first(10));
    hasher.Update(all.subspan(10));
    EXPECT_EQ(hasher.FinalHex(), Sha256Hex(bytes));
    EXPECT_EQ(Sha256Hex(bytes), "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

} // namespace centy
