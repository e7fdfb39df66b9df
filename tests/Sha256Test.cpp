// FirebaseAdmin headers
#include <FirebaseAdmin/Auth/Hash/Sha256.hpp>

// GTest headers
#include <gtest/gtest.h>

namespace FirebaseAdmin::test {

  using FirebaseAdmin::Auth::Hash::Sha256;

  TEST(Sha256Test, AcceptsRoundsAtBothBounds) {
    EXPECT_EQ(Sha256::create(1).rounds(), 1);
    EXPECT_EQ(Sha256::create(8192).rounds(), 8192);
  }

  TEST(Sha256Test, RejectsRoundsOutsideBounds) {
    EXPECT_THROW(Sha256::create(0), std::invalid_argument);
    EXPECT_THROW(Sha256::create(-5), std::invalid_argument);
    EXPECT_THROW(Sha256::create(8193), std::invalid_argument);
  }

  TEST(Sha256Test, OptionsNameTheAlgorithmAndRounds) {
    Sha256 hash = Sha256::create(100);

    EXPECT_EQ(hash.algorithmName(), "SHA256");
    EXPECT_EQ(hash.getOptions(), nlohmann::json({ { "hashAlgorithm", "SHA256" }, { "rounds", 100 } }));
  }

} // namespace FirebaseAdmin::test
