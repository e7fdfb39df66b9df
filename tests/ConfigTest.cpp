// FirebaseAdmin headers
#include <FirebaseAdmin/Config.hpp>

// GTest headers
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace FirebaseAdmin::test {

  class FirebaseOptionsTest : public ::testing::Test {
  protected:
    void SetUp() override { clearEnvironment(); }

    void TearDown() override {
      clearEnvironment();
      if (!configFile.empty()) {
        std::filesystem::remove(configFile);
      }
    }

    static void clearEnvironment() {
      for (const char* name : { "GOOGLE_CLOUD_PROJECT", "GCLOUD_PROJECT", "FIREBASE_CONFIG", "FIREBASE_ACCESS_TOKEN",
                                "GOOGLE_OAUTH_ACCESS_TOKEN", "FIREBASE_HTTP_CONNECT_TIMEOUT_MS",
                                "FIREBASE_HTTP_READ_TIMEOUT_MS", "FIREBASE_CA_BUNDLE" }) {
        unsetenv(name);
      }
    }

    std::filesystem::path writeConfigFile(const std::string& contents) {
      configFile = std::filesystem::temp_directory_path() / "firebase_admin_config_test.json";
      std::ofstream out(configFile);
      out << contents;
      return configFile;
    }

    std::filesystem::path configFile;
  };

  TEST_F(FirebaseOptionsTest, EmptyEnvironmentGivesEmptyOptions) {
    FirebaseOptions options = FirebaseOptions::fromEnvironment();

    EXPECT_EQ(options.projectId, "");
    EXPECT_EQ(options.credentials, nullptr);
    EXPECT_EQ(options.connectTimeout.count(), 0);
    EXPECT_EQ(options.readTimeout.count(), 0);
    EXPECT_TRUE(options.caBundlePath.empty());
  }

  TEST_F(FirebaseOptionsTest, GoogleCloudProjectTakesPrecedence) {
    setenv("GOOGLE_CLOUD_PROJECT", "from-google-cloud-project", 1);
    setenv("GCLOUD_PROJECT", "from-gcloud-project", 1);
    setenv("FIREBASE_CONFIG", R"({"projectId": "from-firebase-config"})", 1);

    EXPECT_EQ(FirebaseOptions::fromEnvironment().projectId, "from-google-cloud-project");

    unsetenv("GOOGLE_CLOUD_PROJECT");
    EXPECT_EQ(FirebaseOptions::fromEnvironment().projectId, "from-gcloud-project");

    unsetenv("GCLOUD_PROJECT");
    EXPECT_EQ(FirebaseOptions::fromEnvironment().projectId, "from-firebase-config");
  }

  TEST_F(FirebaseOptionsTest, ReadsProjectIdFromConfigFile) {
    setenv("FIREBASE_CONFIG", writeConfigFile(R"({"projectId": "file-project", "storageBucket": "b"})").c_str(), 1);

    EXPECT_EQ(FirebaseOptions::fromEnvironment().projectId, "file-project");
  }

  TEST_F(FirebaseOptionsTest, MalformedOrMissingConfigFileIsAnError) {
    setenv("FIREBASE_CONFIG", writeConfigFile("{\"projectId\": ").c_str(), 1);
    EXPECT_THROW(FirebaseOptions::fromEnvironment(), std::invalid_argument);

    setenv("FIREBASE_CONFIG", "/nonexistent/firebase_config.json", 1);
    EXPECT_THROW(FirebaseOptions::fromEnvironment(), std::invalid_argument);

    setenv("FIREBASE_CONFIG", "{\"projectId\": ", 1);
    EXPECT_THROW(FirebaseOptions::fromEnvironment(), std::invalid_argument);
  }

  TEST_F(FirebaseOptionsTest, ReadsAccessToken) {
    setenv("GOOGLE_OAUTH_ACCESS_TOKEN", "ya29.fallback", 1);
    FirebaseOptions fallback = FirebaseOptions::fromEnvironment();
    ASSERT_NE(fallback.credentials, nullptr);
    EXPECT_EQ(fallback.credentials->getAccessToken(), "ya29.fallback");

    setenv("FIREBASE_ACCESS_TOKEN", "ya29.primary", 1);
    FirebaseOptions primary = FirebaseOptions::fromEnvironment();
    ASSERT_NE(primary.credentials, nullptr);
    EXPECT_EQ(primary.credentials->getAccessToken(), "ya29.primary");
  }

  TEST_F(FirebaseOptionsTest, ReadsTimeouts) {
    setenv("FIREBASE_HTTP_CONNECT_TIMEOUT_MS", "2500", 1);
    setenv("FIREBASE_HTTP_READ_TIMEOUT_MS", "10000", 1);

    FirebaseOptions options = FirebaseOptions::fromEnvironment();

    EXPECT_EQ(options.connectTimeout.count(), 2500);
    EXPECT_EQ(options.readTimeout.count(), 10000);
  }

  TEST_F(FirebaseOptionsTest, RejectsInvalidTimeouts) {
    for (const char* value : { "soon", "-1", "10s", " 5", "+5", "\t5" }) {
      setenv("FIREBASE_HTTP_READ_TIMEOUT_MS", value, 1);
      EXPECT_THROW(FirebaseOptions::fromEnvironment(), std::invalid_argument) << "value: " << value;
    }
  }

  TEST(StaticCredentialsTest, RejectsEmptyToken) {
    EXPECT_THROW(Auth::StaticCredentials(""), std::invalid_argument);
    EXPECT_EQ(Auth::StaticCredentials("ya29.token").getAccessToken(), "ya29.token");
  }

} // namespace FirebaseAdmin::test
